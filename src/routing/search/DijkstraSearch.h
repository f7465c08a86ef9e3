#pragma once

#include "accessroute/routing/IPathSearch.h"

namespace accessroute {
namespace search {

/// Forward uniform-cost search; stops when the destination is settled
class DijkstraSearch : public IPathSearch {
public:
    SearchResult find(const WeightedGraph& weighted,
                      NodeId origin,
                      NodeId destination,
                      SearchContext& context) const override;

    SearchStrategy strategy() const override { return SearchStrategy::Dijkstra; }
    const char* algorithmName() const override { return "Dijkstra"; }
};

}  // namespace search
}  // namespace accessroute
