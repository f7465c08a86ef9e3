#pragma once

#include "accessroute/routing/IPathSearch.h"

namespace accessroute {
namespace search {

/// Dijkstra from both endpoints.
///
/// The side with the smaller queue top expands next. Every relaxation
/// that reaches a node labelled by the other side updates the best known
/// total (mu) and its meeting node. The search stops once
/// topForward + topBackward >= mu.
class BidirectionalSearch : public IPathSearch {
public:
    SearchResult find(const WeightedGraph& weighted,
                      NodeId origin,
                      NodeId destination,
                      SearchContext& context) const override;

    SearchStrategy strategy() const override { return SearchStrategy::Bidirectional; }
    const char* algorithmName() const override { return "Bidirectional Dijkstra"; }
};

}  // namespace search
}  // namespace accessroute
