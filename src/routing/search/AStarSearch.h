#pragma once

#include "accessroute/routing/IPathSearch.h"

namespace accessroute {
namespace search {

/// A* search guided by HeuristicEstimator.
/// The estimator is admissible and consistent, so each node is settled once.
class AStarSearch : public IPathSearch {
public:
    SearchResult find(const WeightedGraph& weighted,
                      NodeId origin,
                      NodeId destination,
                      SearchContext& context) const override;

    SearchStrategy strategy() const override { return SearchStrategy::AStar; }
    const char* algorithmName() const override { return "A*"; }
};

}  // namespace search
}  // namespace accessroute
