#include "AStarSearch.h"
#include "SearchCommon.h"
#include "accessroute/routing/HeuristicEstimator.h"

namespace accessroute {
namespace search {

SearchResult AStarSearch::find(const WeightedGraph& weighted,
                               NodeId origin,
                               NodeId destination,
                               SearchContext& context) const {
    HeuristicEstimator estimator(weighted);
    return bestFirstSearch(weighted, origin, destination, context,
                           [&estimator, destination](NodeId node) {
                               return estimator.estimate(node, destination);
                           });
}

}  // namespace search
}  // namespace accessroute
