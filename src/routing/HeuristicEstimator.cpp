#include "accessroute/routing/HeuristicEstimator.h"
#include "accessroute/core/GeoUtils.h"

namespace accessroute {

HeuristicEstimator::HeuristicEstimator(const WeightedGraph& weighted)
    : graph_(weighted.graph()), scale_(weighted.profile().minimumCostFactor()) {}

double HeuristicEstimator::estimate(NodeId current, NodeId target) const {
    if (!graph_.hasNode(current) || !graph_.hasNode(target)) {
        return 0.0;
    }
    const auto& nodes = graph_.nodes();
    return geo::distanceMeters(nodes[current].position, nodes[target].position) * scale_;
}

}  // namespace accessroute
