#pragma once

#include "EdgeWeightCalculator.h"

#include <memory>
#include <optional>
#include <vector>

namespace accessroute {

/// Profile-specific view of a PathGraph.
///
/// Holds two costs per edge, one for each traversal direction. Built once
/// from an immutable graph and never mutated afterwards, so instances can
/// be shared across threads without locking.
class WeightedGraph {
public:
    /// Compute all edge costs for @p profile
    /// @throws std::invalid_argument if @p graph is null
    WeightedGraph(std::shared_ptr<const PathGraph> graph, MobilityProfile profile);

    const PathGraph& graph() const { return *graph_; }
    const std::shared_ptr<const PathGraph>& sharedGraph() const { return graph_; }
    const MobilityProfile& profile() const { return profile_; }

    /// Cost of walking @p edge away from @p fromNode.
    /// std::nullopt if the edge is excluded in that direction.
    std::optional<double> cost(EdgeId edge, NodeId fromNode) const;

    std::optional<double> forwardCost(EdgeId edge) const;
    std::optional<double> reverseCost(EdgeId edge) const;

    /// True if at least one incident edge can be walked away from the node
    /// or towards it
    bool isNodePassable(NodeId node) const;

    size_t excludedEdgeCount() const { return excludedEdges_; }

private:
    static std::optional<double> toOptional(double value);

    std::shared_ptr<const PathGraph> graph_;
    MobilityProfile profile_;
    std::vector<double> forward_;  ///< infinity marks an impassable direction
    std::vector<double> reverse_;
    size_t excludedEdges_ = 0;
};

}  // namespace accessroute
