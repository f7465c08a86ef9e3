#include "accessroute/routing/WeightedGraph.h"
#include "accessroute/common/Logger.h"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace accessroute {

namespace {
constexpr double IMPASSABLE = std::numeric_limits<double>::infinity();
}

WeightedGraph::WeightedGraph(std::shared_ptr<const PathGraph> graph, MobilityProfile profile)
    : graph_(std::move(graph)), profile_(std::move(profile)) {
    if (!graph_) {
        throw std::invalid_argument("WeightedGraph requires a graph");
    }

    const auto& edges = graph_->edges();
    forward_.resize(edges.size(), IMPASSABLE);
    reverse_.resize(edges.size(), IMPASSABLE);

    for (const auto& edge : edges) {
        auto fwd = EdgeWeightCalculator::cost(edge, profile_, TraversalDirection::Forward);
        auto rev = EdgeWeightCalculator::cost(edge, profile_, TraversalDirection::Reverse);
        if (fwd) forward_[edge.id] = *fwd;
        if (rev) reverse_[edge.id] = *rev;

        if (!fwd && !rev) {
            ++excludedEdges_;
            auto kind = EdgeWeightCalculator::classifyExclusion(edge, profile_, TraversalDirection::Forward);
            LOG_TRACE("Edge {} excluded for '{}' ({})", edge.id, profile_.key,
                      kind ? toString(*kind) : "unknown");
        }
    }

    LOG_DEBUG("Weighted graph for '{}': {} edges, {} excluded",
              profile_.key, edges.size(), excludedEdges_);
}

std::optional<double> WeightedGraph::toOptional(double value) {
    if (std::isinf(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> WeightedGraph::forwardCost(EdgeId edge) const {
    if (edge >= forward_.size()) {
        return std::nullopt;
    }
    return toOptional(forward_[edge]);
}

std::optional<double> WeightedGraph::reverseCost(EdgeId edge) const {
    if (edge >= reverse_.size()) {
        return std::nullopt;
    }
    return toOptional(reverse_[edge]);
}

std::optional<double> WeightedGraph::cost(EdgeId edge, NodeId fromNode) const {
    if (edge >= forward_.size()) {
        return std::nullopt;
    }
    const EdgeData& data = graph_->edges()[edge];
    if (data.from == fromNode) {
        return toOptional(forward_[edge]);
    }
    if (data.to == fromNode) {
        return toOptional(reverse_[edge]);
    }
    return std::nullopt;
}

bool WeightedGraph::isNodePassable(NodeId node) const {
    for (EdgeId edge : graph_->incidentEdges(node)) {
        if (!std::isinf(forward_[edge]) || !std::isinf(reverse_[edge])) {
            return true;
        }
    }
    return false;
}

}  // namespace accessroute
