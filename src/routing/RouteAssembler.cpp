#include "accessroute/routing/RouteAssembler.h"
#include "accessroute/routing/EdgeWeightCalculator.h"

#include <cmath>
#include <stdexcept>
#include <string>

namespace accessroute {

RouteAssembler::RouteAssembler(double strideLengthMeters) : strideLength_(strideLengthMeters) {
    if (!std::isfinite(strideLengthMeters) || strideLengthMeters <= 0.0) {
        throw std::invalid_argument("Stride length must be positive");
    }
}

void RouteAssembler::appendPoint(Polyline& line, const GeoPoint& point) {
    if (line.empty() || line.back() != point) {
        line.push_back(point);
    }
}

Route RouteAssembler::assemble(const PathGraph& graph,
                               const MobilityProfile& profile,
                               const std::vector<NodeId>& nodePath,
                               const std::vector<EdgeId>& edgePath,
                               double totalCost) const {
    if (nodePath.empty()) {
        throw std::invalid_argument("Cannot assemble a route from an empty path");
    }
    if (edgePath.size() + 1 != nodePath.size()) {
        throw std::invalid_argument("Path has " + std::to_string(nodePath.size()) + " nodes but " +
                                    std::to_string(edgePath.size()) + " edges");
    }

    Route route;
    route.profileKey = profile.key;
    route.nodePath = nodePath;
    route.edgePath = edgePath;
    route.totalCost = totalCost;

    appendPoint(route.coordinates, graph.getNode(nodePath.front()).position);

    for (size_t i = 0; i < edgePath.size(); ++i) {
        const EdgeData& edge = graph.getEdge(edgePath[i]);
        const NodeId from = nodePath[i];
        const NodeId to = nodePath[i + 1];

        TraversalDirection direction;
        if (edge.from == from && edge.to == to) {
            direction = TraversalDirection::Forward;
        } else if (edge.to == from && edge.from == to) {
            direction = TraversalDirection::Reverse;
        } else {
            throw std::invalid_argument("Edge " + std::to_string(edge.id) + " does not connect nodes " +
                                        std::to_string(from) + " and " + std::to_string(to));
        }

        if (direction == TraversalDirection::Forward) {
            for (const auto& point : edge.geometry) {
                appendPoint(route.coordinates, point);
            }
        } else {
            for (auto it = edge.geometry.rbegin(); it != edge.geometry.rend(); ++it) {
                appendPoint(route.coordinates, *it);
            }
        }

        const double timeFactor =
            profile.surfaceFactor(edge.attributes.surface) *
            profile.slopeFactor(EdgeWeightCalculator::directedIncline(edge.attributes, direction));

        route.distanceMeters += edge.lengthMeters;
        route.durationSeconds += edge.lengthMeters / profile.baseSpeedMps * timeFactor;
    }

    route.stepCount = static_cast<long>(std::floor(route.distanceMeters / strideLength_));
    return route;
}

}  // namespace accessroute
