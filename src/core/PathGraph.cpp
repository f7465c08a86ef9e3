#include "accessroute/core/PathGraph.h"
#include "accessroute/core/GeoUtils.h"
#include "accessroute/common/Logger.h"

#include <algorithm>
#include <limits>

namespace accessroute {

namespace {
const std::vector<EdgeId> NO_EDGES;

/// Coordinates closer than this are treated as the same point (meters)
constexpr double SAME_POINT_TOLERANCE_M = 0.01;
}

NodeId PathGraph::addNode(GeoPoint position, int64_t sourceId) {
    return addNode(NodeData{sourceId, position});
}

NodeId PathGraph::addNode(const NodeData& data) {
    if (!data.position.isValid()) {
        throw std::invalid_argument("Node coordinates out of range: " +
                                    std::to_string(data.position.lat) + ", " +
                                    std::to_string(data.position.lon));
    }
    if (data.sourceId != NO_SOURCE_ID && sourceIndex_.count(data.sourceId) > 0) {
        throw std::invalid_argument("Duplicate source node id: " + std::to_string(data.sourceId));
    }

    NodeId id = static_cast<NodeId>(nodes_.size());

    NodeData nodeData = data;
    nodeData.id = id;
    nodes_.push_back(nodeData);
    adjacency_.emplace_back();

    if (data.sourceId != NO_SOURCE_ID) {
        sourceIndex_[data.sourceId] = id;
    }
    bounds_.extend(data.position);
    return id;
}

bool PathGraph::hasNode(NodeId id) const {
    return id < nodes_.size();
}

const NodeData& PathGraph::getNode(NodeId id) const {
    if (!hasNode(id)) {
        throw std::out_of_range("Invalid node ID: " + std::to_string(id));
    }
    return nodes_[id];
}

std::optional<NodeData> PathGraph::tryGetNode(NodeId id) const {
    if (!hasNode(id)) {
        return std::nullopt;
    }
    return nodes_[id];
}

std::optional<NodeId> PathGraph::findBySourceId(int64_t sourceId) const {
    auto it = sourceIndex_.find(sourceId);
    if (it == sourceIndex_.end()) {
        return std::nullopt;
    }
    return it->second;
}

EdgeId PathGraph::addEdge(const EdgeData& data) {
    if (!hasNode(data.from) || !hasNode(data.to)) {
        throw std::invalid_argument("Invalid node ID in edge: " +
                                    std::to_string(data.from) + " -> " + std::to_string(data.to));
    }
    if (!(data.lengthMeters > 0.0) || data.lengthMeters == std::numeric_limits<double>::infinity()) {
        throw std::invalid_argument("Edge length must be positive and finite, got " +
                                    std::to_string(data.lengthMeters));
    }

    EdgeId id = static_cast<EdgeId>(edges_.size());

    EdgeData edgeData = data;
    edgeData.id = id;

    const GeoPoint& fromPos = nodes_[data.from].position;
    const GeoPoint& toPos = nodes_[data.to].position;

    // Orient geometry from -> to and make sure it starts and ends at the nodes
    Polyline& geometry = edgeData.geometry;
    if (geometry.empty()) {
        geometry = {fromPos, toPos};
    } else {
        if (geometry.size() > 1 &&
            geo::distanceMeters(geometry.front(), toPos) < geo::distanceMeters(geometry.front(), fromPos)) {
            std::reverse(geometry.begin(), geometry.end());
        }
        if (geo::distanceMeters(geometry.front(), fromPos) > SAME_POINT_TOLERANCE_M) {
            geometry.insert(geometry.begin(), fromPos);
        }
        if (geo::distanceMeters(geometry.back(), toPos) > SAME_POINT_TOLERANCE_M) {
            geometry.push_back(toPos);
        }
    }

    const double chord = geo::distanceMeters(fromPos, toPos);
    if (edgeData.lengthMeters < chord) {
        LOG_WARN("Edge {} declares {:.2f} m but its endpoints are {:.2f} m apart; using the chord",
                 id, edgeData.lengthMeters, chord);
        edgeData.lengthMeters = chord;
    }

    edges_.push_back(std::move(edgeData));
    adjacency_[data.from].push_back(id);
    if (data.to != data.from) {
        adjacency_[data.to].push_back(id);
    }
    return id;
}

bool PathGraph::hasEdge(EdgeId id) const {
    return id < edges_.size();
}

const EdgeData& PathGraph::getEdge(EdgeId id) const {
    if (!hasEdge(id)) {
        throw std::out_of_range("Invalid edge ID: " + std::to_string(id));
    }
    return edges_[id];
}

const std::vector<EdgeId>& PathGraph::incidentEdges(NodeId id) const {
    if (!hasNode(id)) {
        return NO_EDGES;
    }
    return adjacency_[id];
}

std::vector<NodeId> PathGraph::neighbors(NodeId id) const {
    std::vector<NodeId> result;
    for (EdgeId edgeId : incidentEdges(id)) {
        NodeId other = edges_[edgeId].otherEnd(id);
        if (std::find(result.begin(), result.end(), other) == result.end()) {
            result.push_back(other);
        }
    }
    return result;
}

std::vector<EdgeId> PathGraph::findEdges(NodeId a, NodeId b) const {
    std::vector<EdgeId> result;
    for (EdgeId edgeId : incidentEdges(a)) {
        const EdgeData& edge = edges_[edgeId];
        if ((edge.from == a && edge.to == b) || (edge.from == b && edge.to == a)) {
            result.push_back(edgeId);
        }
    }
    return result;
}

NodeId PathGraph::nearestNode(const GeoPoint& point) const {
    NodeId best = INVALID_NODE;
    double bestDistance = std::numeric_limits<double>::infinity();

    for (const auto& node : nodes_) {
        double d = geo::distanceMeters(point, node.position);
        if (d < bestDistance) {
            bestDistance = d;
            best = node.id;
        }
    }
    return best;
}

}  // namespace accessroute
