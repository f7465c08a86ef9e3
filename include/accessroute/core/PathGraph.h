#pragma once

#include "Types.h"
#include "EdgeAttributes.h"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace accessroute {

/// Marker for nodes that were not loaded from a geodata export
constexpr int64_t NO_SOURCE_ID = -1;

struct NodeData {
    NodeId id = INVALID_NODE;
    int64_t sourceId = NO_SOURCE_ID;  ///< Identifier in the geodata export (e.g. OSM node id)
    GeoPoint position;

    NodeData() = default;
    NodeData(int64_t source, GeoPoint pos) : sourceId(source), position(pos) {}
};

struct EdgeData {
    EdgeId id = INVALID_EDGE;
    NodeId from = INVALID_NODE;
    NodeId to = INVALID_NODE;
    double lengthMeters = 0.0;
    Polyline geometry;           ///< Ordered from -> to, including both endpoints
    EdgeAttributes attributes;

    EdgeData() = default;
    EdgeData(NodeId f, NodeId t, double length) : from(f), to(t), lengthMeters(length) {}

    /// Endpoint opposite to @p node (undirected traversal)
    NodeId otherEnd(NodeId node) const { return node == from ? to : from; }
};

/// Undirected walkable path network.
///
/// Populated once by a loader, then shared read-only (typically as
/// std::shared_ptr<const PathGraph>) by every weighted view and query.
/// Parallel edges between the same node pair are kept as separate edges.
class PathGraph {
public:
    PathGraph() = default;

    // Node operations
    // @throws std::invalid_argument for out-of-range coordinates or a
    //         duplicate source id
    NodeId addNode(GeoPoint position, int64_t sourceId = NO_SOURCE_ID);
    NodeId addNode(const NodeData& data);

    bool hasNode(NodeId id) const;

    // Node access API:
    // - getNode(): Throws std::out_of_range if ID is invalid.
    // - tryGetNode(): Returns std::nullopt if ID is invalid.
    const NodeData& getNode(NodeId id) const;
    std::optional<NodeData> tryGetNode(NodeId id) const;

    /// Dense node id for a source id, if present
    std::optional<NodeId> findBySourceId(int64_t sourceId) const;

    /// Add an undirected edge.
    ///
    /// Missing geometry is replaced by the straight segment between the
    /// endpoints. A declared length shorter than the great-circle chord
    /// between the endpoints is raised to the chord.
    ///
    /// @throws std::invalid_argument if an endpoint does not exist or the
    ///         length is not strictly positive
    EdgeId addEdge(const EdgeData& data);

    bool hasEdge(EdgeId id) const;

    // Edge access API: same conventions as node access
    const EdgeData& getEdge(EdgeId id) const;

    // Queries
    size_t nodeCount() const { return nodes_.size(); }
    size_t edgeCount() const { return edges_.size(); }

    const std::vector<NodeData>& nodes() const { return nodes_; }
    const std::vector<EdgeData>& edges() const { return edges_; }

    /// Edges touching @p id, in insertion order. Empty for unknown nodes.
    const std::vector<EdgeId>& incidentEdges(NodeId id) const;

    std::vector<NodeId> neighbors(NodeId id) const;

    /// All edges connecting @p a and @p b (either orientation)
    std::vector<EdgeId> findEdges(NodeId a, NodeId b) const;

    /// Closest node to @p point by great-circle distance.
    /// Returns INVALID_NODE for an empty graph.
    NodeId nearestNode(const GeoPoint& point) const;

    const GeoBounds& bounds() const { return bounds_; }

private:
    std::vector<NodeData> nodes_;
    std::vector<EdgeData> edges_;
    std::vector<std::vector<EdgeId>> adjacency_;
    std::unordered_map<int64_t, NodeId> sourceIndex_;
    GeoBounds bounds_;
};

}  // namespace accessroute
