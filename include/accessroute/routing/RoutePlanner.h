#pragma once

#include "Route.h"
#include "RouteAssembler.h"
#include "IPathSearch.h"
#include "WeightedGraphCache.h"
#include "../config/PlannerOptions.h"
#include "../profile/ProfileRegistry.h"

#include <array>
#include <memory>
#include <optional>
#include <string>

namespace accessroute {

enum class PlanStatus {
    Ok,
    InvalidInput,   ///< Unknown profile, unknown node, or coordinate too far from the network
    NoRoute,
    ExceededBound
};

const char* toString(PlanStatus status);

/// Route endpoint: either a node id or a coordinate snapped to the nearest node
struct RouteEndpoint {
    std::optional<NodeId> node;
    std::optional<GeoPoint> position;

    static RouteEndpoint atNode(NodeId id) {
        RouteEndpoint endpoint;
        endpoint.node = id;
        return endpoint;
    }

    static RouteEndpoint at(GeoPoint point) {
        RouteEndpoint endpoint;
        endpoint.position = point;
        return endpoint;
    }
};

struct RouteRequest {
    RouteEndpoint origin;
    RouteEndpoint destination;
    std::string profileKey = profiles::STANDARD;
    std::optional<SearchStrategy> strategy;  ///< Planner default when empty
};

struct PlanOutcome {
    PlanStatus status = PlanStatus::InvalidInput;
    std::string message;           ///< Human-readable reason for non-Ok outcomes
    Route route;                   ///< Valid only when status is Ok
    NodeId originNode = INVALID_NODE;
    NodeId destinationNode = INVALID_NODE;
    SearchStrategy strategy = SearchStrategy::AStar;
    size_t nodesExplored = 0;

    bool ok() const { return status == PlanStatus::Ok; }
};

/// Entry point for route queries.
///
/// Owns the shared graph, the profile registry and the per-profile
/// weighted graph cache. Input problems are reported through PlanStatus
/// rather than exceptions. plan() is safe to call from several threads.
class RoutePlanner {
public:
    /// @throws std::invalid_argument if @p graph is null
    /// @throws ConfigError if @p options are invalid
    RoutePlanner(std::shared_ptr<const PathGraph> graph,
                 ProfileRegistry registry,
                 PlannerOptions options = PlannerOptions::defaults());

    PlanOutcome plan(const RouteRequest& request);

    /// Nearest node within the snap distance
    std::optional<NodeId> snap(const GeoPoint& point) const;

    /// @throws std::out_of_range for an unknown profile key
    std::shared_ptr<const WeightedGraph> weightedGraph(const std::string& profileKey);

    /// Run one strategy on a weighted graph with a caller-provided context
    SearchResult search(const WeightedGraph& weighted,
                        NodeId origin,
                        NodeId destination,
                        SearchStrategy strategy,
                        SearchContext& context) const;

    const PathGraph& graph() const { return *graph_; }
    const std::shared_ptr<const PathGraph>& sharedGraph() const { return graph_; }
    const ProfileRegistry& profiles() const { return registry_; }
    const PlannerOptions& options() const { return options_; }
    WeightedGraphCache& cache() { return cache_; }

private:
    std::optional<NodeId> resolve(const RouteEndpoint& endpoint, const char* role,
                                  std::string& error) const;

    std::shared_ptr<const PathGraph> graph_;
    ProfileRegistry registry_;
    PlannerOptions options_;
    WeightedGraphCache cache_;
    RouteAssembler assembler_;
    std::array<std::unique_ptr<IPathSearch>, ALL_SEARCH_STRATEGIES.size()> searches_;
};

}  // namespace accessroute
