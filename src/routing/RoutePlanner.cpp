#include "accessroute/routing/RoutePlanner.h"
#include "accessroute/core/GeoUtils.h"
#include "accessroute/common/Logger.h"

#include <stdexcept>

namespace accessroute {

namespace {

std::shared_ptr<const PathGraph> requireGraph(std::shared_ptr<const PathGraph> graph) {
    if (!graph) {
        throw std::invalid_argument("RoutePlanner requires a graph");
    }
    return graph;
}

const PlannerOptions& requireValid(const PlannerOptions& options) {
    options.validate();
    return options;
}

PlanStatus toPlanStatus(SearchStatus status) {
    switch (status) {
        case SearchStatus::Found: return PlanStatus::Ok;
        case SearchStatus::NoRoute: return PlanStatus::NoRoute;
        case SearchStatus::ExceededBound: return PlanStatus::ExceededBound;
    }
    return PlanStatus::NoRoute;
}

}  // namespace

const char* toString(PlanStatus status) {
    switch (status) {
        case PlanStatus::Ok: return "ok";
        case PlanStatus::InvalidInput: return "invalid_input";
        case PlanStatus::NoRoute: return "no_route";
        case PlanStatus::ExceededBound: return "exceeded_bound";
    }
    return "unknown";
}

RoutePlanner::RoutePlanner(std::shared_ptr<const PathGraph> graph,
                           ProfileRegistry registry,
                           PlannerOptions options)
    : graph_(requireGraph(std::move(graph))),
      registry_(std::move(registry)),
      options_(requireValid(options)),
      cache_(graph_),
      assembler_(options_.strideLengthMeters) {
    for (SearchStrategy strategy : ALL_SEARCH_STRATEGIES) {
        searches_[static_cast<size_t>(strategy)] = createPathSearch(strategy);
    }
}

std::optional<NodeId> RoutePlanner::snap(const GeoPoint& point) const {
    if (!point.isValid()) {
        return std::nullopt;
    }
    NodeId nearest = graph_->nearestNode(point);
    if (nearest == INVALID_NODE) {
        return std::nullopt;
    }
    if (geo::distanceMeters(point, graph_->getNode(nearest).position) > options_.maxSnapDistanceMeters) {
        return std::nullopt;
    }
    return nearest;
}

std::shared_ptr<const WeightedGraph> RoutePlanner::weightedGraph(const std::string& profileKey) {
    return cache_.get(registry_.get(profileKey));
}

SearchResult RoutePlanner::search(const WeightedGraph& weighted,
                                  NodeId origin,
                                  NodeId destination,
                                  SearchStrategy strategy,
                                  SearchContext& context) const {
    return searches_[static_cast<size_t>(strategy)]->find(weighted, origin, destination, context);
}

std::optional<NodeId> RoutePlanner::resolve(const RouteEndpoint& endpoint, const char* role,
                                            std::string& error) const {
    if (endpoint.node) {
        if (!graph_->hasNode(*endpoint.node)) {
            error = std::string(role) + " node " + std::to_string(*endpoint.node) + " does not exist";
            return std::nullopt;
        }
        return endpoint.node;
    }
    if (endpoint.position) {
        if (!endpoint.position->isValid()) {
            error = std::string(role) + " coordinates are out of range";
            return std::nullopt;
        }
        auto node = snap(*endpoint.position);
        if (!node) {
            error = std::string(role) + " is farther than " +
                    std::to_string(static_cast<long>(options_.maxSnapDistanceMeters)) +
                    " m from the path network";
        }
        return node;
    }
    error = std::string(role) + " is not set";
    return std::nullopt;
}

PlanOutcome RoutePlanner::plan(const RouteRequest& request) {
    PlanOutcome outcome;
    outcome.strategy = request.strategy.value_or(options_.defaultStrategy);

    const MobilityProfile* profile = registry_.find(request.profileKey);
    if (!profile) {
        outcome.message = "Unknown mobility profile: " + request.profileKey;
        LOG_WARN("{}", outcome.message);
        return outcome;
    }

    auto origin = resolve(request.origin, "Origin", outcome.message);
    if (!origin) {
        LOG_WARN("{}", outcome.message);
        return outcome;
    }
    auto destination = resolve(request.destination, "Destination", outcome.message);
    if (!destination) {
        LOG_WARN("{}", outcome.message);
        return outcome;
    }
    outcome.originNode = *origin;
    outcome.destinationNode = *destination;

    auto weighted = cache_.get(*profile);

    SearchContext context(options_.limits);
    SearchResult result = search(*weighted, *origin, *destination, outcome.strategy, context);
    outcome.status = toPlanStatus(result.status);
    outcome.nodesExplored = result.nodesExplored;

    if (!result.found()) {
        outcome.message = outcome.status == PlanStatus::NoRoute
                              ? "No accessible route for profile '" + profile->key + "'"
                              : "Search exceeded its limits";
        LOG_INFO("{} -> {} [{}]: {}", *origin, *destination, profile->key, outcome.message);
        return outcome;
    }

    outcome.route = assembler_.assemble(*graph_, *profile, result.nodePath, result.edgePath,
                                        result.totalCost);

    LOG_INFO("{} -> {} [{} / {}]: {:.1f} m, {:.1f} min, {} steps, {} nodes explored",
             *origin, *destination, profile->key, toString(outcome.strategy),
             outcome.route.distanceMeters, outcome.route.durationMinutes(),
             outcome.route.stepCount, outcome.nodesExplored);
    return outcome;
}

}  // namespace accessroute
