#pragma once

#include "../routing/IPathSearch.h"
#include "../routing/RouteAssembler.h"

namespace accessroute {

/// Settings for RoutePlanner
///
/// Presets:
/// - defaults(): Campus-scale limits, A* search
/// - strict(): Small snap radius and tight search limits for untrusted input
/// - unbounded(): No search limits (benchmarks, offline analysis)
///
/// Usage:
/// @code
/// auto options = PlannerOptions::defaults().withStrategy(SearchStrategy::Bidirectional);
/// RoutePlanner planner(graph, ProfileRegistry::builtin(), options);
/// @endcode
struct PlannerOptions {
    /// Stride used for step estimates (meters)
    double strideLengthMeters = DEFAULT_STRIDE_LENGTH_M;

    /// Coordinates farther than this from every node are rejected (meters)
    double maxSnapDistanceMeters = 250.0;

    /// Search guards applied to every query
    SearchLimits limits;

    /// Strategy used when a request does not name one
    SearchStrategy defaultStrategy = SearchStrategy::AStar;

    // === Named Presets ===

    static PlannerOptions defaults();
    static PlannerOptions strict();
    static PlannerOptions unbounded();

    // === Convenience Methods ===

    PlannerOptions& withStrideLength(double meters) {
        strideLengthMeters = meters;
        return *this;
    }

    PlannerOptions& withMaxSnapDistance(double meters) {
        maxSnapDistanceMeters = meters;
        return *this;
    }

    PlannerOptions& withLimits(SearchLimits searchLimits) {
        limits = searchLimits;
        return *this;
    }

    PlannerOptions& withStrategy(SearchStrategy strategy) {
        defaultStrategy = strategy;
        return *this;
    }

    /// @throws ConfigError if a value is out of range
    void validate() const;
};

}  // namespace accessroute
