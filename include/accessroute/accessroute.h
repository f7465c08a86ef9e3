#pragma once

/// @file accessroute.h
/// @brief Main header for the AccessRoute campus routing library
///
/// AccessRoute computes accessibility-aware pedestrian routes over a
/// campus path network for several mobility profiles.
///
/// Example usage:
/// @code
/// #include <accessroute/accessroute.h>
///
/// auto graph = accessroute::GraphLoader::loadFromFile("campus.json");
/// accessroute::RoutePlanner planner(graph, accessroute::ProfileRegistry::builtin());
///
/// accessroute::RouteRequest request;
/// request.origin = accessroute::RouteEndpoint::at({-3.7685, -38.4790});
/// request.destination = accessroute::RouteEndpoint::at({-3.7672, -38.4761});
/// request.profileKey = "wheelchair";
///
/// auto outcome = planner.plan(request);
/// if (outcome.ok()) {
///     accessroute::GpxExport gpx;
///     gpx.exportToFile(outcome.route, "route.gpx");
/// }
/// @endcode

#include <string>

// Core module - Path network
#include "core/Types.h"
#include "core/GeoUtils.h"
#include "core/EdgeAttributes.h"
#include "core/PathGraph.h"

// Profiles
#include "profile/MobilityProfile.h"
#include "profile/ProfileRegistry.h"

// Routing
#include "routing/EdgeWeightCalculator.h"
#include "routing/WeightedGraph.h"
#include "routing/WeightedGraphCache.h"
#include "routing/HeuristicEstimator.h"
#include "routing/IPathSearch.h"
#include "routing/Route.h"
#include "routing/RouteAssembler.h"
#include "routing/RoutePlanner.h"

// Configuration and I/O
#include "config/ConfigError.h"
#include "config/PlannerOptions.h"
#include "config/BenchmarkConfig.h"
#include "io/GraphLoader.h"
#include "io/PoiCatalog.h"
#include "io/ConfigSerializer.h"

// Export module - Output formats
#include "export/IRouteExporter.h"
#include "export/GpxExport.h"

// Benchmark
#include "benchmark/BenchmarkReport.h"
#include "benchmark/BenchmarkHarness.h"

namespace accessroute {

/// Library version
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace accessroute
