#pragma once

#include "BenchmarkReport.h"
#include "../config/BenchmarkConfig.h"
#include "../io/PoiCatalog.h"
#include "../routing/RoutePlanner.h"

#include <string>
#include <vector>

namespace accessroute {

/// Named network node used as a benchmark origin or destination
struct BenchmarkEndpoint {
    std::string name;
    NodeId node = INVALID_NODE;
    GeoPoint position;
};

struct BenchmarkPair {
    BenchmarkEndpoint origin;
    BenchmarkEndpoint destination;
    double straightLineMeters = 0.0;
    DistanceCategory category = DistanceCategory::Short;
};

/// Repeats searches over sampled origin/destination pairs and collects
/// timing and exploration statistics for every (profile, pair, strategy).
///
/// Each run uses a fresh SearchContext. Warm-up runs are discarded.
/// Per-trial failures are recorded in the report and the run continues.
///
/// Usage:
/// @code
/// BenchmarkHarness harness(planner, BenchmarkConfig::defaults().withSeed(7));
/// auto endpoints = BenchmarkHarness::endpointsFromCatalog(catalog, planner);
/// BenchmarkReport report = harness.run(endpoints);
/// harness.writeOutputs(report);
/// @endcode
class BenchmarkHarness {
public:
    /// @throws ConfigError if @p config is invalid or names an unknown profile
    BenchmarkHarness(RoutePlanner& planner, BenchmarkConfig config);

    /// POIs snapped to the network. POIs too far from every node are left out.
    static std::vector<BenchmarkEndpoint> endpointsFromCatalog(const PoiCatalog& catalog,
                                                               const RoutePlanner& planner);

    /// Every graph node, named after its source id
    static std::vector<BenchmarkEndpoint> endpointsFromGraph(const PathGraph& graph);

    /// Deterministic pair sample: the same seed and endpoints give the same pairs.
    /// Origin and destination of a pair are always distinct endpoints.
    /// @throws ConfigError if fewer than two endpoints are given
    std::vector<BenchmarkPair> samplePairs(const std::vector<BenchmarkEndpoint>& endpoints) const;

    /// Sample pairs and measure them
    BenchmarkReport run(const std::vector<BenchmarkEndpoint>& endpoints);

    /// Measure already sampled pairs
    BenchmarkReport runPairs(const std::vector<BenchmarkPair>& pairs);

    /// Write benchmark_<timestamp>.csv and .json into the output directory
    /// @return Paths written
    /// @throws std::runtime_error if the directory or a file cannot be written
    std::vector<std::string> writeOutputs(const BenchmarkReport& report) const;

    const BenchmarkConfig& config() const { return config_; }

    /// Profiles the run covers, in order
    std::vector<std::string> profileKeys() const;

private:
    BenchmarkRecord measure(const WeightedGraph& weighted,
                            const BenchmarkPair& pair,
                            SearchStrategy strategy) const;

    static std::string currentTimestamp();

    RoutePlanner& planner_;
    BenchmarkConfig config_;
};

}  // namespace accessroute
