#pragma once

#include "../routing/IPathSearch.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace accessroute {

/// Straight-line distance class of an origin/destination pair
enum class DistanceCategory {
    Short,   ///< < 200 m
    Medium,  ///< 200 m .. 500 m
    Long     ///< > 500 m
};

constexpr double SHORT_DISTANCE_LIMIT_M = 200.0;
constexpr double MEDIUM_DISTANCE_LIMIT_M = 500.0;

DistanceCategory categorizeDistance(double meters);
const char* toString(DistanceCategory category);

/// Summary statistics of repeated timings
///
/// Percentiles interpolate between order statistics at rank p * (n + 1).
/// Below 20 samples p95 is the maximum, below 100 samples p99 is.
struct TimingStats {
    double meanMs = 0.0;
    double medianMs = 0.0;
    double stddevMs = 0.0;  ///< Sample standard deviation (0 for a single run)
    double minMs = 0.0;
    double maxMs = 0.0;
    double p95Ms = 0.0;
    double p99Ms = 0.0;

    static TimingStats fromSamples(std::vector<double> samplesMs);
};

/// One (profile, pair, strategy) measurement
struct BenchmarkRecord {
    std::string profile;
    SearchStrategy strategy = SearchStrategy::Dijkstra;
    std::string origin;
    std::string destination;
    double straightLineMeters = 0.0;
    DistanceCategory category = DistanceCategory::Short;
    SearchStatus status = SearchStatus::NoRoute;
    TimingStats timing;
    size_t nodesExplored = 0;
    double routeDistanceMeters = 0.0;
    double routeCost = 0.0;
    size_t pathPoints = 0;   ///< Points in the assembled route geometry
    std::string error;

    bool ok() const { return status == SearchStatus::Found && error.empty(); }
};

/// Aggregate over successful records sharing profile, category and strategy
struct BenchmarkSummaryRow {
    std::string profile;
    DistanceCategory category = DistanceCategory::Short;
    SearchStrategy strategy = SearchStrategy::Dijkstra;
    size_t samples = 0;
    double meanTimeMs = 0.0;
    double meanNodesExplored = 0.0;
};

/// Results of a benchmark run plus CSV, JSON and text renderings
struct BenchmarkReport {
    uint32_t seed = 0;
    std::string timestamp;   ///< YYYYmmdd_HHMMSS, local time of the run
    size_t pairCount = 0;
    std::vector<BenchmarkRecord> records;

    std::vector<BenchmarkSummaryRow> summarize() const;

    /// 100 * (1 - nodes(A*) / nodes(Dijkstra)) for a profile and category,
    /// or std::nullopt when either strategy has no successful sample
    std::optional<double> nodeSavingsPercent(const std::string& profile,
                                             DistanceCategory category) const;

    /// mean time(Dijkstra) / mean time(A*), same conventions as nodeSavingsPercent
    std::optional<double> speedup(const std::string& profile, DistanceCategory category) const;

    std::string toCsv() const;
    std::string toJson() const;

    /// Multi-line table of the summary, for logs and terminals
    std::string summaryText() const;
};

}  // namespace accessroute
