#include "accessroute/benchmark/BenchmarkReport.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <iomanip>
#include <map>
#include <numeric>
#include <sstream>
#include <tuple>

using json = nlohmann::json;

namespace accessroute {

namespace {

constexpr std::array<DistanceCategory, 3> ALL_CATEGORIES = {
    DistanceCategory::Short, DistanceCategory::Medium, DistanceCategory::Long};

std::string csvField(const std::string& value) {
    if (value.find_first_of(",\"\n\r") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

json timingToJson(const TimingStats& t) {
    return {
        {"meanMs", t.meanMs},
        {"medianMs", t.medianMs},
        {"stddevMs", t.stddevMs},
        {"minMs", t.minMs},
        {"maxMs", t.maxMs},
        {"p95Ms", t.p95Ms},
        {"p99Ms", t.p99Ms}
    };
}

/// Percentile of sorted samples, or the maximum when fewer than minSamples
double percentile(const std::vector<double>& sorted, double fraction, size_t minSamples) {
    const size_t n = sorted.size();
    if (n < minSamples || n < 2) {
        return sorted.back();
    }
    const double rank = fraction * static_cast<double>(n + 1);
    const size_t lower = std::clamp<size_t>(static_cast<size_t>(rank), 1, n - 1);
    const double weight = rank - static_cast<double>(lower);
    return sorted[lower - 1] + weight * (sorted[lower] - sorted[lower - 1]);
}

const BenchmarkSummaryRow* findRow(const std::vector<BenchmarkSummaryRow>& rows,
                                   const std::string& profile,
                                   DistanceCategory category,
                                   SearchStrategy strategy) {
    for (const auto& row : rows) {
        if (row.profile == profile && row.category == category && row.strategy == strategy) {
            return &row;
        }
    }
    return nullptr;
}

}  // namespace

DistanceCategory categorizeDistance(double meters) {
    if (meters < SHORT_DISTANCE_LIMIT_M) return DistanceCategory::Short;
    if (meters <= MEDIUM_DISTANCE_LIMIT_M) return DistanceCategory::Medium;
    return DistanceCategory::Long;
}

const char* toString(DistanceCategory category) {
    switch (category) {
        case DistanceCategory::Short: return "short";
        case DistanceCategory::Medium: return "medium";
        case DistanceCategory::Long: return "long";
    }
    return "unknown";
}

TimingStats TimingStats::fromSamples(std::vector<double> samples) {
    TimingStats stats;
    if (samples.empty()) {
        return stats;
    }

    std::sort(samples.begin(), samples.end());
    const size_t n = samples.size();

    stats.minMs = samples.front();
    stats.maxMs = samples.back();
    stats.meanMs = std::accumulate(samples.begin(), samples.end(), 0.0) / static_cast<double>(n);
    stats.medianMs = n % 2 == 1 ? samples[n / 2] : (samples[n / 2 - 1] + samples[n / 2]) / 2.0;
    stats.p95Ms = percentile(samples, 0.95, 20);
    stats.p99Ms = percentile(samples, 0.99, 100);

    if (n > 1) {
        double sumSquares = 0.0;
        for (double s : samples) {
            sumSquares += (s - stats.meanMs) * (s - stats.meanMs);
        }
        stats.stddevMs = std::sqrt(sumSquares / static_cast<double>(n - 1));
    }
    return stats;
}

std::vector<BenchmarkSummaryRow> BenchmarkReport::summarize() const {
    // Keyed by (profile order, category, strategy) to keep output stable
    std::vector<std::string> profileOrder;
    for (const auto& record : records) {
        if (std::find(profileOrder.begin(), profileOrder.end(), record.profile) == profileOrder.end()) {
            profileOrder.push_back(record.profile);
        }
    }

    std::map<std::tuple<size_t, int, int>, BenchmarkSummaryRow> groups;
    for (const auto& record : records) {
        if (!record.ok()) {
            continue;
        }
        const size_t profileIndex = static_cast<size_t>(
            std::find(profileOrder.begin(), profileOrder.end(), record.profile) - profileOrder.begin());
        auto key = std::make_tuple(profileIndex, static_cast<int>(record.category),
                                   static_cast<int>(record.strategy));

        auto& row = groups[key];
        row.profile = record.profile;
        row.category = record.category;
        row.strategy = record.strategy;
        ++row.samples;
        row.meanTimeMs += record.timing.meanMs;
        row.meanNodesExplored += static_cast<double>(record.nodesExplored);
    }

    std::vector<BenchmarkSummaryRow> rows;
    rows.reserve(groups.size());
    for (auto& [key, row] : groups) {
        row.meanTimeMs /= static_cast<double>(row.samples);
        row.meanNodesExplored /= static_cast<double>(row.samples);
        rows.push_back(row);
    }
    return rows;
}

std::optional<double> BenchmarkReport::nodeSavingsPercent(const std::string& profile,
                                                          DistanceCategory category) const {
    const auto rows = summarize();
    const auto* dijkstra = findRow(rows, profile, category, SearchStrategy::Dijkstra);
    const auto* astar = findRow(rows, profile, category, SearchStrategy::AStar);
    if (!dijkstra || !astar || dijkstra->meanNodesExplored <= 0.0) {
        return std::nullopt;
    }
    return 100.0 * (1.0 - astar->meanNodesExplored / dijkstra->meanNodesExplored);
}

std::optional<double> BenchmarkReport::speedup(const std::string& profile,
                                               DistanceCategory category) const {
    const auto rows = summarize();
    const auto* dijkstra = findRow(rows, profile, category, SearchStrategy::Dijkstra);
    const auto* astar = findRow(rows, profile, category, SearchStrategy::AStar);
    if (!dijkstra || !astar || astar->meanTimeMs <= 0.0) {
        return std::nullopt;
    }
    return dijkstra->meanTimeMs / astar->meanTimeMs;
}

std::string BenchmarkReport::toCsv() const {
    std::ostringstream out;
    out << "profile,strategy,origin,destination,straight_line_m,category,status,"
        << "mean_ms,median_ms,stddev_ms,min_ms,max_ms,p95_ms,p99_ms,nodes_explored,"
        << "route_distance_m,route_cost,path_points,error\n";

    for (const auto& r : records) {
        out << csvField(r.profile) << ','
            << toString(r.strategy) << ','
            << csvField(r.origin) << ','
            << csvField(r.destination) << ','
            << std::fixed << std::setprecision(2) << r.straightLineMeters << ','
            << toString(r.category) << ','
            << toString(r.status) << ','
            << std::setprecision(4)
            << r.timing.meanMs << ',' << r.timing.medianMs << ',' << r.timing.stddevMs << ','
            << r.timing.minMs << ',' << r.timing.maxMs << ','
            << r.timing.p95Ms << ',' << r.timing.p99Ms << ','
            << r.nodesExplored << ','
            << std::setprecision(2) << r.routeDistanceMeters << ',' << r.routeCost << ','
            << r.pathPoints << ','
            << csvField(r.error) << '\n';
    }
    return out.str();
}

std::string BenchmarkReport::toJson() const {
    json j;
    j["metadata"] = {
        {"timestamp", timestamp},
        {"seed", seed},
        {"pairCount", pairCount},
        {"recordCount", records.size()}
    };

    json results = json::array();
    for (const auto& r : records) {
        json item = {
            {"profile", r.profile},
            {"strategy", toString(r.strategy)},
            {"origin", r.origin},
            {"destination", r.destination},
            {"straightLineMeters", r.straightLineMeters},
            {"category", toString(r.category)},
            {"status", toString(r.status)},
            {"timing", timingToJson(r.timing)},
            {"nodesExplored", r.nodesExplored},
            {"routeDistanceMeters", r.routeDistanceMeters},
            {"routeCost", r.routeCost},
            {"pathPoints", r.pathPoints}
        };
        if (!r.error.empty()) {
            item["error"] = r.error;
        }
        results.push_back(item);
    }
    j["results"] = results;

    json summary = json::array();
    for (const auto& row : summarize()) {
        summary.push_back({
            {"profile", row.profile},
            {"category", toString(row.category)},
            {"strategy", toString(row.strategy)},
            {"samples", row.samples},
            {"meanTimeMs", row.meanTimeMs},
            {"meanNodesExplored", row.meanNodesExplored}
        });
    }
    j["summary"] = summary;

    return j.dump(2);
}

std::string BenchmarkReport::summaryText() const {
    const auto rows = summarize();
    std::ostringstream out;
    out << std::fixed;

    if (rows.empty()) {
        out << "No successful benchmark records\n";
        return out.str();
    }

    out << std::left << std::setw(22) << "profile" << std::setw(8) << "range"
        << std::setw(15) << "strategy" << std::right << std::setw(6) << "n"
        << std::setw(12) << "mean ms" << std::setw(12) << "mean nodes" << '\n';

    for (const auto& row : rows) {
        out << std::left << std::setw(22) << row.profile
            << std::setw(8) << toString(row.category)
            << std::setw(15) << toString(row.strategy)
            << std::right << std::setw(6) << row.samples
            << std::setw(12) << std::setprecision(4) << row.meanTimeMs
            << std::setw(12) << std::setprecision(1) << row.meanNodesExplored << '\n';
    }

    std::vector<std::string> profileOrder;
    for (const auto& row : rows) {
        if (std::find(profileOrder.begin(), profileOrder.end(), row.profile) == profileOrder.end()) {
            profileOrder.push_back(row.profile);
        }
    }
    for (const auto& profile : profileOrder) {
        for (DistanceCategory category : ALL_CATEGORIES) {
            auto savings = nodeSavingsPercent(profile, category);
            if (!savings) {
                continue;
            }
            auto ratio = speedup(profile, category);
            out << profile << " / " << toString(category) << ": A* node savings vs Dijkstra "
                << std::setprecision(1) << *savings << "%";
            if (ratio) {
                out << ", speedup " << std::setprecision(2) << *ratio << "x";
            }
            out << '\n';
        }
    }
    return out.str();
}

}  // namespace accessroute
