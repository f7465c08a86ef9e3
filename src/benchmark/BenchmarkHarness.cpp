#include "accessroute/benchmark/BenchmarkHarness.h"
#include "accessroute/config/ConfigError.h"
#include "accessroute/core/GeoUtils.h"
#include "accessroute/common/Logger.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace accessroute {

namespace {

void writeText(const std::filesystem::path& path, const std::string& text) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write benchmark output: " + path.string());
    }
    file << text;
    if (!file.good()) {
        throw std::runtime_error("Failed writing benchmark output: " + path.string());
    }
}

}  // namespace

BenchmarkHarness::BenchmarkHarness(RoutePlanner& planner, BenchmarkConfig config)
    : planner_(planner), config_(std::move(config)) {
    config_.validate();
    for (const auto& key : config_.profiles) {
        if (!planner_.profiles().hasProfile(key)) {
            throw ConfigError("Unknown profile in benchmark configuration: " + key);
        }
    }
}

std::vector<std::string> BenchmarkHarness::profileKeys() const {
    if (config_.profiles.empty()) {
        return planner_.profiles().keys();
    }
    return config_.profiles;
}

std::vector<BenchmarkEndpoint> BenchmarkHarness::endpointsFromCatalog(const PoiCatalog& catalog,
                                                                      const RoutePlanner& planner) {
    std::vector<BenchmarkEndpoint> endpoints;
    for (const auto& poi : catalog.entries()) {
        auto node = planner.snap(poi.position);
        if (!node) {
            LOG_WARN("POI '{}' is too far from the path network; not used in the benchmark", poi.name);
            continue;
        }
        endpoints.push_back(BenchmarkEndpoint{poi.name, *node, poi.position});
    }
    return endpoints;
}

std::vector<BenchmarkEndpoint> BenchmarkHarness::endpointsFromGraph(const PathGraph& graph) {
    std::vector<BenchmarkEndpoint> endpoints;
    endpoints.reserve(graph.nodeCount());
    for (const auto& node : graph.nodes()) {
        const int64_t label = node.sourceId != NO_SOURCE_ID ? node.sourceId : static_cast<int64_t>(node.id);
        endpoints.push_back(BenchmarkEndpoint{"node " + std::to_string(label), node.id, node.position});
    }
    return endpoints;
}

std::vector<BenchmarkPair> BenchmarkHarness::samplePairs(
    const std::vector<BenchmarkEndpoint>& endpoints) const {
    if (endpoints.size() < 2) {
        throw ConfigError("Benchmark needs at least two endpoints, got " +
                          std::to_string(endpoints.size()));
    }

    std::mt19937 rng(config_.seed);
    std::uniform_int_distribution<size_t> pickFirst(0, endpoints.size() - 1);
    std::uniform_int_distribution<size_t> pickSecond(0, endpoints.size() - 2);

    std::vector<BenchmarkPair> pairs;
    pairs.reserve(config_.pairCount);
    for (size_t i = 0; i < config_.pairCount; ++i) {
        const size_t a = pickFirst(rng);
        size_t b = pickSecond(rng);
        if (b >= a) {
            ++b;
        }

        BenchmarkPair pair;
        pair.origin = endpoints[a];
        pair.destination = endpoints[b];
        pair.straightLineMeters = geo::equirectangularMeters(pair.origin.position, pair.destination.position);
        pair.category = categorizeDistance(pair.straightLineMeters);
        pairs.push_back(std::move(pair));
    }
    return pairs;
}

BenchmarkReport BenchmarkHarness::run(const std::vector<BenchmarkEndpoint>& endpoints) {
    return runPairs(samplePairs(endpoints));
}

BenchmarkReport BenchmarkHarness::runPairs(const std::vector<BenchmarkPair>& pairs) {
    BenchmarkReport report;
    report.seed = config_.seed;
    report.timestamp = currentTimestamp();
    report.pairCount = pairs.size();

    const auto strategies = config_.effectiveStrategies();
    const auto keys = profileKeys();

    LOG_INFO("Benchmark: {} pairs x {} profiles x {} strategies, {} repetitions + {} warm-up, seed {}",
             pairs.size(), keys.size(), strategies.size(),
             config_.repetitions, config_.warmupRuns, config_.seed);

    for (const auto& key : keys) {
        std::shared_ptr<const WeightedGraph> weighted;
        std::string buildError;
        try {
            weighted = planner_.weightedGraph(key);
        } catch (const std::exception& e) {
            buildError = e.what();
            LOG_ERROR("Benchmark: profile '{}' unavailable: {}", key, buildError);
        }

        for (const auto& pair : pairs) {
            for (SearchStrategy strategy : strategies) {
                if (weighted) {
                    report.records.push_back(measure(*weighted, pair, strategy));
                    continue;
                }
                BenchmarkRecord failed;
                failed.profile = key;
                failed.strategy = strategy;
                failed.origin = pair.origin.name;
                failed.destination = pair.destination.name;
                failed.straightLineMeters = pair.straightLineMeters;
                failed.category = pair.category;
                failed.error = buildError;
                report.records.push_back(std::move(failed));
            }
        }
        LOG_DEBUG("Benchmark: profile '{}' done", key);
    }

    std::istringstream summary(report.summaryText());
    for (std::string line; std::getline(summary, line);) {
        LOG_INFO("{}", line);
    }
    return report;
}

BenchmarkRecord BenchmarkHarness::measure(const WeightedGraph& weighted,
                                          const BenchmarkPair& pair,
                                          SearchStrategy strategy) const {
    BenchmarkRecord record;
    record.profile = weighted.profile().key;
    record.strategy = strategy;
    record.origin = pair.origin.name;
    record.destination = pair.destination.name;
    record.straightLineMeters = pair.straightLineMeters;
    record.category = pair.category;

    const SearchLimits limits = planner_.options().limits;

    try {
        for (size_t i = 0; i < config_.warmupRuns; ++i) {
            SearchContext context(limits);
            planner_.search(weighted, pair.origin.node, pair.destination.node, strategy, context);
        }

        std::vector<double> samples;
        samples.reserve(config_.repetitions);
        SearchResult result;
        for (size_t i = 0; i < config_.repetitions; ++i) {
            SearchContext context(limits);
            auto start = std::chrono::steady_clock::now();
            result = planner_.search(weighted, pair.origin.node, pair.destination.node, strategy, context);
            auto elapsed = std::chrono::steady_clock::now() - start;
            samples.push_back(std::chrono::duration<double, std::milli>(elapsed).count());
        }

        record.timing = TimingStats::fromSamples(std::move(samples));
        record.status = result.status;
        record.nodesExplored = result.nodesExplored;

        if (result.found()) {
            const RouteAssembler assembler(planner_.options().strideLengthMeters);
            const Route route = assembler.assemble(weighted.graph(), weighted.profile(),
                                                   result.nodePath, result.edgePath, result.totalCost);
            record.routeCost = route.totalCost;
            record.routeDistanceMeters = route.distanceMeters;
            record.pathPoints = route.coordinates.size();
        } else {
            record.error = result.status == SearchStatus::NoRoute ? "no route" : "search exceeded bound";
        }
    } catch (const std::exception& e) {
        record.error = e.what();
        LOG_ERROR("Benchmark trial {} -> {} ({}) failed: {}",
                  pair.origin.name, pair.destination.name, toString(strategy), e.what());
    }
    return record;
}

std::vector<std::string> BenchmarkHarness::writeOutputs(const BenchmarkReport& report) const {
    const std::filesystem::path dir(config_.outputDir);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("Cannot create benchmark output directory " + dir.string() +
                                 ": " + ec.message());
    }

    const std::string stem = "benchmark_" + report.timestamp;
    const auto csvPath = dir / (stem + ".csv");
    const auto jsonPath = dir / (stem + ".json");

    writeText(csvPath, report.toCsv());
    writeText(jsonPath, report.toJson());

    LOG_INFO("Benchmark results written to {} and {}", csvPath.string(), jsonPath.string());
    return {csvPath.string(), jsonPath.string()};
}

std::string BenchmarkHarness::currentTimestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    std::ostringstream ss;
    ss << std::put_time(&local, "%Y%m%d_%H%M%S");
    return ss.str();
}

}  // namespace accessroute
