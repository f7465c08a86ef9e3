#include <accessroute/accessroute.h>
#include <accessroute/common/Logger.h>

#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <sstream>
#include <string>
#include <vector>

using namespace accessroute;

namespace {

struct Arguments {
    std::string graphPath;
    std::string poiPath;
    std::string configPath;
    std::string plannerConfigPath;
    std::optional<size_t> pairs;
    std::optional<size_t> repetitions;
    std::optional<size_t> warmup;
    std::optional<uint32_t> seed;
    std::optional<std::string> profiles;
    std::optional<std::string> strategies;
    std::optional<std::string> outputDir;
    bool verbose = false;
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " --graph=FILE [options]\n"
              << "\n"
              << "Options:\n"
              << "  --pois=FILE            Sample pairs from a POI catalog (default: graph nodes)\n"
              << "  --config=FILE          Benchmark configuration (JSON)\n"
              << "  --planner-config=FILE  Planner options (JSON)\n"
              << "  --pairs=N              Origin/destination pairs\n"
              << "  --repetitions=N        Timed repetitions per trial\n"
              << "  --warmup=N             Discarded warm-up runs per trial\n"
              << "  --seed=N               Pair sampling seed\n"
              << "  --profiles=A,B         Profiles to run (default: all)\n"
              << "  --strategies=A,B       dijkstra, bidirectional, astar (default: all)\n"
              << "  --output=DIR           Output directory for CSV and JSON\n"
              << "  -v, --verbose          Debug logging\n";
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

/// Parses a decimal count. std::stoul alone accepts "-1" and wraps it.
uint64_t parseCount(const std::string& text, uint64_t max) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("'" + text + "' is not a non-negative integer");
    }
    const auto value = std::stoull(text);
    if (value > max) {
        throw std::out_of_range("'" + text + "' exceeds " + std::to_string(max));
    }
    return value;
}

std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream ss(text);
    for (std::string item; std::getline(ss, item, ',');) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::optional<Arguments> parseArguments(int argc, char* argv[]) {
    Arguments args;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto valueOf = [&arg](const std::string& flag) { return arg.substr(flag.size()); };

            if (startsWith(arg, "--graph=")) {
                args.graphPath = valueOf("--graph=");
            } else if (startsWith(arg, "--pois=")) {
                args.poiPath = valueOf("--pois=");
            } else if (startsWith(arg, "--config=")) {
                args.configPath = valueOf("--config=");
            } else if (startsWith(arg, "--planner-config=")) {
                args.plannerConfigPath = valueOf("--planner-config=");
            } else if (startsWith(arg, "--pairs=")) {
                args.pairs = parseCount(valueOf("--pairs="), MAX_BENCHMARK_PAIRS);
            } else if (startsWith(arg, "--repetitions=")) {
                args.repetitions = parseCount(valueOf("--repetitions="), MAX_BENCHMARK_REPETITIONS);
            } else if (startsWith(arg, "--warmup=")) {
                args.warmup = parseCount(valueOf("--warmup="), MAX_BENCHMARK_WARMUP_RUNS);
            } else if (startsWith(arg, "--seed=")) {
                args.seed = static_cast<uint32_t>(
                    parseCount(valueOf("--seed="), std::numeric_limits<uint32_t>::max()));
            } else if (startsWith(arg, "--profiles=")) {
                args.profiles = valueOf("--profiles=");
            } else if (startsWith(arg, "--strategies=")) {
                args.strategies = valueOf("--strategies=");
            } else if (startsWith(arg, "--output=")) {
                args.outputDir = valueOf("--output=");
            } else if (arg == "-v" || arg == "--verbose") {
                args.verbose = true;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                return std::nullopt;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Invalid numeric argument: " << e.what() << "\n";
        return std::nullopt;
    }
    return args;
}

/// Command line values override the configuration file
BenchmarkConfig buildConfig(const Arguments& args) {
    BenchmarkConfig config = args.configPath.empty()
                                 ? BenchmarkConfig::defaults()
                                 : ConfigSerializer::loadBenchmarkConfig(args.configPath);

    if (args.pairs) config.withPairCount(*args.pairs);
    if (args.repetitions) config.withRepetitions(*args.repetitions);
    if (args.warmup) config.withWarmupRuns(*args.warmup);
    if (args.seed) config.withSeed(*args.seed);
    if (args.profiles) config.withProfiles(splitList(*args.profiles));
    if (args.outputDir) config.withOutputDir(*args.outputDir);
    if (args.strategies) {
        std::vector<SearchStrategy> strategies;
        for (const auto& name : splitList(*args.strategies)) {
            auto strategy = parseSearchStrategy(name);
            if (!strategy) {
                throw ConfigError("Unknown search strategy: " + name);
            }
            strategies.push_back(*strategy);
        }
        config.withStrategies(std::move(strategies));
    }

    config.validate();
    return config;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = parseArguments(argc, argv);
    if (!parsed || parsed->graphPath.empty()) {
        printUsage(argv[0]);
        return 1;
    }
    const Arguments& args = *parsed;

    Logger::initialize();
    if (args.verbose) {
        Logger::setLevel(LogLevel::Debug);
    }

    try {
        BenchmarkConfig config = buildConfig(args);
        PlannerOptions options = args.plannerConfigPath.empty()
                                     ? PlannerOptions::unbounded()
                                     : ConfigSerializer::loadPlannerOptions(args.plannerConfigPath);

        RoutePlanner planner(GraphLoader::loadFromFile(args.graphPath), ProfileRegistry::builtin(), options);
        BenchmarkHarness harness(planner, config);

        std::vector<BenchmarkEndpoint> endpoints;
        if (!args.poiPath.empty()) {
            try {
                endpoints = BenchmarkHarness::endpointsFromCatalog(PoiCatalog::loadFromFile(args.poiPath), planner);
            } catch (const PoiLoadError& e) {
                LOG_WARN("{}; sampling graph nodes instead", e.what());
            }
        }
        if (endpoints.size() < 2) {
            endpoints = BenchmarkHarness::endpointsFromGraph(planner.graph());
        }

        BenchmarkReport report = harness.run(endpoints);
        for (const auto& path : harness.writeOutputs(report)) {
            std::cout << "Written: " << path << "\n";
        }
        std::cout << report.summaryText();
    } catch (const GraphLoadError& e) {
        LOG_ERROR("{}", e.what());
        return 1;
    } catch (const ConfigError& e) {
        LOG_ERROR("{}", e.what());
        return 1;
    } catch (const std::runtime_error& e) {
        LOG_ERROR("Benchmark failed: {}", e.what());
        return 1;
    }

    Logger::flush();
    return 0;
}
