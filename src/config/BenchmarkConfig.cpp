#include "accessroute/config/BenchmarkConfig.h"
#include "accessroute/config/ConfigError.h"

#include <string>

namespace accessroute {

BenchmarkConfig BenchmarkConfig::defaults() {
    return BenchmarkConfig{};
}

BenchmarkConfig BenchmarkConfig::quick() {
    BenchmarkConfig config;
    config.pairCount = 5;
    config.repetitions = 3;
    config.warmupRuns = 1;
    return config;
}

std::vector<SearchStrategy> BenchmarkConfig::effectiveStrategies() const {
    if (strategies.empty()) {
        return {ALL_SEARCH_STRATEGIES.begin(), ALL_SEARCH_STRATEGIES.end()};
    }
    return strategies;
}

void BenchmarkConfig::validate() const {
    if (pairCount == 0) {
        throw ConfigError("pairCount must be at least 1");
    }
    if (repetitions == 0) {
        throw ConfigError("repetitions must be at least 1");
    }
    if (pairCount > MAX_BENCHMARK_PAIRS) {
        throw ConfigError("pairCount must not exceed " + std::to_string(MAX_BENCHMARK_PAIRS));
    }
    if (repetitions > MAX_BENCHMARK_REPETITIONS) {
        throw ConfigError("repetitions must not exceed " + std::to_string(MAX_BENCHMARK_REPETITIONS));
    }
    if (warmupRuns > MAX_BENCHMARK_WARMUP_RUNS) {
        throw ConfigError("warmupRuns must not exceed " + std::to_string(MAX_BENCHMARK_WARMUP_RUNS));
    }
}

}  // namespace accessroute
