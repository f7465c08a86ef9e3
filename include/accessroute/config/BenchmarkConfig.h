#pragma once

#include "../routing/IPathSearch.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace accessroute {

/// Upper bounds accepted by BenchmarkConfig::validate()
constexpr size_t MAX_BENCHMARK_PAIRS = 100'000;
constexpr size_t MAX_BENCHMARK_REPETITIONS = 10'000;
constexpr size_t MAX_BENCHMARK_WARMUP_RUNS = 1'000;

/// Parameters of a benchmark run
///
/// Presets:
/// - defaults(): 50 pairs, 20 timed repetitions, 3 warm-up runs
/// - quick(): Small run for smoke tests
struct BenchmarkConfig {
    /// Number of origin/destination pairs to sample
    size_t pairCount = 50;

    /// Timed repetitions per (profile, pair, strategy)
    size_t repetitions = 20;

    /// Untimed warm-up runs before the timed ones
    size_t warmupRuns = 3;

    /// Seed for pair sampling. The same seed always yields the same pairs.
    uint32_t seed = 42;

    /// Profiles to run (empty = every registered profile)
    std::vector<std::string> profiles;

    /// Strategies to compare (empty = all)
    std::vector<SearchStrategy> strategies;

    /// Directory for CSV/JSON output
    std::string outputDir = "benchmark_results";

    static BenchmarkConfig defaults();
    static BenchmarkConfig quick();

    BenchmarkConfig& withPairCount(size_t count) {
        pairCount = count;
        return *this;
    }

    BenchmarkConfig& withRepetitions(size_t count) {
        repetitions = count;
        return *this;
    }

    BenchmarkConfig& withWarmupRuns(size_t count) {
        warmupRuns = count;
        return *this;
    }

    BenchmarkConfig& withSeed(uint32_t value) {
        seed = value;
        return *this;
    }

    BenchmarkConfig& withProfiles(std::vector<std::string> keys) {
        profiles = std::move(keys);
        return *this;
    }

    BenchmarkConfig& withStrategies(std::vector<SearchStrategy> list) {
        strategies = std::move(list);
        return *this;
    }

    BenchmarkConfig& withOutputDir(std::string dir) {
        outputDir = std::move(dir);
        return *this;
    }

    /// Strategies to run, with the empty list expanded to all
    std::vector<SearchStrategy> effectiveStrategies() const;

    /// @throws ConfigError if pairCount or repetitions is zero, or any count exceeds its bound
    void validate() const;
};

}  // namespace accessroute
