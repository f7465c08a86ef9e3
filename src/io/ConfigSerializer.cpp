#include "accessroute/io/ConfigSerializer.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace accessroute {

namespace {

json parseObject(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Invalid configuration JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }
    return j;
}

SearchStrategy strategyFromJson(const json& value) {
    const auto name = value.get<std::string>();
    auto strategy = parseSearchStrategy(name);
    if (!strategy) {
        throw ConfigError("Unknown search strategy: " + name);
    }
    return *strategy;
}

/// Reads a non-negative integer member, keeping the fallback when absent.
/// Negative, fractional and out-of-range values are rejected instead of wrapping.
template <typename T>
T countValue(const json& object, const char* key, T fallback) {
    auto it = object.find(key);
    if (it == object.end()) {
        return fallback;
    }
    if (!it->is_number_integer()) {
        throw ConfigError(std::string(key) + " must be a non-negative integer");
    }
    if (!it->is_number_unsigned()) {
        throw ConfigError(std::string(key) + " must not be negative");
    }
    const auto value = it->get<uint64_t>();
    if (value > std::numeric_limits<T>::max()) {
        throw ConfigError(std::string(key) + " is out of range");
    }
    return static_cast<T>(value);
}

}  // namespace

std::string ConfigSerializer::toJson(const PlannerOptions& options) {
    json j;
    j["strideLengthMeters"] = options.strideLengthMeters;
    j["maxSnapDistanceMeters"] = options.maxSnapDistanceMeters;
    j["limits"] = {
        {"maxFrontier", options.limits.maxFrontier},
        {"maxSettled", options.limits.maxSettled}
    };
    j["defaultStrategy"] = toString(options.defaultStrategy);
    return j.dump(2);
}

PlannerOptions ConfigSerializer::plannerOptionsFromJson(const std::string& text) {
    const json j = parseObject(text);
    PlannerOptions options;

    try {
        options.strideLengthMeters = j.value("strideLengthMeters", options.strideLengthMeters);
        options.maxSnapDistanceMeters = j.value("maxSnapDistanceMeters", options.maxSnapDistanceMeters);
        if (j.contains("limits")) {
            const json& limits = j["limits"];
            if (!limits.is_object()) {
                throw ConfigError("limits must be a JSON object");
            }
            options.limits.maxFrontier = countValue(limits, "maxFrontier", options.limits.maxFrontier);
            options.limits.maxSettled = countValue(limits, "maxSettled", options.limits.maxSettled);
        }
        if (j.contains("defaultStrategy")) {
            options.defaultStrategy = strategyFromJson(j["defaultStrategy"]);
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid planner options: ") + e.what());
    }

    options.validate();
    return options;
}

PlannerOptions ConfigSerializer::loadPlannerOptions(const std::string& path) {
    return plannerOptionsFromJson(readFile(path));
}

std::string ConfigSerializer::toJson(const BenchmarkConfig& config) {
    json j;
    j["pairCount"] = config.pairCount;
    j["repetitions"] = config.repetitions;
    j["warmupRuns"] = config.warmupRuns;
    j["seed"] = config.seed;
    j["profiles"] = config.profiles;

    json strategies = json::array();
    for (SearchStrategy strategy : config.strategies) {
        strategies.push_back(toString(strategy));
    }
    j["strategies"] = strategies;
    j["outputDir"] = config.outputDir;
    return j.dump(2);
}

BenchmarkConfig ConfigSerializer::benchmarkConfigFromJson(const std::string& text) {
    const json j = parseObject(text);
    BenchmarkConfig config;

    try {
        config.pairCount = countValue(j, "pairCount", config.pairCount);
        config.repetitions = countValue(j, "repetitions", config.repetitions);
        config.warmupRuns = countValue(j, "warmupRuns", config.warmupRuns);
        config.seed = countValue(j, "seed", config.seed);
        config.outputDir = j.value("outputDir", config.outputDir);
        if (j.contains("profiles")) {
            config.profiles = j["profiles"].get<std::vector<std::string>>();
        }
        if (j.contains("strategies")) {
            for (const auto& name : j["strategies"]) {
                config.strategies.push_back(strategyFromJson(name));
            }
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid benchmark configuration: ") + e.what());
    }

    config.validate();
    return config;
}

BenchmarkConfig ConfigSerializer::loadBenchmarkConfig(const std::string& path) {
    return benchmarkConfigFromJson(readFile(path));
}

bool ConfigSerializer::saveToFile(const std::string& json, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        return false;
    }
    file << json;
    return file.good();
}

std::string ConfigSerializer::readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open configuration file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

}  // namespace accessroute
