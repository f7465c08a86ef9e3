#pragma once

#include "../config/BenchmarkConfig.h"
#include "../config/ConfigError.h"
#include "../config/PlannerOptions.h"

#include <string>

namespace accessroute {

/// JSON serialization and file I/O for PlannerOptions and BenchmarkConfig.
/// Keys missing from a document keep their default values.
class ConfigSerializer {
public:
    // === PlannerOptions ===

    static std::string toJson(const PlannerOptions& options);

    /// @throws ConfigError on malformed JSON, wrong types or invalid values
    static PlannerOptions plannerOptionsFromJson(const std::string& json);

    /// @throws ConfigError if the file cannot be read or is invalid
    static PlannerOptions loadPlannerOptions(const std::string& path);

    // === BenchmarkConfig ===

    static std::string toJson(const BenchmarkConfig& config);

    /// @throws ConfigError on malformed JSON, wrong types or invalid values
    static BenchmarkConfig benchmarkConfigFromJson(const std::string& json);

    /// @throws ConfigError if the file cannot be read or is invalid
    static BenchmarkConfig loadBenchmarkConfig(const std::string& path);

    /// Save serialized configuration to file
    /// @return true if save succeeded
    static bool saveToFile(const std::string& json, const std::string& path);

private:
    static std::string readFile(const std::string& path);
};

}  // namespace accessroute
