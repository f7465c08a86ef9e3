#include "accessroute/config/PlannerOptions.h"
#include "accessroute/config/ConfigError.h"

#include <cmath>
#include <limits>

namespace accessroute {

PlannerOptions PlannerOptions::defaults() {
    return PlannerOptions{};
}

PlannerOptions PlannerOptions::strict() {
    PlannerOptions options;
    options.maxSnapDistanceMeters = 50.0;
    options.limits.maxFrontier = 100'000;
    options.limits.maxSettled = 100'000;
    return options;
}

PlannerOptions PlannerOptions::unbounded() {
    PlannerOptions options;
    options.maxSnapDistanceMeters = std::numeric_limits<double>::max();
    options.limits = SearchLimits::unlimited();
    return options;
}

void PlannerOptions::validate() const {
    if (!std::isfinite(strideLengthMeters) || strideLengthMeters <= 0.0) {
        throw ConfigError("strideLengthMeters must be positive");
    }
    if (std::isnan(maxSnapDistanceMeters) || maxSnapDistanceMeters < 0.0) {
        throw ConfigError("maxSnapDistanceMeters must not be negative");
    }
    if (limits.maxFrontier == 0 || limits.maxSettled == 0) {
        throw ConfigError("search limits must be at least 1");
    }
}

}  // namespace accessroute
