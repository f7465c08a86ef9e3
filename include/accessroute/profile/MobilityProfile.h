#pragma once

#include "../core/EdgeAttributes.h"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace accessroute {

/// Incline magnitude bands (absolute percent)
enum class SlopeBand {
    Flat,      ///< < 2 %
    Gentle,    ///< 2 % .. 5 %
    Moderate,  ///< 5 % .. 8 %
    Steep      ///< >= 8 %
};

/// Clear width bands
enum class WidthBand {
    Narrow,      ///< < 0.9 m
    Restricted,  ///< 0.9 m .. 1.5 m
    Standard     ///< >= 1.5 m
};

constexpr std::size_t SLOPE_BAND_COUNT = 4;
constexpr std::size_t WIDTH_BAND_COUNT = 3;

/// Band boundaries
constexpr double GENTLE_SLOPE_PERCENT = 2.0;
constexpr double MODERATE_SLOPE_PERCENT = 5.0;
constexpr double STEEP_SLOPE_PERCENT = 8.0;
constexpr double RESTRICTED_WIDTH_M = 0.9;
constexpr double STANDARD_WIDTH_M = 1.5;

SlopeBand slopeBandFor(double inclinePercent);
WidthBand widthBandFor(double widthMeters);

/// Kinds of hard exclusion. Rules never match on unknown data.
enum class ExclusionKind {
    StepsWithoutRamp,  ///< Steps present and no ramp
    WheelchairNo,      ///< wheelchair=no
    InclineAbove,      ///< |incline| > threshold percent
    WidthBelow,        ///< known width < threshold meters
    UnpavedSurface     ///< Surface class Unpaved
};

struct ExclusionRule {
    ExclusionKind kind = ExclusionKind::StepsWithoutRamp;
    double threshold = 0.0;  ///< Used by InclineAbove / WidthBelow

    static ExclusionRule stepsWithoutRamp() { return {ExclusionKind::StepsWithoutRamp, 0.0}; }
    static ExclusionRule wheelchairNo() { return {ExclusionKind::WheelchairNo, 0.0}; }
    static ExclusionRule inclineAbove(double percent) { return {ExclusionKind::InclineAbove, percent}; }
    static ExclusionRule widthBelow(double meters) { return {ExclusionKind::WidthBelow, meters}; }
    static ExclusionRule unpavedSurface() { return {ExclusionKind::UnpavedSurface, 0.0}; }
};

const char* toString(ExclusionKind kind);

/// Multiplicative factor tables. Each index is the enum value; every
/// entry must be >= 1.0. Unknown attribute values are not in the tables:
/// they always use the neutral factor 1.0.
struct FactorTables {
    std::array<double, SURFACE_CLASS_COUNT> surface{1.0, 1.0, 1.0};
    std::array<double, SLOPE_BAND_COUNT> uphill{1.0, 1.0, 1.0, 1.0};
    std::array<double, SLOPE_BAND_COUNT> downhill{1.0, 1.0, 1.0, 1.0};
    std::array<double, CROSSING_KIND_COUNT> crossing{1.0, 1.0, 1.0};
    std::array<double, WIDTH_BAND_COUNT> width{1.0, 1.0, 1.0};
    double limitedAccess = 1.0;  ///< wheelchair=limited
    double noAccess = 1.0;       ///< wheelchair=no (when not excluded)
    double steps = 1.0;          ///< Steps without a ramp (when not excluded)
};

/// Named mobility persona: walking speed, cost factors and hard exclusions.
struct MobilityProfile {
    std::string key;            ///< Registry key, e.g. "wheelchair"
    std::string displayName;
    double baseSpeedMps = 1.4;
    FactorTables factors;
    std::vector<ExclusionRule> exclusions;  ///< Evaluated in declared order

    double surfaceFactor(SurfaceClass surface) const;

    /// Slope factor for an incline measured in the traversal direction
    double slopeFactor(std::optional<double> inclinePercent) const;

    double crossingFactor(CrossingKind crossing) const;
    double widthFactor(std::optional<double> widthMeters) const;
    double accessFactor(WheelchairAccess access) const;

    /// Smallest product of factors any edge can receive.
    /// Always >= 1.0; the heuristic scales distances by this value.
    double minimumCostFactor() const;

    bool excludes(ExclusionKind kind) const;

    /// @throws std::invalid_argument if a factor is < 1.0 or not finite,
    ///         the speed is not positive, or a threshold is invalid
    void validate() const;
};

}  // namespace accessroute
