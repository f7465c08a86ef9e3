#include "accessroute/profile/MobilityProfile.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace accessroute {

namespace {

template <std::size_t N>
double tableMinimum(const std::array<double, N>& table) {
    // Unknown data maps to the neutral factor, so 1.0 is always reachable
    return std::min(1.0, *std::min_element(table.begin(), table.end()));
}

template <std::size_t N>
void validateTable(const std::string& profile, const char* name, const std::array<double, N>& table) {
    for (double factor : table) {
        if (!std::isfinite(factor) || factor < 1.0) {
            throw std::invalid_argument("Profile '" + profile + "': " + name +
                                        " factor must be finite and >= 1.0, got " +
                                        std::to_string(factor));
        }
    }
}

void validateFactor(const std::string& profile, const char* name, double factor) {
    validateTable(profile, name, std::array<double, 1>{factor});
}

}  // namespace

SlopeBand slopeBandFor(double inclinePercent) {
    const double magnitude = std::abs(inclinePercent);
    if (magnitude < GENTLE_SLOPE_PERCENT) return SlopeBand::Flat;
    if (magnitude < MODERATE_SLOPE_PERCENT) return SlopeBand::Gentle;
    if (magnitude < STEEP_SLOPE_PERCENT) return SlopeBand::Moderate;
    return SlopeBand::Steep;
}

WidthBand widthBandFor(double widthMeters) {
    if (widthMeters < RESTRICTED_WIDTH_M) return WidthBand::Narrow;
    if (widthMeters < STANDARD_WIDTH_M) return WidthBand::Restricted;
    return WidthBand::Standard;
}

const char* toString(ExclusionKind kind) {
    switch (kind) {
        case ExclusionKind::StepsWithoutRamp: return "steps_without_ramp";
        case ExclusionKind::WheelchairNo: return "wheelchair_no";
        case ExclusionKind::InclineAbove: return "incline_above";
        case ExclusionKind::WidthBelow: return "width_below";
        case ExclusionKind::UnpavedSurface: return "unpaved_surface";
    }
    return "unknown";
}

double MobilityProfile::surfaceFactor(SurfaceClass surface) const {
    if (surface == SurfaceClass::Unknown) return 1.0;
    return factors.surface[static_cast<std::size_t>(surface)];
}

double MobilityProfile::slopeFactor(std::optional<double> inclinePercent) const {
    if (!inclinePercent) return 1.0;
    const auto band = static_cast<std::size_t>(slopeBandFor(*inclinePercent));
    return *inclinePercent >= 0.0 ? factors.uphill[band] : factors.downhill[band];
}

double MobilityProfile::crossingFactor(CrossingKind crossing) const {
    if (crossing == CrossingKind::Unknown) return 1.0;
    return factors.crossing[static_cast<std::size_t>(crossing)];
}

double MobilityProfile::widthFactor(std::optional<double> widthMeters) const {
    if (!widthMeters) return 1.0;
    return factors.width[static_cast<std::size_t>(widthBandFor(*widthMeters))];
}

double MobilityProfile::accessFactor(WheelchairAccess access) const {
    switch (access) {
        case WheelchairAccess::Limited: return factors.limitedAccess;
        case WheelchairAccess::No: return factors.noAccess;
        default: return 1.0;
    }
}

double MobilityProfile::minimumCostFactor() const {
    double product = 1.0;
    product *= tableMinimum(factors.surface);
    product *= std::min(tableMinimum(factors.uphill), tableMinimum(factors.downhill));
    product *= tableMinimum(factors.crossing);
    product *= tableMinimum(factors.width);
    product *= std::min({1.0, factors.limitedAccess, factors.noAccess});
    product *= std::min(1.0, factors.steps);
    return std::max(1.0, product);
}

bool MobilityProfile::excludes(ExclusionKind kind) const {
    return std::any_of(exclusions.begin(), exclusions.end(),
                       [kind](const ExclusionRule& rule) { return rule.kind == kind; });
}

void MobilityProfile::validate() const {
    if (key.empty()) {
        throw std::invalid_argument("Profile key must not be empty");
    }
    if (!std::isfinite(baseSpeedMps) || baseSpeedMps <= 0.0) {
        throw std::invalid_argument("Profile '" + key + "': base speed must be positive");
    }

    validateTable(key, "surface", factors.surface);
    validateTable(key, "uphill", factors.uphill);
    validateTable(key, "downhill", factors.downhill);
    validateTable(key, "crossing", factors.crossing);
    validateTable(key, "width", factors.width);
    validateFactor(key, "limited access", factors.limitedAccess);
    validateFactor(key, "no access", factors.noAccess);
    validateFactor(key, "steps", factors.steps);

    for (const auto& rule : exclusions) {
        if ((rule.kind == ExclusionKind::InclineAbove || rule.kind == ExclusionKind::WidthBelow) &&
            (!std::isfinite(rule.threshold) || rule.threshold <= 0.0)) {
            throw std::invalid_argument("Profile '" + key + "': " + toString(rule.kind) +
                                        " needs a positive threshold");
        }
    }
}

}  // namespace accessroute
