#include "accessroute/routing/EdgeWeightCalculator.h"

#include <cmath>

namespace accessroute {

std::optional<double> EdgeWeightCalculator::directedIncline(const EdgeAttributes& attributes,
                                                            TraversalDirection direction) {
    if (!attributes.inclinePercent) {
        return std::nullopt;
    }
    return direction == TraversalDirection::Forward ? *attributes.inclinePercent
                                                    : -*attributes.inclinePercent;
}

bool EdgeWeightCalculator::matches(const ExclusionRule& rule, const EdgeAttributes& attributes,
                                   TraversalDirection direction) {
    switch (rule.kind) {
        case ExclusionKind::StepsWithoutRamp:
            return attributes.hasSteps && !attributes.hasRamp;
        case ExclusionKind::WheelchairNo:
            return attributes.wheelchair == WheelchairAccess::No;
        case ExclusionKind::InclineAbove: {
            auto incline = directedIncline(attributes, direction);
            return incline && std::abs(*incline) > rule.threshold;
        }
        case ExclusionKind::WidthBelow:
            return attributes.widthMeters && *attributes.widthMeters < rule.threshold;
        case ExclusionKind::UnpavedSurface:
            return attributes.surface == SurfaceClass::Unpaved;
    }
    return false;
}

std::optional<ExclusionKind> EdgeWeightCalculator::classifyExclusion(
    const EdgeData& edge, const MobilityProfile& profile, TraversalDirection direction) {
    for (const auto& rule : profile.exclusions) {
        if (matches(rule, edge.attributes, direction)) {
            return rule.kind;
        }
    }
    return std::nullopt;
}

double EdgeWeightCalculator::penaltyFactor(const EdgeAttributes& attributes,
                                           const MobilityProfile& profile,
                                           TraversalDirection direction) {
    double factor = profile.surfaceFactor(attributes.surface);
    factor *= profile.slopeFactor(directedIncline(attributes, direction));
    factor *= profile.crossingFactor(attributes.crossing);
    factor *= profile.widthFactor(attributes.widthMeters);
    factor *= profile.accessFactor(attributes.wheelchair);
    if (attributes.hasSteps && !attributes.hasRamp) {
        factor *= profile.factors.steps;
    }
    return factor;
}

std::optional<double> EdgeWeightCalculator::cost(const EdgeData& edge,
                                                 const MobilityProfile& profile,
                                                 TraversalDirection direction) {
    if (classifyExclusion(edge, profile, direction)) {
        return std::nullopt;
    }
    return edge.lengthMeters * penaltyFactor(edge.attributes, profile, direction);
}

}  // namespace accessroute
