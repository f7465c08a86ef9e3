#pragma once

#include "../core/PathGraph.h"
#include "../profile/MobilityProfile.h"

#include <optional>

namespace accessroute {

/// Direction an undirected edge is walked in
enum class TraversalDirection {
    Forward,  ///< from -> to
    Reverse   ///< to -> from
};

/// Profile-specific edge cost.
///
/// Cost is expressed in effort units (meters scaled by penalty factors),
/// not in seconds. The calculator is stateless and never fails: an edge
/// is either passable with a positive finite cost or excluded.
class EdgeWeightCalculator {
public:
    /// @return Cost of walking @p edge in @p direction, or std::nullopt if
    ///         one of the profile's exclusion rules matches
    static std::optional<double> cost(const EdgeData& edge,
                                      const MobilityProfile& profile,
                                      TraversalDirection direction);

    /// First exclusion rule (in declared order) that matches the edge
    static std::optional<ExclusionKind> classifyExclusion(const EdgeData& edge,
                                                          const MobilityProfile& profile,
                                                          TraversalDirection direction);

    /// Product of all soft penalty factors for a passable edge
    static double penaltyFactor(const EdgeAttributes& attributes,
                                const MobilityProfile& profile,
                                TraversalDirection direction);

    /// Incline as experienced when walking in @p direction
    static std::optional<double> directedIncline(const EdgeAttributes& attributes,
                                                 TraversalDirection direction);

    /// Direction of @p edge when leaving @p node
    static TraversalDirection directionFrom(const EdgeData& edge, NodeId node) {
        return edge.from == node ? TraversalDirection::Forward : TraversalDirection::Reverse;
    }

private:
    static bool matches(const ExclusionRule& rule, const EdgeAttributes& attributes,
                        TraversalDirection direction);
};

}  // namespace accessroute
