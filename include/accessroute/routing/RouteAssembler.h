#pragma once

#include "Route.h"
#include "../core/PathGraph.h"
#include "../profile/MobilityProfile.h"

#include <vector>

namespace accessroute {

/// Average adult stride used to estimate step counts (meters)
constexpr double DEFAULT_STRIDE_LENGTH_M = 0.75;

/// Turns a node/edge path into a Route with geometry, distance, time and steps
class RouteAssembler {
public:
    /// @throws std::invalid_argument if @p strideLengthMeters is not positive
    explicit RouteAssembler(double strideLengthMeters = DEFAULT_STRIDE_LENGTH_M);

    /// Assemble a route.
    ///
    /// Edge geometry walked against its stored orientation is reversed and
    /// shared endpoints appear once. Time applies the profile's surface and
    /// slope factors to the walking time of each edge.
    ///
    /// @throws std::invalid_argument if the paths are empty, inconsistent
    ///         with each other, or reference unknown ids
    Route assemble(const PathGraph& graph,
                   const MobilityProfile& profile,
                   const std::vector<NodeId>& nodePath,
                   const std::vector<EdgeId>& edgePath,
                   double totalCost) const;

    double strideLength() const { return strideLength_; }

private:
    static void appendPoint(Polyline& line, const GeoPoint& point);

    double strideLength_;
};

}  // namespace accessroute
