#pragma once

#include "WeightedGraph.h"

namespace accessroute {

/// Admissible lower bound on the remaining weighted cost.
///
/// Every passable edge costs at least its length times the profile's
/// minimum cost factor, and no edge is shorter than the great-circle
/// chord between its endpoints. The great-circle distance to the target
/// scaled by that factor therefore never overestimates, and it is
/// consistent across edges by the triangle inequality.
class HeuristicEstimator {
public:
    explicit HeuristicEstimator(const WeightedGraph& weighted);

    /// Lower bound on the cost from @p current to @p target.
    /// Returns 0 for unknown nodes.
    double estimate(NodeId current, NodeId target) const;

    double scale() const { return scale_; }

private:
    const PathGraph& graph_;
    double scale_;
};

}  // namespace accessroute
