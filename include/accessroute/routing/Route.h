#pragma once

#include "../core/Types.h"

#include <string>
#include <vector>

namespace accessroute {

/// Computed walking route. A self-contained value: it holds no
/// references into the graph it was computed on.
struct Route {
    std::string profileKey;
    std::vector<NodeId> nodePath;
    std::vector<EdgeId> edgePath;
    Polyline coordinates;          ///< Full geometry in travel order
    double distanceMeters = 0.0;
    double durationSeconds = 0.0;
    long stepCount = 0;
    double totalCost = 0.0;        ///< Weighted cost in effort units

    bool empty() const { return nodePath.empty(); }
    double durationMinutes() const { return durationSeconds / 60.0; }
};

}  // namespace accessroute
