#include "BidirectionalSearch.h"
#include "SearchCommon.h"

#include <algorithm>

namespace accessroute {
namespace search {

namespace {

/// Per-direction search state
struct Frontier {
    std::vector<double> dist;
    std::vector<EdgeId> parentEdge;
    std::vector<char> settled;
    MinQueue open;

    explicit Frontier(size_t nodeCount)
        : dist(nodeCount, UNREACHED),
          parentEdge(nodeCount, INVALID_EDGE),
          settled(nodeCount, 0) {}

    /// Key of the first live entry, discarding stale ones
    double topKey() {
        while (!open.empty() && settled[open.top().node]) {
            open.pop();
        }
        return open.empty() ? UNREACHED : open.top().key;
    }
};

}  // namespace

SearchResult BidirectionalSearch::find(const WeightedGraph& weighted,
                                       NodeId origin,
                                       NodeId destination,
                                       SearchContext& context) const {
    if (auto trivial = resolveTrivial(weighted, origin, destination, context)) {
        return *trivial;
    }

    const PathGraph& graph = weighted.graph();
    const auto& edges = graph.edges();
    const size_t nodeCount = graph.nodeCount();

    Frontier forward(nodeCount);
    Frontier backward(nodeCount);
    uint64_t sequence = 0;
    size_t settledCount = 0;

    forward.dist[origin] = 0.0;
    forward.open.push({0.0, sequence++, origin});
    backward.dist[destination] = 0.0;
    backward.open.push({0.0, sequence++, destination});

    double best = UNREACHED;
    NodeId meeting = INVALID_NODE;

    while (true) {
        const double topForward = forward.topKey();
        const double topBackward = backward.topKey();
        if (topForward == UNREACHED || topBackward == UNREACHED) {
            break;
        }
        if (topForward + topBackward >= best) {
            break;
        }

        const bool expandForward = topForward <= topBackward;
        Frontier& side = expandForward ? forward : backward;
        Frontier& other = expandForward ? backward : forward;

        const NodeId current = side.open.top().node;
        side.open.pop();
        side.settled[current] = 1;
        context.counter.record(current);

        if (++settledCount > context.limits.maxSettled) {
            return finish(SearchStatus::ExceededBound, context);
        }

        for (EdgeId edge : graph.incidentEdges(current)) {
            const NodeId next = edges[edge].otherEnd(current);
            // Backward side walks each edge towards the node being expanded
            auto cost = expandForward ? weighted.cost(edge, current) : weighted.cost(edge, next);
            if (!cost || side.settled[next]) {
                continue;
            }

            const double g = side.dist[current] + *cost;
            if (g < side.dist[next]) {
                side.dist[next] = g;
                side.parentEdge[next] = edge;
                side.open.push({g, sequence++, next});

                if (side.open.size() > context.limits.maxFrontier) {
                    return finish(SearchStatus::ExceededBound, context);
                }
            }

            if (other.dist[next] != UNREACHED && g + other.dist[next] < best) {
                best = g + other.dist[next];
                meeting = next;
            }
        }
    }

    if (meeting == INVALID_NODE) {
        return finish(SearchStatus::NoRoute, context);
    }

    std::vector<EdgeId> path = traceParents(graph, forward.parentEdge, origin, meeting);
    std::vector<EdgeId> tail = traceParents(graph, backward.parentEdge, destination, meeting);
    path.insert(path.end(), tail.rbegin(), tail.rend());

    SearchResult result = finish(SearchStatus::Found, context);
    fillPath(weighted, origin, std::move(path), result);
    return result;
}

}  // namespace search
}  // namespace accessroute
