#pragma once

#include "accessroute/routing/IPathSearch.h"

#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <queue>
#include <vector>

namespace accessroute {
namespace search {

constexpr double UNREACHED = std::numeric_limits<double>::infinity();

/// Priority queue entry. Equal keys pop in insertion order.
struct QueueEntry {
    double key = 0.0;
    uint64_t sequence = 0;
    NodeId node = INVALID_NODE;

    bool operator>(const QueueEntry& other) const {
        if (key != other.key) {
            return key > other.key;
        }
        return sequence > other.sequence;
    }
};

using MinQueue = std::priority_queue<QueueEntry, std::vector<QueueEntry>, std::greater<QueueEntry>>;

/// Result with @p status and the explored count taken from @p context
SearchResult finish(SearchStatus status, const SearchContext& context);

/// Handles missing endpoints, origin == destination and isolated
/// endpoints. Returns std::nullopt when a real search is needed.
std::optional<SearchResult> resolveTrivial(const WeightedGraph& weighted,
                                           NodeId origin,
                                           NodeId destination,
                                           SearchContext& context);

/// Edges from @p root to @p node following a parent-edge tree
std::vector<EdgeId> traceParents(const PathGraph& graph,
                                 const std::vector<EdgeId>& parentEdge,
                                 NodeId root,
                                 NodeId node);

/// Fill node path and total cost by walking @p edges from @p origin.
/// Costs are summed in travel order so every strategy reports the same
/// total for the same path.
void fillPath(const WeightedGraph& weighted, NodeId origin,
              std::vector<EdgeId> edges, SearchResult& result);

/// Best-first search from origin, ordered by g + heuristic(node).
/// With a zero heuristic this is Dijkstra's algorithm.
template <typename Heuristic>
SearchResult bestFirstSearch(const WeightedGraph& weighted,
                             NodeId origin,
                             NodeId destination,
                             SearchContext& context,
                             Heuristic&& heuristic) {
    if (auto trivial = resolveTrivial(weighted, origin, destination, context)) {
        return *trivial;
    }

    const PathGraph& graph = weighted.graph();
    const auto& edges = graph.edges();
    const size_t nodeCount = graph.nodeCount();

    std::vector<double> dist(nodeCount, UNREACHED);
    std::vector<EdgeId> parentEdge(nodeCount, INVALID_EDGE);
    std::vector<char> settled(nodeCount, 0);
    size_t settledCount = 0;

    MinQueue open;
    uint64_t sequence = 0;

    dist[origin] = 0.0;
    open.push({heuristic(origin), sequence++, origin});

    while (!open.empty()) {
        const NodeId current = open.top().node;
        open.pop();

        if (settled[current]) {
            continue;
        }
        settled[current] = 1;
        context.counter.record(current);

        if (++settledCount > context.limits.maxSettled) {
            return finish(SearchStatus::ExceededBound, context);
        }

        if (current == destination) {
            SearchResult result = finish(SearchStatus::Found, context);
            fillPath(weighted, origin, traceParents(graph, parentEdge, origin, destination), result);
            return result;
        }

        for (EdgeId edge : graph.incidentEdges(current)) {
            auto cost = weighted.cost(edge, current);
            if (!cost) {
                continue;
            }
            const NodeId next = edges[edge].otherEnd(current);
            if (settled[next]) {
                continue;
            }

            const double g = dist[current] + *cost;
            if (g < dist[next]) {
                dist[next] = g;
                parentEdge[next] = edge;
                open.push({g + heuristic(next), sequence++, next});

                if (open.size() > context.limits.maxFrontier) {
                    return finish(SearchStatus::ExceededBound, context);
                }
            }
        }
    }

    return finish(SearchStatus::NoRoute, context);
}

}  // namespace search
}  // namespace accessroute
