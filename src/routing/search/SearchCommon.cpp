#include "SearchCommon.h"
#include "accessroute/common/Logger.h"

#include <algorithm>

namespace accessroute {
namespace search {

SearchResult finish(SearchStatus status, const SearchContext& context) {
    SearchResult result;
    result.status = status;
    result.nodesExplored = context.counter.count();
    return result;
}

std::optional<SearchResult> resolveTrivial(const WeightedGraph& weighted,
                                           NodeId origin,
                                           NodeId destination,
                                           SearchContext& context) {
    const PathGraph& graph = weighted.graph();

    if (!graph.hasNode(origin) || !graph.hasNode(destination)) {
        LOG_DEBUG("Search endpoint missing: {} -> {}", origin, destination);
        return finish(SearchStatus::NoRoute, context);
    }

    if (origin == destination) {
        context.counter.record(origin);
        SearchResult result = finish(SearchStatus::Found, context);
        result.nodePath.push_back(origin);
        return result;
    }

    if (!weighted.isNodePassable(origin) || !weighted.isNodePassable(destination)) {
        LOG_DEBUG("Search endpoint has no passable edge for '{}': {} -> {}",
                  weighted.profile().key, origin, destination);
        return finish(SearchStatus::NoRoute, context);
    }

    return std::nullopt;
}

std::vector<EdgeId> traceParents(const PathGraph& graph,
                                 const std::vector<EdgeId>& parentEdge,
                                 NodeId root,
                                 NodeId node) {
    std::vector<EdgeId> path;
    while (node != root) {
        EdgeId edge = parentEdge[node];
        path.push_back(edge);
        node = graph.edges()[edge].otherEnd(node);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

void fillPath(const WeightedGraph& weighted, NodeId origin,
              std::vector<EdgeId> edges, SearchResult& result) {
    const PathGraph& graph = weighted.graph();

    result.nodePath.clear();
    result.nodePath.reserve(edges.size() + 1);
    result.nodePath.push_back(origin);
    result.totalCost = 0.0;

    NodeId current = origin;
    for (EdgeId edge : edges) {
        result.totalCost += weighted.cost(edge, current).value_or(0.0);
        current = graph.edges()[edge].otherEnd(current);
        result.nodePath.push_back(current);
    }
    result.edgePath = std::move(edges);
}

}  // namespace search
}  // namespace accessroute
