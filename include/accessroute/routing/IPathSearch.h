#pragma once

#include "WeightedGraph.h"

#include <array>
#include <cstddef>
#include <limits>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace accessroute {

/// Available shortest-path strategies
enum class SearchStrategy {
    Dijkstra,       ///< Single-frontier uniform cost search
    Bidirectional,  ///< Dijkstra from both ends, meeting in the middle
    AStar           ///< Dijkstra ordered by g + h
};

constexpr std::array<SearchStrategy, 3> ALL_SEARCH_STRATEGIES = {
    SearchStrategy::Dijkstra, SearchStrategy::Bidirectional, SearchStrategy::AStar};

/// Stable name used in configuration files, CLI flags and reports
const char* toString(SearchStrategy strategy);

/// Accepts "dijkstra", "forward", "bidirectional", "astar", "a*" (case-insensitive)
std::optional<SearchStrategy> parseSearchStrategy(std::string_view name);

enum class SearchStatus {
    Found,
    NoRoute,        ///< Destination unreachable, or an endpoint is missing/isolated
    ExceededBound   ///< A SearchLimits bound was hit before the search finished
};

const char* toString(SearchStatus status);

/// Guards against pathological inputs
struct SearchLimits {
    size_t maxFrontier = 1'000'000;  ///< Priority queue entries (per side)
    size_t maxSettled = 1'000'000;   ///< Nodes finalized

    static SearchLimits unlimited() {
        return {std::numeric_limits<size_t>::max(), std::numeric_limits<size_t>::max()};
    }
};

/// Records every node finalized by a search. Counts distinct nodes.
class ExplorationCounter {
public:
    /// @return true if @p node had not been recorded before
    bool record(NodeId node);

    bool contains(NodeId node) const {
        return node < seen_.size() && seen_[node] != 0;
    }

    size_t count() const { return count_; }

    void reset();

private:
    std::vector<char> seen_;
    size_t count_ = 0;
};

/// Per-call search state. Create a fresh context for every query.
struct SearchContext {
    ExplorationCounter counter;
    SearchLimits limits;

    SearchContext() = default;
    explicit SearchContext(SearchLimits l) : limits(l) {}
};

/// Outcome of a single search
struct SearchResult {
    SearchStatus status = SearchStatus::NoRoute;
    std::vector<NodeId> nodePath;  ///< origin .. destination
    std::vector<EdgeId> edgePath;  ///< nodePath.size() - 1 edges
    double totalCost = 0.0;
    size_t nodesExplored = 0;

    bool found() const { return status == SearchStatus::Found; }
};

/// Abstract interface for shortest-path strategies.
///
/// Implementations are stateless; all per-query state lives in the
/// SearchContext, so one instance may serve concurrent queries.
/// Unreachability is reported through SearchResult::status, never thrown.
class IPathSearch {
public:
    virtual ~IPathSearch() = default;

    /// Find the least-cost path from @p origin to @p destination
    virtual SearchResult find(const WeightedGraph& weighted,
                              NodeId origin,
                              NodeId destination,
                              SearchContext& context) const = 0;

    virtual SearchStrategy strategy() const = 0;

    /// Get algorithm name for debugging/logging
    virtual const char* algorithmName() const = 0;
};

/// Create the implementation for @p strategy
std::unique_ptr<IPathSearch> createPathSearch(SearchStrategy strategy);

}  // namespace accessroute
