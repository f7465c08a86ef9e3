#include "accessroute/routing/IPathSearch.h"
#include "AStarSearch.h"
#include "BidirectionalSearch.h"
#include "DijkstraSearch.h"

#include <algorithm>
#include <cctype>
#include <string>

namespace accessroute {

const char* toString(SearchStrategy strategy) {
    switch (strategy) {
        case SearchStrategy::Dijkstra: return "dijkstra";
        case SearchStrategy::Bidirectional: return "bidirectional";
        case SearchStrategy::AStar: return "astar";
    }
    return "unknown";
}

std::optional<SearchStrategy> parseSearchStrategy(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "dijkstra" || lower == "forward") return SearchStrategy::Dijkstra;
    if (lower == "bidirectional" || lower == "bidir") return SearchStrategy::Bidirectional;
    if (lower == "astar" || lower == "a*") return SearchStrategy::AStar;
    return std::nullopt;
}

const char* toString(SearchStatus status) {
    switch (status) {
        case SearchStatus::Found: return "found";
        case SearchStatus::NoRoute: return "no_route";
        case SearchStatus::ExceededBound: return "exceeded_bound";
    }
    return "unknown";
}

bool ExplorationCounter::record(NodeId node) {
    if (node >= seen_.size()) {
        seen_.resize(static_cast<size_t>(node) + 1, 0);
    }
    if (seen_[node]) {
        return false;
    }
    seen_[node] = 1;
    ++count_;
    return true;
}

void ExplorationCounter::reset() {
    seen_.clear();
    count_ = 0;
}

std::unique_ptr<IPathSearch> createPathSearch(SearchStrategy strategy) {
    switch (strategy) {
        case SearchStrategy::Dijkstra:
            return std::make_unique<search::DijkstraSearch>();
        case SearchStrategy::Bidirectional:
            return std::make_unique<search::BidirectionalSearch>();
        case SearchStrategy::AStar:
            return std::make_unique<search::AStarSearch>();
    }
    return nullptr;
}

}  // namespace accessroute
