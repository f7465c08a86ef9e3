#pragma once

#include "WeightedGraph.h"

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace accessroute {

/// Lazy once-per-profile cache of weighted graphs.
///
/// The first caller for a profile computes the weighted graph outside the
/// lock; concurrent callers for the same profile wait for that result.
/// A failed computation is not cached.
class WeightedGraphCache {
public:
    /// @throws std::invalid_argument if @p graph is null
    explicit WeightedGraphCache(std::shared_ptr<const PathGraph> graph);

    // Non-copyable
    WeightedGraphCache(const WeightedGraphCache&) = delete;
    WeightedGraphCache& operator=(const WeightedGraphCache&) = delete;

    /// Weighted graph for @p profile, computed on first request
    std::shared_ptr<const WeightedGraph> get(const MobilityProfile& profile);

    /// Drop all cached entries
    void invalidate();

    size_t size() const;

    /// Number of weighted graphs computed since construction
    size_t buildCount() const { return builds_.load(); }

    const std::shared_ptr<const PathGraph>& graph() const { return graph_; }

private:
    using Future = std::shared_future<std::shared_ptr<const WeightedGraph>>;

    struct Entry {
        Future future;
        uint64_t generation = 0;
    };

    std::shared_ptr<const PathGraph> graph_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    uint64_t nextGeneration_ = 0;
    std::atomic<size_t> builds_{0};
};

}  // namespace accessroute
