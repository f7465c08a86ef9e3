#include "accessroute/routing/WeightedGraphCache.h"
#include "accessroute/common/Logger.h"

#include <chrono>
#include <stdexcept>

namespace accessroute {

WeightedGraphCache::WeightedGraphCache(std::shared_ptr<const PathGraph> graph)
    : graph_(std::move(graph)) {
    if (!graph_) {
        throw std::invalid_argument("WeightedGraphCache requires a graph");
    }
}

std::shared_ptr<const WeightedGraph> WeightedGraphCache::get(const MobilityProfile& profile) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto it = entries_.find(profile.key);
    if (it != entries_.end()) {
        Future future = it->second.future;
        lock.unlock();
        return future.get();
    }
    std::promise<std::shared_ptr<const WeightedGraph>> promise;
    const uint64_t generation = ++nextGeneration_;
    entries_.emplace(profile.key, Entry{promise.get_future().share(), generation});
    lock.unlock();

    try {
        auto start = std::chrono::steady_clock::now();
        auto weighted = std::make_shared<const WeightedGraph>(graph_, profile);
        builds_.fetch_add(1);

        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start).count();
        LOG_INFO("Weighted graph for '{}' built in {:.3f} ms", profile.key, elapsed / 1000.0);

        promise.set_value(weighted);
        return weighted;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to build weighted graph for '{}': {}", profile.key, e.what());
        lock.lock();
        auto failed = entries_.find(profile.key);
        if (failed != entries_.end() && failed->second.generation == generation) {
            entries_.erase(failed);
        }
        lock.unlock();
        promise.set_exception(std::current_exception());
        throw;
    }
}

void WeightedGraphCache::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t WeightedGraphCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace accessroute
