#include <accessroute/accessroute.h>

// Internal headers for detailed benchmarking
#include "routing/search/SearchCommon.h"

#include "../infrastructure/TestGraphs.h"

#include <benchmark/benchmark.h>

#include <algorithm>
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

using namespace accessroute;

// ============================================================================
// Test Data Generation
// ============================================================================

class SearchFixture : public benchmark::Fixture {
protected:
    void SetUp(const ::benchmark::State& state) override {
        const int side = static_cast<int>(state.range(0));
        graph_ = test::makeCampusGrid(side, side, 25.0, 42);
        registry_ = ProfileRegistry::builtin();
        weighted_ = std::make_shared<WeightedGraph>(graph_, registry_.get(profiles::WHEELCHAIR));

        std::mt19937 rng(42);  // Fixed seed for reproducibility
        std::uniform_int_distribution<NodeId> pick(0, static_cast<NodeId>(graph_->nodeCount() - 1));
        pairs_.clear();
        for (int i = 0; i < 32; ++i) {
            NodeId a = pick(rng);
            NodeId b = pick(rng);
            while (b == a) {
                b = pick(rng);
            }
            pairs_.emplace_back(a, b);
        }
    }

    void TearDown(const ::benchmark::State& /*state*/) override {
        pairs_.clear();
        weighted_.reset();
        graph_.reset();
    }

    void runStrategy(benchmark::State& state, SearchStrategy strategy) {
        auto search = createPathSearch(strategy);
        size_t explored = 0;
        size_t queries = 0;
        size_t index = 0;

        for (auto _ : state) {
            const auto& [origin, destination] = pairs_[index++ % pairs_.size()];
            SearchContext context;
            auto result = search->find(*weighted_, origin, destination, context);
            benchmark::DoNotOptimize(result);
            explored += result.nodesExplored;
            ++queries;
        }

        state.counters["nodes_explored"] =
            benchmark::Counter(static_cast<double>(explored) / static_cast<double>(std::max<size_t>(queries, 1)));
        state.SetLabel(std::string(search->algorithmName()) + ", " +
                       std::to_string(graph_->nodeCount()) + " nodes");
    }

    std::shared_ptr<PathGraph> graph_;
    ProfileRegistry registry_;
    std::shared_ptr<WeightedGraph> weighted_;
    std::vector<std::pair<NodeId, NodeId>> pairs_;
};

// ============================================================================
// Strategy Comparison
// ============================================================================

BENCHMARK_DEFINE_F(SearchFixture, Dijkstra)(benchmark::State& state) {
    runStrategy(state, SearchStrategy::Dijkstra);
}

BENCHMARK_DEFINE_F(SearchFixture, Bidirectional)(benchmark::State& state) {
    runStrategy(state, SearchStrategy::Bidirectional);
}

BENCHMARK_DEFINE_F(SearchFixture, AStar)(benchmark::State& state) {
    runStrategy(state, SearchStrategy::AStar);
}

// Register with different grid sides: side x side nodes
BENCHMARK_REGISTER_F(SearchFixture, Dijkstra)
    ->Arg(20)    // Small
    ->Arg(50)    // Medium
    ->Arg(100);  // Large

BENCHMARK_REGISTER_F(SearchFixture, Bidirectional)
    ->Arg(20)
    ->Arg(50)
    ->Arg(100);

BENCHMARK_REGISTER_F(SearchFixture, AStar)
    ->Arg(20)
    ->Arg(50)
    ->Arg(100);

// ============================================================================
// Weighted Graph Construction
// ============================================================================

static void BM_WeightedGraph_Build(benchmark::State& state) {
    const int side = static_cast<int>(state.range(0));
    auto graph = test::makeCampusGrid(side, side, 25.0, 42);
    auto registry = ProfileRegistry::builtin();
    const auto& profile = registry.get(profiles::STROLLER);

    for (auto _ : state) {
        WeightedGraph weighted(graph, profile);
        benchmark::DoNotOptimize(weighted.excludedEdgeCount());
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(graph->edgeCount()));
}

BENCHMARK(BM_WeightedGraph_Build)
    ->Arg(20)
    ->Arg(100);

// ============================================================================
// Path Reconstruction
// ============================================================================

static void BM_FillPath(benchmark::State& state) {
    auto graph = test::makeLineGraph(static_cast<int>(state.range(0)), 10.0);
    WeightedGraph weighted(graph, ProfileRegistry::builtin().get(profiles::STANDARD));

    std::vector<EdgeId> edges(graph->edgeCount());
    for (size_t i = 0; i < edges.size(); ++i) {
        edges[i] = static_cast<EdgeId>(i);
    }

    for (auto _ : state) {
        SearchResult result;
        search::fillPath(weighted, 0, edges, result);
        benchmark::DoNotOptimize(result.totalCost);
    }
}

BENCHMARK(BM_FillPath)
    ->Arg(100)
    ->Arg(1000);
