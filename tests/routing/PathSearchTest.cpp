#include <gtest/gtest.h>
#include <accessroute/routing/IPathSearch.h>
#include <accessroute/profile/ProfileRegistry.h>

#include "../infrastructure/TestGraphs.h"

#include <random>

using namespace accessroute;
using namespace accessroute::test;

class PathSearchTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (SearchStrategy strategy : ALL_SEARCH_STRATEGIES) {
            searches_.push_back(createPathSearch(strategy));
        }
    }

    const MobilityProfile& profile(const char* key) const { return registry_.get(key); }

    static SearchResult run(const IPathSearch& search, const WeightedGraph& weighted,
                            NodeId origin, NodeId destination,
                            SearchLimits limits = SearchLimits{}) {
        SearchContext context(limits);
        auto result = search.find(weighted, origin, destination, context);
        EXPECT_EQ(result.nodesExplored, context.counter.count());
        return result;
    }

    ProfileRegistry registry_ = ProfileRegistry::builtin();
    std::vector<std::unique_ptr<IPathSearch>> searches_;
};

TEST_F(PathSearchTest, FactoryMatchesStrategy) {
    for (size_t i = 0; i < ALL_SEARCH_STRATEGIES.size(); ++i) {
        EXPECT_EQ(searches_[i]->strategy(), ALL_SEARCH_STRATEGIES[i]);
        EXPECT_NE(std::string(searches_[i]->algorithmName()), "");
    }
}

TEST_F(PathSearchTest, StrategyNames) {
    EXPECT_STREQ(toString(SearchStrategy::Dijkstra), "dijkstra");
    EXPECT_STREQ(toString(SearchStrategy::Bidirectional), "bidirectional");
    EXPECT_STREQ(toString(SearchStrategy::AStar), "astar");

    EXPECT_EQ(parseSearchStrategy("A*"), SearchStrategy::AStar);
    EXPECT_EQ(parseSearchStrategy("BIDIR"), SearchStrategy::Bidirectional);
    EXPECT_EQ(parseSearchStrategy("forward"), SearchStrategy::Dijkstra);
    EXPECT_FALSE(parseSearchStrategy("bfs").has_value());

    for (SearchStrategy strategy : ALL_SEARCH_STRATEGIES) {
        EXPECT_EQ(parseSearchStrategy(toString(strategy)), strategy);
    }
}

TEST_F(PathSearchTest, ExplorationCounterCountsDistinctNodes) {
    ExplorationCounter counter;
    EXPECT_TRUE(counter.record(3));
    EXPECT_FALSE(counter.record(3));
    EXPECT_TRUE(counter.record(0));
    EXPECT_EQ(counter.count(), 2u);
    EXPECT_TRUE(counter.contains(3));
    EXPECT_FALSE(counter.contains(1));

    counter.reset();
    EXPECT_EQ(counter.count(), 0u);
    EXPECT_FALSE(counter.contains(3));
}

TEST_F(PathSearchTest, StandardProfileTakesStairs) {
    auto scenario = makeStairsScenario();
    WeightedGraph weighted(scenario.graph, profile(profiles::STANDARD));

    for (const auto& search : searches_) {
        auto result = run(*search, weighted, scenario.a, scenario.b);
        ASSERT_TRUE(result.found()) << search->algorithmName();
        EXPECT_EQ(result.edgePath, std::vector<EdgeId>{scenario.stairs}) << search->algorithmName();
        EXPECT_DOUBLE_EQ(result.totalCost, 10.0);
    }
}

TEST_F(PathSearchTest, WheelchairAndStrollerTakeRamp) {
    auto scenario = makeStairsScenario();
    const std::vector<NodeId> rampNodes = {scenario.a, scenario.c, scenario.b};
    const std::vector<EdgeId> rampEdges = {scenario.rampFirst, scenario.rampSecond};

    for (const char* key : {profiles::WHEELCHAIR, profiles::STROLLER}) {
        WeightedGraph weighted(scenario.graph, profile(key));
        for (const auto& search : searches_) {
            auto result = run(*search, weighted, scenario.a, scenario.b);
            ASSERT_TRUE(result.found()) << key << " / " << search->algorithmName();
            EXPECT_EQ(result.nodePath, rampNodes) << key << " / " << search->algorithmName();
            EXPECT_EQ(result.edgePath, rampEdges) << key << " / " << search->algorithmName();
            EXPECT_DOUBLE_EQ(result.totalCost, 40.0);
        }
    }
}

TEST_F(PathSearchTest, ReverseQueryMirrorsPath) {
    auto scenario = makeStairsScenario();
    WeightedGraph weighted(scenario.graph, profile(profiles::WHEELCHAIR));

    for (const auto& search : searches_) {
        auto result = run(*search, weighted, scenario.b, scenario.a);
        ASSERT_TRUE(result.found());
        EXPECT_EQ(result.nodePath, (std::vector<NodeId>{scenario.b, scenario.c, scenario.a}));
    }
}

TEST_F(PathSearchTest, StrategiesAgreeOnCost) {
    auto graph = makeCampusGrid(15, 15, 30.0, 2024);
    std::mt19937 rng(42);
    std::uniform_int_distribution<NodeId> pick(0, static_cast<NodeId>(graph->nodeCount() - 1));

    for (const auto& key : registry_.keys()) {
        WeightedGraph weighted(graph, registry_.get(key));
        for (int i = 0; i < 20; ++i) {
            NodeId origin = pick(rng);
            NodeId destination = pick(rng);

            auto reference = run(*searches_[0], weighted, origin, destination);
            for (size_t s = 1; s < searches_.size(); ++s) {
                auto result = run(*searches_[s], weighted, origin, destination);
                ASSERT_EQ(result.status, reference.status)
                    << key << " / " << searches_[s]->algorithmName() << ": " << origin << " -> " << destination;
                if (result.found()) {
                    EXPECT_NEAR(result.totalCost, reference.totalCost, 1e-6 * reference.totalCost + 1e-9)
                        << key << " / " << searches_[s]->algorithmName();
                }
            }
        }
    }
}

TEST_F(PathSearchTest, PathsAreConnectedAndAvoidExcludedEdges) {
    auto graph = makeCampusGrid(15, 15, 30.0, 77);
    std::mt19937 rng(42);
    std::uniform_int_distribution<NodeId> pick(0, static_cast<NodeId>(graph->nodeCount() - 1));
    WeightedGraph weighted(graph, profile(profiles::WHEELCHAIR));

    int found = 0;
    for (int i = 0; i < 30; ++i) {
        NodeId origin = pick(rng);
        NodeId destination = pick(rng);
        for (const auto& search : searches_) {
            auto result = run(*search, weighted, origin, destination);
            if (!result.found()) {
                continue;
            }
            ++found;
            ASSERT_EQ(result.nodePath.size(), result.edgePath.size() + 1);
            EXPECT_EQ(result.nodePath.front(), origin);
            EXPECT_EQ(result.nodePath.back(), destination);

            double total = 0.0;
            for (size_t e = 0; e < result.edgePath.size(); ++e) {
                const auto& edge = graph->getEdge(result.edgePath[e]);
                const NodeId from = result.nodePath[e];
                EXPECT_EQ(edge.otherEnd(from), result.nodePath[e + 1]);

                auto cost = weighted.cost(edge.id, from);
                ASSERT_TRUE(cost.has_value()) << "excluded edge " << edge.id << " used";
                EXPECT_FALSE(EdgeWeightCalculator::classifyExclusion(
                    edge, weighted.profile(), EdgeWeightCalculator::directionFrom(edge, from)).has_value());
                total += *cost;
            }
            EXPECT_DOUBLE_EQ(total, result.totalCost);
        }
    }
    EXPECT_GT(found, 0);
}

TEST_F(PathSearchTest, ExploredCountWithinBounds) {
    auto graph = makeCampusGrid(10, 10, 30.0, 31);
    WeightedGraph weighted(graph, profile(profiles::STANDARD));
    const NodeId last = static_cast<NodeId>(graph->nodeCount() - 1);

    for (const auto& search : searches_) {
        auto result = run(*search, weighted, 0, last);
        ASSERT_TRUE(result.found());
        EXPECT_GE(result.nodesExplored, 1u);
        EXPECT_LE(result.nodesExplored, graph->nodeCount());
    }
}

TEST_F(PathSearchTest, AStarExploresNoMoreThanDijkstraOverall) {
    auto graph = makeCampusGrid(20, 20, 30.0, 8);
    WeightedGraph weighted(graph, profile(profiles::STANDARD));
    std::mt19937 rng(42);
    std::uniform_int_distribution<NodeId> pick(0, static_cast<NodeId>(graph->nodeCount() - 1));

    auto dijkstra = createPathSearch(SearchStrategy::Dijkstra);
    auto astar = createPathSearch(SearchStrategy::AStar);

    size_t dijkstraTotal = 0;
    size_t astarTotal = 0;
    for (int i = 0; i < 30; ++i) {
        NodeId origin = pick(rng);
        NodeId destination = pick(rng);
        dijkstraTotal += run(*dijkstra, weighted, origin, destination).nodesExplored;
        astarTotal += run(*astar, weighted, origin, destination).nodesExplored;
    }
    EXPECT_LE(astarTotal, dijkstraTotal);
}

TEST_F(PathSearchTest, SameOriginAndDestination) {
    auto graph = makeLineGraph(3, 20.0);
    WeightedGraph weighted(graph, profile(profiles::STANDARD));

    for (const auto& search : searches_) {
        auto result = run(*search, weighted, 1, 1);
        ASSERT_TRUE(result.found());
        EXPECT_EQ(result.nodePath, std::vector<NodeId>{1});
        EXPECT_TRUE(result.edgePath.empty());
        EXPECT_DOUBLE_EQ(result.totalCost, 0.0);
        EXPECT_EQ(result.nodesExplored, 1u);
    }
}

TEST_F(PathSearchTest, DisconnectedGraphHasNoRoute) {
    auto graph = makeDisconnectedGraph();
    WeightedGraph weighted(graph, profile(profiles::STANDARD));

    for (const auto& search : searches_) {
        auto result = run(*search, weighted, 0, 4);
        EXPECT_EQ(result.status, SearchStatus::NoRoute) << search->algorithmName();
        EXPECT_TRUE(result.nodePath.empty());
        EXPECT_LE(result.nodesExplored, graph->nodeCount());
    }
}

TEST_F(PathSearchTest, MissingEndpointHasNoRoute) {
    auto graph = makeLineGraph(3, 20.0);
    WeightedGraph weighted(graph, profile(profiles::STANDARD));

    for (const auto& search : searches_) {
        EXPECT_EQ(run(*search, weighted, 0, 17).status, SearchStatus::NoRoute);
        EXPECT_EQ(run(*search, weighted, INVALID_NODE, 1).status, SearchStatus::NoRoute);
    }
}

TEST_F(PathSearchTest, EndpointBehindStairsHasNoRouteForWheelchair) {
    auto graph = std::make_shared<PathGraph>();
    NodeId a = graph->addNode(CAMPUS_ORIGIN);
    NodeId b = graph->addNode(offsetMeters(CAMPUS_ORIGIN, 8.0, 0.0));
    addEdge(*graph, a, b, 10.0, stairway());
    WeightedGraph weighted(graph, profile(profiles::WHEELCHAIR));

    for (const auto& search : searches_) {
        auto result = run(*search, weighted, a, b);
        EXPECT_EQ(result.status, SearchStatus::NoRoute);
        EXPECT_EQ(result.nodesExplored, 0u);
    }
}

TEST_F(PathSearchTest, StairsBridgeSplitsGraphForWheelchair) {
    // 0 - 1 - 2 =stairs= 3 - 4 - 5, both halves passable on their own
    auto graph = std::make_shared<PathGraph>();
    std::vector<NodeId> nodes;
    for (int i = 0; i < 6; ++i) {
        nodes.push_back(graph->addNode(offsetMeters(CAMPUS_ORIGIN, 0.0, 20.0 * i)));
    }
    for (size_t i = 0; i + 1 < nodes.size(); ++i) {
        addEdge(*graph, nodes[i], nodes[i + 1], 25.0, i == 2 ? stairway() : pavedFootway());
    }

    WeightedGraph wheelchair(graph, profile(profiles::WHEELCHAIR));
    for (const auto& search : searches_) {
        auto result = run(*search, wheelchair, nodes[0], nodes[5]);
        EXPECT_EQ(result.status, SearchStatus::NoRoute) << search->algorithmName();
        EXPECT_TRUE(result.nodePath.empty());
        EXPECT_TRUE(result.edgePath.empty());
        EXPECT_GE(result.nodesExplored, 1u);
        if (search->strategy() == SearchStrategy::Bidirectional) {
            // Each frontier drains its own half
            EXPECT_LE(result.nodesExplored, graph->nodeCount()) << search->algorithmName();
        } else {
            EXPECT_LE(result.nodesExplored, 3u) << search->algorithmName();
        }
    }

    WeightedGraph standard(graph, profile(profiles::STANDARD));
    for (const auto& search : searches_) {
        auto result = run(*search, standard, nodes[0], nodes[5]);
        ASSERT_TRUE(result.found()) << search->algorithmName();
        EXPECT_EQ(result.edgePath.size(), 5u);
    }
}

TEST_F(PathSearchTest, ParallelEdgesPickCheapest) {
    auto graph = std::make_shared<PathGraph>();
    NodeId a = graph->addNode(CAMPUS_ORIGIN);
    NodeId b = graph->addNode(offsetMeters(CAMPUS_ORIGIN, 10.0, 0.0));

    EdgeAttributes gravel = pavedFootway();
    gravel.surface = SurfaceClass::Unpaved;
    addEdge(*graph, a, b, 12.0, gravel);                  // wheelchair: 24
    EdgeId paved = addEdge(*graph, b, a, 15.0, pavedFootway());  // wheelchair: 15

    WeightedGraph weighted(graph, profile(profiles::WHEELCHAIR));
    for (const auto& search : searches_) {
        auto result = run(*search, weighted, a, b);
        ASSERT_TRUE(result.found());
        EXPECT_EQ(result.edgePath, std::vector<EdgeId>{paved});
        EXPECT_DOUBLE_EQ(result.totalCost, 15.0);
    }
}

TEST_F(PathSearchTest, AsymmetricInclineCost) {
    auto graph = std::make_shared<PathGraph>();
    NodeId a = graph->addNode(CAMPUS_ORIGIN);
    NodeId b = graph->addNode(offsetMeters(CAMPUS_ORIGIN, 9.0, 0.0));
    EdgeAttributes slope = pavedFootway();
    slope.inclinePercent = 6.0;
    addEdge(*graph, a, b, 10.0, slope);

    const auto& wheelchair = profile(profiles::WHEELCHAIR);
    WeightedGraph weighted(graph, wheelchair);
    for (const auto& search : searches_) {
        EXPECT_DOUBLE_EQ(run(*search, weighted, a, b).totalCost, 10.0 * wheelchair.factors.uphill[2]);
        EXPECT_DOUBLE_EQ(run(*search, weighted, b, a).totalCost, 10.0 * wheelchair.factors.downhill[2]);
    }
}

TEST_F(PathSearchTest, SettledLimitReportsExceededBound) {
    auto graph = makeLineGraph(50, 20.0);
    WeightedGraph weighted(graph, profile(profiles::STANDARD));

    SearchLimits limits;
    limits.maxSettled = 3;
    for (const auto& search : searches_) {
        auto result = run(*search, weighted, 0, 49, limits);
        EXPECT_EQ(result.status, SearchStatus::ExceededBound) << search->algorithmName();
        EXPECT_TRUE(result.nodePath.empty());
    }
}

TEST_F(PathSearchTest, FrontierLimitReportsExceededBound) {
    auto graph = makeCampusGrid(10, 10, 30.0, 4);
    WeightedGraph weighted(graph, profile(profiles::STANDARD));

    SearchLimits limits;
    limits.maxFrontier = 1;
    for (const auto& search : searches_) {
        auto result = run(*search, weighted, 0, static_cast<NodeId>(graph->nodeCount() - 1), limits);
        EXPECT_EQ(result.status, SearchStatus::ExceededBound) << search->algorithmName();
    }
}

TEST_F(PathSearchTest, UnlimitedSearchCompletes) {
    auto graph = makeLineGraph(200, 5.0);
    WeightedGraph weighted(graph, profile(profiles::STANDARD));

    for (const auto& search : searches_) {
        auto result = run(*search, weighted, 0, 199, SearchLimits::unlimited());
        ASSERT_TRUE(result.found());
        EXPECT_EQ(result.edgePath.size(), 199u);
    }
}
