#include <gtest/gtest.h>
#include <accessroute/benchmark/BenchmarkReport.h>

#include <nlohmann/json.hpp>

#include <sstream>

using namespace accessroute;
using json = nlohmann::json;

namespace {

BenchmarkRecord makeRecord(const std::string& profile, SearchStrategy strategy,
                           DistanceCategory category, double meanMs, size_t nodes) {
    BenchmarkRecord record;
    record.profile = profile;
    record.strategy = strategy;
    record.origin = "A";
    record.destination = "B";
    record.category = category;
    record.status = SearchStatus::Found;
    record.timing.meanMs = meanMs;
    record.nodesExplored = nodes;
    return record;
}

std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> result;
    std::istringstream in(text);
    for (std::string line; std::getline(in, line);) {
        result.push_back(line);
    }
    return result;
}

}  // namespace

TEST(BenchmarkReportTest, DistanceCategories) {
    EXPECT_EQ(categorizeDistance(0.0), DistanceCategory::Short);
    EXPECT_EQ(categorizeDistance(199.9), DistanceCategory::Short);
    EXPECT_EQ(categorizeDistance(200.0), DistanceCategory::Medium);
    EXPECT_EQ(categorizeDistance(500.0), DistanceCategory::Medium);
    EXPECT_EQ(categorizeDistance(500.1), DistanceCategory::Long);
    EXPECT_STREQ(toString(DistanceCategory::Medium), "medium");
}

TEST(BenchmarkReportTest, TimingStatistics) {
    auto stats = TimingStats::fromSamples({4.0, 1.0, 3.0, 2.0});
    EXPECT_DOUBLE_EQ(stats.minMs, 1.0);
    EXPECT_DOUBLE_EQ(stats.maxMs, 4.0);
    EXPECT_DOUBLE_EQ(stats.meanMs, 2.5);
    EXPECT_DOUBLE_EQ(stats.medianMs, 2.5);
    EXPECT_NEAR(stats.stddevMs, 1.2909944, 1e-6);

    auto single = TimingStats::fromSamples({7.0});
    EXPECT_DOUBLE_EQ(single.medianMs, 7.0);
    EXPECT_DOUBLE_EQ(single.stddevMs, 0.0);

    auto empty = TimingStats::fromSamples({});
    EXPECT_DOUBLE_EQ(empty.meanMs, 0.0);
}

TEST(BenchmarkReportTest, TailPercentiles) {
    // Fewer samples than a percentile needs: fall back to the slowest run
    auto few = TimingStats::fromSamples({4.0, 1.0, 3.0, 2.0});
    EXPECT_DOUBLE_EQ(few.p95Ms, 4.0);
    EXPECT_DOUBLE_EQ(few.p99Ms, 4.0);

    std::vector<double> twenty;
    for (int i = 20; i >= 1; --i) {
        twenty.push_back(static_cast<double>(i));
    }
    auto stats20 = TimingStats::fromSamples(twenty);
    EXPECT_NEAR(stats20.p95Ms, 19.95, 1e-9);
    EXPECT_DOUBLE_EQ(stats20.p99Ms, 20.0);

    std::vector<double> hundred;
    for (int i = 1; i <= 100; ++i) {
        hundred.push_back(static_cast<double>(i));
    }
    auto stats100 = TimingStats::fromSamples(hundred);
    EXPECT_NEAR(stats100.p95Ms, 95.95, 1e-9);
    EXPECT_NEAR(stats100.p99Ms, 99.99, 1e-9);
    EXPECT_LE(stats100.p99Ms, stats100.maxMs);
}

TEST(BenchmarkReportTest, SummaryGroupsSuccessfulRecords) {
    BenchmarkReport report;
    report.records = {
        makeRecord("standard", SearchStrategy::Dijkstra, DistanceCategory::Short, 2.0, 100),
        makeRecord("standard", SearchStrategy::Dijkstra, DistanceCategory::Short, 4.0, 200),
        makeRecord("standard", SearchStrategy::AStar, DistanceCategory::Short, 1.0, 60),
        makeRecord("standard", SearchStrategy::AStar, DistanceCategory::Long, 5.0, 900),
    };
    auto failed = makeRecord("standard", SearchStrategy::AStar, DistanceCategory::Short, 100.0, 5000);
    failed.status = SearchStatus::NoRoute;
    failed.error = "no route";
    report.records.push_back(failed);

    auto rows = report.summarize();
    ASSERT_EQ(rows.size(), 3u);

    EXPECT_EQ(rows[0].strategy, SearchStrategy::Dijkstra);
    EXPECT_EQ(rows[0].category, DistanceCategory::Short);
    EXPECT_EQ(rows[0].samples, 2u);
    EXPECT_DOUBLE_EQ(rows[0].meanTimeMs, 3.0);
    EXPECT_DOUBLE_EQ(rows[0].meanNodesExplored, 150.0);

    EXPECT_EQ(rows[1].strategy, SearchStrategy::AStar);
    EXPECT_EQ(rows[1].samples, 1u);
    EXPECT_DOUBLE_EQ(rows[1].meanNodesExplored, 60.0);

    EXPECT_EQ(rows[2].category, DistanceCategory::Long);
}

TEST(BenchmarkReportTest, NodeSavingsAndSpeedup) {
    BenchmarkReport report;
    report.records = {
        makeRecord("wheelchair", SearchStrategy::Dijkstra, DistanceCategory::Medium, 4.0, 200),
        makeRecord("wheelchair", SearchStrategy::AStar, DistanceCategory::Medium, 1.0, 50),
    };

    ASSERT_TRUE(report.nodeSavingsPercent("wheelchair", DistanceCategory::Medium).has_value());
    EXPECT_DOUBLE_EQ(*report.nodeSavingsPercent("wheelchair", DistanceCategory::Medium), 75.0);
    EXPECT_DOUBLE_EQ(*report.speedup("wheelchair", DistanceCategory::Medium), 4.0);

    EXPECT_FALSE(report.nodeSavingsPercent("wheelchair", DistanceCategory::Long).has_value());
    EXPECT_FALSE(report.speedup("standard", DistanceCategory::Medium).has_value());
}

TEST(BenchmarkReportTest, CsvHasHeaderAndOneRowPerRecord) {
    BenchmarkReport report;
    report.records = {
        makeRecord("standard", SearchStrategy::AStar, DistanceCategory::Short, 0.5, 12),
        makeRecord("elderly", SearchStrategy::Bidirectional, DistanceCategory::Long, 0.7, 30),
    };
    report.records[1].origin = "Reitoria, Bloco \"A\"";
    report.records[0].pathPoints = 17;

    auto rows = lines(report.toCsv());
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0],
              "profile,strategy,origin,destination,straight_line_m,category,status,"
              "mean_ms,median_ms,stddev_ms,min_ms,max_ms,p95_ms,p99_ms,nodes_explored,"
              "route_distance_m,route_cost,path_points,error");
    EXPECT_EQ(rows[1].rfind("standard,astar,A,B,", 0), 0u);
    EXPECT_NE(rows[2].find("\"Reitoria, Bloco \"\"A\"\"\""), std::string::npos);
    EXPECT_NE(rows[2].find(",long,found,"), std::string::npos);
    EXPECT_NE(rows[1].find(",17,"), std::string::npos);
}

TEST(BenchmarkReportTest, JsonCarriesMetadataResultsAndSummary) {
    BenchmarkReport report;
    report.seed = 42;
    report.timestamp = "20260101_120000";
    report.pairCount = 1;
    report.records = {
        makeRecord("standard", SearchStrategy::Dijkstra, DistanceCategory::Short, 2.0, 10),
        makeRecord("standard", SearchStrategy::AStar, DistanceCategory::Short, 1.0, 5),
    };
    report.records[1].status = SearchStatus::ExceededBound;
    report.records[1].error = "search exceeded bound";

    auto j = json::parse(report.toJson());
    EXPECT_EQ(j["metadata"]["seed"], 42);
    EXPECT_EQ(j["metadata"]["timestamp"], "20260101_120000");
    EXPECT_EQ(j["metadata"]["recordCount"], 2);
    ASSERT_EQ(j["results"].size(), 2u);
    EXPECT_EQ(j["results"][0]["strategy"], "dijkstra");
    EXPECT_TRUE(j["results"][0]["timing"].contains("p95Ms"));
    EXPECT_TRUE(j["results"][0]["timing"].contains("p99Ms"));
    EXPECT_EQ(j["results"][0]["pathPoints"], 0);
    EXPECT_FALSE(j["results"][0].contains("error"));
    EXPECT_EQ(j["results"][1]["status"], "exceeded_bound");
    EXPECT_EQ(j["results"][1]["error"], "search exceeded bound");
    ASSERT_EQ(j["summary"].size(), 1u);
    EXPECT_EQ(j["summary"][0]["samples"], 1);
}

TEST(BenchmarkReportTest, SummaryText) {
    BenchmarkReport empty;
    EXPECT_EQ(empty.summaryText(), "No successful benchmark records\n");

    BenchmarkReport report;
    report.records = {
        makeRecord("stroller", SearchStrategy::Dijkstra, DistanceCategory::Short, 2.0, 100),
        makeRecord("stroller", SearchStrategy::AStar, DistanceCategory::Short, 1.0, 40),
    };
    auto text = report.summaryText();
    EXPECT_NE(text.find("stroller / short: A* node savings vs Dijkstra 60.0%, speedup 2.00x"),
              std::string::npos);
}
