#include <gtest/gtest.h>
#include <accessroute/routing/EdgeWeightCalculator.h>
#include <accessroute/profile/ProfileRegistry.h>

using namespace accessroute;

class EdgeWeightCalculatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_ = ProfileRegistry::builtin();
        edge_ = EdgeData(0, 1, 10.0);
        edge_.attributes.pathClass = PathClass::Footway;
        edge_.attributes.surface = SurfaceClass::Paved;
    }

    const MobilityProfile& profile(const char* key) const { return registry_.get(key); }

    ProfileRegistry registry_;
    EdgeData edge_;
};

TEST_F(EdgeWeightCalculatorTest, PlainEdgeCostsItsLength) {
    for (const auto& key : registry_.keys()) {
        auto cost = EdgeWeightCalculator::cost(edge_, registry_.get(key), TraversalDirection::Forward);
        ASSERT_TRUE(cost.has_value()) << key;
        EXPECT_DOUBLE_EQ(*cost, 10.0) << key;
    }
}

TEST_F(EdgeWeightCalculatorTest, CostNeverBelowLength) {
    edge_.attributes.surface = SurfaceClass::Rough;
    edge_.attributes.inclinePercent = -6.0;
    edge_.attributes.crossing = CrossingKind::Unmarked;
    edge_.attributes.widthMeters = 1.0;
    edge_.attributes.wheelchair = WheelchairAccess::Limited;

    for (const auto& key : registry_.keys()) {
        for (auto direction : {TraversalDirection::Forward, TraversalDirection::Reverse}) {
            auto cost = EdgeWeightCalculator::cost(edge_, registry_.get(key), direction);
            ASSERT_TRUE(cost.has_value()) << key;
            EXPECT_GE(*cost, edge_.lengthMeters) << key;
        }
    }
}

TEST_F(EdgeWeightCalculatorTest, StepsExcludedForWheelchair) {
    edge_.attributes.hasSteps = true;

    EXPECT_FALSE(EdgeWeightCalculator::cost(edge_, profile(profiles::WHEELCHAIR),
                                            TraversalDirection::Forward).has_value());
    EXPECT_EQ(EdgeWeightCalculator::classifyExclusion(edge_, profile(profiles::WHEELCHAIR),
                                                      TraversalDirection::Forward),
              ExclusionKind::StepsWithoutRamp);
}

TEST_F(EdgeWeightCalculatorTest, RampMakesStepsPassable) {
    edge_.attributes.hasSteps = true;
    edge_.attributes.hasRamp = true;

    auto cost = EdgeWeightCalculator::cost(edge_, profile(profiles::WHEELCHAIR), TraversalDirection::Forward);
    ASSERT_TRUE(cost.has_value());
    EXPECT_DOUBLE_EQ(*cost, 10.0);
}

TEST_F(EdgeWeightCalculatorTest, StepsPenalizedForStroller) {
    edge_.attributes.hasSteps = true;
    const auto& stroller = profile(profiles::STROLLER);

    auto cost = EdgeWeightCalculator::cost(edge_, stroller, TraversalDirection::Forward);
    ASSERT_TRUE(cost.has_value());
    EXPECT_DOUBLE_EQ(*cost, 10.0 * stroller.factors.steps);
}

TEST_F(EdgeWeightCalculatorTest, StandardIgnoresSteps) {
    edge_.attributes.hasSteps = true;
    auto cost = EdgeWeightCalculator::cost(edge_, profile(profiles::STANDARD), TraversalDirection::Forward);
    ASSERT_TRUE(cost.has_value());
    EXPECT_DOUBLE_EQ(*cost, 10.0);
}

TEST_F(EdgeWeightCalculatorTest, WheelchairNoIsExcluded) {
    edge_.attributes.wheelchair = WheelchairAccess::No;
    EXPECT_EQ(EdgeWeightCalculator::classifyExclusion(edge_, profile(profiles::WHEELCHAIR),
                                                      TraversalDirection::Forward),
              ExclusionKind::WheelchairNo);
    EXPECT_TRUE(EdgeWeightCalculator::cost(edge_, profile(profiles::ELDERLY),
                                           TraversalDirection::Forward).has_value());
}

TEST_F(EdgeWeightCalculatorTest, InclineExclusionAppliesBothWays) {
    edge_.attributes.inclinePercent = 14.0;
    const auto& wheelchair = profile(profiles::WHEELCHAIR);

    EXPECT_FALSE(EdgeWeightCalculator::cost(edge_, wheelchair, TraversalDirection::Forward).has_value());
    EXPECT_FALSE(EdgeWeightCalculator::cost(edge_, wheelchair, TraversalDirection::Reverse).has_value());

    edge_.attributes.inclinePercent = 12.0;
    EXPECT_TRUE(EdgeWeightCalculator::cost(edge_, wheelchair, TraversalDirection::Forward).has_value());
}

TEST_F(EdgeWeightCalculatorTest, InclineCostDependsOnDirection) {
    edge_.attributes.inclinePercent = 6.0;
    const auto& wheelchair = profile(profiles::WHEELCHAIR);

    auto up = EdgeWeightCalculator::cost(edge_, wheelchair, TraversalDirection::Forward);
    auto down = EdgeWeightCalculator::cost(edge_, wheelchair, TraversalDirection::Reverse);
    ASSERT_TRUE(up && down);
    EXPECT_DOUBLE_EQ(*up, 10.0 * wheelchair.factors.uphill[2]);
    EXPECT_DOUBLE_EQ(*down, 10.0 * wheelchair.factors.downhill[2]);
    EXPECT_GT(*up, *down);
}

TEST_F(EdgeWeightCalculatorTest, DirectedIncline) {
    edge_.attributes.inclinePercent = 4.0;
    EXPECT_DOUBLE_EQ(*EdgeWeightCalculator::directedIncline(edge_.attributes, TraversalDirection::Forward), 4.0);
    EXPECT_DOUBLE_EQ(*EdgeWeightCalculator::directedIncline(edge_.attributes, TraversalDirection::Reverse), -4.0);

    edge_.attributes.inclinePercent.reset();
    EXPECT_FALSE(EdgeWeightCalculator::directedIncline(edge_.attributes, TraversalDirection::Forward));
}

TEST_F(EdgeWeightCalculatorTest, UnknownWidthNeverExcluded) {
    const auto& wheelchair = profile(profiles::WHEELCHAIR);
    EXPECT_TRUE(EdgeWeightCalculator::cost(edge_, wheelchair, TraversalDirection::Forward).has_value());

    edge_.attributes.widthMeters = 0.7;
    EXPECT_EQ(EdgeWeightCalculator::classifyExclusion(edge_, wheelchair, TraversalDirection::Forward),
              ExclusionKind::WidthBelow);
}

TEST_F(EdgeWeightCalculatorTest, FirstMatchingRuleIsReported) {
    edge_.attributes.hasSteps = true;
    edge_.attributes.wheelchair = WheelchairAccess::No;
    EXPECT_EQ(EdgeWeightCalculator::classifyExclusion(edge_, profile(profiles::WHEELCHAIR),
                                                      TraversalDirection::Forward),
              ExclusionKind::StepsWithoutRamp);
}

TEST_F(EdgeWeightCalculatorTest, FactorsMultiply) {
    edge_.attributes.surface = SurfaceClass::Rough;
    edge_.attributes.crossing = CrossingKind::Unmarked;
    const auto& wheelchair = profile(profiles::WHEELCHAIR);

    auto cost = EdgeWeightCalculator::cost(edge_, wheelchair, TraversalDirection::Forward);
    ASSERT_TRUE(cost.has_value());
    EXPECT_DOUBLE_EQ(*cost, 10.0 * wheelchair.factors.surface[1] * wheelchair.factors.crossing[2]);
}

TEST_F(EdgeWeightCalculatorTest, DirectionFromNode) {
    EXPECT_EQ(EdgeWeightCalculator::directionFrom(edge_, 0), TraversalDirection::Forward);
    EXPECT_EQ(EdgeWeightCalculator::directionFrom(edge_, 1), TraversalDirection::Reverse);
}
