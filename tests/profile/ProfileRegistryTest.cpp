#include <gtest/gtest.h>
#include <accessroute/profile/ProfileRegistry.h>

using namespace accessroute;

TEST(ProfileRegistryTest, BuiltinProfilesInOrder) {
    auto registry = ProfileRegistry::builtin();

    std::vector<std::string> expected = {
        profiles::STANDARD, profiles::WHEELCHAIR, profiles::ELDERLY, profiles::PREGNANT,
        profiles::STROLLER, profiles::TEMPORARY_IMPAIRMENT, profiles::VISUALLY_IMPAIRED};
    EXPECT_EQ(registry.keys(), expected);
    EXPECT_EQ(registry.size(), expected.size());
}

TEST(ProfileRegistryTest, BuiltinProfilesAreValid) {
    auto registry = ProfileRegistry::builtin();
    for (const auto& key : registry.keys()) {
        const auto& profile = registry.get(key);
        EXPECT_EQ(profile.key, key);
        EXPECT_NO_THROW(profile.validate()) << key;
        EXPECT_GE(profile.minimumCostFactor(), 1.0) << key;
    }
}

TEST(ProfileRegistryTest, StandardProfileIsNeutral) {
    const auto& standard = ProfileRegistry::builtin().get(profiles::STANDARD);
    EXPECT_DOUBLE_EQ(standard.baseSpeedMps, 1.4);
    EXPECT_TRUE(standard.exclusions.empty());
    EXPECT_DOUBLE_EQ(standard.factors.steps, 1.0);
    EXPECT_DOUBLE_EQ(standard.surfaceFactor(SurfaceClass::Unpaved), 1.0);
}

TEST(ProfileRegistryTest, WheelchairExcludesStepsAndSteepInclines) {
    auto registry = ProfileRegistry::builtin();
    const auto& wheelchair = registry.get(profiles::WHEELCHAIR);

    EXPECT_TRUE(wheelchair.excludes(ExclusionKind::StepsWithoutRamp));
    EXPECT_TRUE(wheelchair.excludes(ExclusionKind::WheelchairNo));
    EXPECT_TRUE(wheelchair.excludes(ExclusionKind::InclineAbove));
    EXPECT_TRUE(wheelchair.excludes(ExclusionKind::WidthBelow));
    EXPECT_LT(wheelchair.baseSpeedMps, registry.get(profiles::STANDARD).baseSpeedMps);
}

TEST(ProfileRegistryTest, StrollerPenalizesStepsHeavily) {
    const auto& stroller = ProfileRegistry::builtin().get(profiles::STROLLER);
    EXPECT_FALSE(stroller.excludes(ExclusionKind::StepsWithoutRamp));
    EXPECT_GE(stroller.factors.steps, 10.0);
}

TEST(ProfileRegistryTest, FindAndGet) {
    auto registry = ProfileRegistry::builtin();
    EXPECT_TRUE(registry.hasProfile("elderly"));
    EXPECT_NE(registry.find("elderly"), nullptr);
    EXPECT_EQ(registry.find("astronaut"), nullptr);
    EXPECT_FALSE(registry.hasProfile("astronaut"));
    EXPECT_THROW(registry.get("astronaut"), std::out_of_range);
}

TEST(ProfileRegistryTest, RegisterCustomProfile) {
    ProfileRegistry registry;
    MobilityProfile custom;
    custom.key = "cane";
    custom.baseSpeedMps = 0.7;
    custom.factors.steps = 2.5;

    registry.registerProfile(custom);
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_DOUBLE_EQ(registry.get("cane").factors.steps, 2.5);
}

TEST(ProfileRegistryTest, RegisterRejectsDuplicateKey) {
    auto registry = ProfileRegistry::builtin();
    MobilityProfile duplicate;
    duplicate.key = profiles::WHEELCHAIR;
    EXPECT_THROW(registry.registerProfile(duplicate), std::invalid_argument);
    EXPECT_EQ(registry.size(), 7u);
}

TEST(ProfileRegistryTest, RegisterRejectsInvalidProfile) {
    ProfileRegistry registry;
    MobilityProfile invalid;
    invalid.key = "broken";
    invalid.factors.uphill[3] = 0.5;
    EXPECT_THROW(registry.registerProfile(invalid), std::invalid_argument);
    EXPECT_FALSE(registry.hasProfile("broken"));
}
