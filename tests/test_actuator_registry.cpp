/**
 * @file test_actuator_registry.cpp
 * @brief Registry validation, patching and safety tiers
 *
 * @license MIT
 */

#include <gtest/gtest.h>

#include "ActuatorRegistry.hpp"

namespace {

ActuatorConfig dome() {
    ActuatorConfig config;
    config.channel = 0;
    config.name = "Dome Rotation";
    config.servo_class = ServoClass::Primary;
    config.range_class = RangeClass::Full;
    config.limits.min_position = 600;
    config.limits.max_position = 2400;
    config.limits.safe_min = 800;
    config.limits.safe_max = 2200;
    return config;
}

}  // namespace


TEST(ActuatorRegistry, ConstructorSkipsInvalidConfigs) {
    ActuatorConfig broken = dome();
    broken.channel = 1;
    broken.limits.safe_min = 500;   // below min_position

    ActuatorRegistry registry({dome(), broken});
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_TRUE(registry.contains(0));
    EXPECT_FALSE(registry.contains(1));
}

TEST(ActuatorRegistry, CheckRejectsInvertedAndOverlappingRanges) {
    ActuatorConfig config = dome();
    EXPECT_EQ(checkActuatorConfig(config), "");

    config.limits.min_position = 2400;
    EXPECT_NE(checkActuatorConfig(config), "");

    config = dome();
    config.limits.safe_max = 2400;   // must be strictly inside
    EXPECT_NE(checkActuatorConfig(config), "");

    config = dome();
    config.home_position = 2500;
    EXPECT_NE(checkActuatorConfig(config), "");
}

TEST(ActuatorRegistry, UpsertCreatesChannelWithDefaults) {
    ActuatorRegistry registry({dome()});
    registry.applySafetyTier(SafetyTier::Testing);

    ActuatorPatch patch;
    patch.home_position = 1400;
    RegistryResult result = registry.upsert(7, patch);
    ASSERT_TRUE(result.ok) << result.error;

    auto config = registry.get(7);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->name, "Servo_7");
    EXPECT_EQ(config->home_position, 1400);
    EXPECT_EQ(config->safety_tier, SafetyTier::Testing);
    EXPECT_EQ(config->limits, ActuatorLimits{});
}

TEST(ActuatorRegistry, InvalidPatchLeavesConfigUntouched) {
    ActuatorRegistry registry({dome()});

    ActuatorPatch patch;
    patch.safe_max = 2500;
    RegistryResult result = registry.upsert(0, patch);
    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.error.empty());
    EXPECT_EQ(registry.get(0)->limits.safe_max, 2200);
}

TEST(ActuatorRegistry, ReplaceAllIsAllOrNothing) {
    ActuatorRegistry registry({dome()});

    ActuatorConfig a = dome();
    a.channel = 3;
    ActuatorConfig b = dome();
    b.channel = 3;

    RegistryResult result = registry.replaceAll({a, b});
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.find("Duplicate channel"), std::string::npos);
    EXPECT_TRUE(registry.contains(0));
    EXPECT_FALSE(registry.contains(3));

    result = registry.replaceAll({a});
    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(registry.contains(3));
    ASSERT_TRUE(registry.contains(0));
    EXPECT_FALSE(registry.get(0)->enabled);
}

TEST(ActuatorRegistry, ReplaceAllDisablesAbsentChannels) {
    ActuatorConfig head = dome();
    head.channel = 1;
    head.name = "Head Tilt";
    ActuatorRegistry registry({dome(), head});

    ActuatorConfig updated = dome();
    updated.home_position = 1400;
    ASSERT_TRUE(registry.replaceAll({updated}).ok);

    EXPECT_EQ(registry.size(), 2u);
    EXPECT_TRUE(registry.get(0)->enabled);
    EXPECT_EQ(registry.get(0)->home_position, 1400);

    ASSERT_TRUE(registry.contains(1));
    EXPECT_FALSE(registry.get(1)->enabled);
    EXPECT_EQ(registry.get(1)->name, "Head Tilt");

    // Listing the channel again brings it back
    head.enabled = true;
    ASSERT_TRUE(registry.replaceAll({updated, head}).ok);
    EXPECT_TRUE(registry.get(1)->enabled);
}

TEST(ActuatorRegistry, SafetyTierSetsCeilings) {
    ActuatorRegistry registry({dome()});

    registry.applySafetyTier(SafetyTier::Production);
    EXPECT_DOUBLE_EQ(registry.velocityCeiling(0), 500.0);
    EXPECT_DOUBLE_EQ(registry.accelerationCeiling(0), 1000.0);

    registry.applySafetyTier(SafetyTier::Development);
    EXPECT_DOUBLE_EQ(registry.velocityCeiling(0), 1000.0);
    EXPECT_EQ(registry.safetyTier(), SafetyTier::Development);
    EXPECT_EQ(registry.get(0)->safety_tier, SafetyTier::Development);

    EXPECT_DOUBLE_EQ(registry.velocityCeiling(42), 0.0);
}

TEST(ActuatorRegistry, CeilingsTightenWithEachTier) {
    EXPECT_GT(tierCeiling(SafetyTier::Development).max_velocity, tierCeiling(SafetyTier::Testing).max_velocity);
    EXPECT_GT(tierCeiling(SafetyTier::Testing).max_velocity, tierCeiling(SafetyTier::Production).max_velocity);
    EXPECT_GT(tierCeiling(SafetyTier::Production).max_velocity, tierCeiling(SafetyTier::Demonstration).max_velocity);
    EXPECT_GT(tierCeiling(SafetyTier::Demonstration).max_velocity, tierCeiling(SafetyTier::Emergency).max_velocity);
}
