/**
 * @file test_safety_validator.cpp
 * @brief Admission checks, monitoring, emergency stop and zones
 *
 * @license MIT
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "ActuatorRegistry.hpp"
#include "SafetyValidator.hpp"

namespace {

ActuatorConfig makeChannel(int channel) {
    ActuatorConfig config;
    config.channel = channel;
    config.name = "Servo_" + std::to_string(channel);
    config.limits.min_position = 600;
    config.limits.max_position = 2400;
    config.limits.safe_min = 800;
    config.limits.safe_max = 2200;
    return config;
}

Command moveTo(int channel, double position, int duration_ms) {
    Command command;
    command.channel = channel;
    command.kind = CommandKind::Position;
    command.value = position;
    command.duration_ms = duration_ms;
    return command;
}

bool hasViolation(const SafetyValidator& validator, const std::string& type, Severity severity) {
    auto all = validator.violations();
    return std::any_of(all.begin(), all.end(), [&](const SafetyViolation& v) {
        return v.type == type && v.severity == severity;
    });
}

}  // namespace


class SafetyValidatorTest : public ::testing::Test {
protected:
    SafetyValidatorTest()
        : registry_({makeChannel(0), makeChannel(1)}),
          validator_(registry_)
    {
        registry_.applySafetyTier(SafetyTier::Production);
    }

    ActuatorRegistry registry_;
    SafetyValidator validator_;
};


TEST_F(SafetyValidatorTest, OutOfSafeRangeTargetIsClampedWithWarning) {
    Verdict verdict = validator_.validate(moveTo(0, 2300, 500));

    ASSERT_TRUE(verdict.accepted) << verdict.reason;
    EXPECT_DOUBLE_EQ(verdict.command.value, 2200);
    EXPECT_TRUE(hasViolation(validator_, "position_constrained", Severity::Warning));
    EXPECT_FALSE(validator_.isEmergencyStopped());
}

TEST_F(SafetyValidatorTest, ClampingIsIdempotent) {
    Verdict first = validator_.validate(moveTo(0, 100, 500));
    ASSERT_TRUE(first.accepted);
    std::size_t recorded = validator_.violations().size();

    Verdict second = validator_.validate(first.command);
    ASSERT_TRUE(second.accepted);
    EXPECT_DOUBLE_EQ(second.command.value, first.command.value);
    EXPECT_EQ(validator_.violations().size(), recorded);
}

TEST_F(SafetyValidatorTest, FastMoveFromKnownPositionIsRejected) {
    ASSERT_TRUE(validator_.monitor(1, 1500));

    Verdict verdict = validator_.validate(moveTo(1, 2500, 100));
    EXPECT_FALSE(verdict.accepted);
    EXPECT_EQ(verdict.reason, "velocity limit exceeded");
    EXPECT_TRUE(hasViolation(validator_, "velocity_limit_exceeded", Severity::Warning));
}

TEST_F(SafetyValidatorTest, VelocityUsesExplicitOriginOverLastKnown) {
    ASSERT_TRUE(validator_.monitor(1, 1500));

    // 300 us over 1 s from 1900 is well inside the 500 us/s ceiling
    Verdict verdict = validator_.validate(moveTo(1, 2200, 1000), 1900.0);
    EXPECT_TRUE(verdict.accepted) << verdict.reason;
}

TEST_F(SafetyValidatorTest, ZeroDurationUsesTheMinimumWindow) {
    ASSERT_TRUE(validator_.monitor(0, 1500));

    // 40 us with duration 0 is measured over 100 ms: 400 us/s
    EXPECT_TRUE(validator_.validate(moveTo(0, 1540, 0)).accepted);
    // 60 us over the same window is 600 us/s
    EXPECT_FALSE(validator_.validate(moveTo(0, 1560, 0)).accepted);
}

TEST_F(SafetyValidatorTest, ShortPositiveDurationIsMeasuredAsGiven) {
    ASSERT_TRUE(validator_.monitor(0, 1500));

    // 40 us in 10 ms is 4000 us/s
    Verdict verdict = validator_.validate(moveTo(0, 1540, 10));
    EXPECT_FALSE(verdict.accepted);
    EXPECT_EQ(verdict.reason, "velocity limit exceeded");

    // 40 us in 50 ms is 800 us/s
    EXPECT_FALSE(validator_.validate(moveTo(0, 1540, 50)).accepted);
    // 40 us in 200 ms is 200 us/s
    EXPECT_TRUE(validator_.validate(moveTo(0, 1540, 200)).accepted);
}

TEST_F(SafetyValidatorTest, CheckTargetClampsWithoutVelocity) {
    ASSERT_TRUE(validator_.monitor(0, 1500));

    Verdict verdict = validator_.checkTarget(0, 2350);
    ASSERT_TRUE(verdict.accepted) << verdict.reason;
    EXPECT_DOUBLE_EQ(verdict.command.value, 2200);
    EXPECT_TRUE(hasViolation(validator_, "position_constrained", Severity::Warning));
    EXPECT_FALSE(hasViolation(validator_, "velocity_limit_exceeded", Severity::Warning));

    EXPECT_FALSE(validator_.checkTarget(7, 1500).accepted);

    ASSERT_TRUE(validator_.addSafetyZone("arm_clearance", {1}, 1000, 1600).ok);
    Verdict zoned = validator_.checkTarget(1, 1800);
    EXPECT_FALSE(zoned.accepted);
    EXPECT_NE(zoned.reason.find("arm_clearance"), std::string::npos);
}

TEST_F(SafetyValidatorTest, VelocityCheckSkippedWithoutAnyPosition) {
    Verdict verdict = validator_.validate(moveTo(0, 2000, 0));
    EXPECT_TRUE(verdict.accepted) << verdict.reason;
}

TEST_F(SafetyValidatorTest, UnknownChannelRejectedWithoutViolation) {
    Verdict verdict = validator_.validate(moveTo(9, 1500, 100));
    EXPECT_FALSE(verdict.accepted);
    EXPECT_NE(verdict.reason.find("unknown channel"), std::string::npos);
    EXPECT_TRUE(validator_.violations().empty());
}

TEST_F(SafetyValidatorTest, DisabledChannelRejected) {
    ActuatorPatch patch;
    patch.enabled = false;
    ASSERT_TRUE(registry_.upsert(1, patch).ok);

    Verdict verdict = validator_.validate(moveTo(1, 1500, 100));
    EXPECT_FALSE(verdict.accepted);
    EXPECT_NE(verdict.reason.find("disabled"), std::string::npos);
}

TEST_F(SafetyValidatorTest, SpeedAboveLimitRejected) {
    Command command;
    command.channel = 0;
    command.kind = CommandKind::Speed;
    command.value = 150;   // max_speed defaults to 100

    Verdict verdict = validator_.validate(command);
    EXPECT_FALSE(verdict.accepted);
    EXPECT_TRUE(hasViolation(validator_, "speed_limit_exceeded", Severity::Warning));

    command.value = 80;
    EXPECT_TRUE(validator_.validate(command).accepted);
}

TEST_F(SafetyValidatorTest, ObservedPositionOutsideLimitsTriggersEmergencyStop) {
    EXPECT_FALSE(validator_.monitor(0, 50));

    EXPECT_TRUE(validator_.isEmergencyStopped());
    EXPECT_TRUE(hasViolation(validator_, "position_limit_exceeded", Severity::Critical));

    // Every channel is blocked until reset
    Verdict verdict = validator_.validate(moveTo(1, 1500, 1000));
    EXPECT_FALSE(verdict.accepted);
    EXPECT_EQ(verdict.reason, "emergency stop active");
}

TEST_F(SafetyValidatorTest, EmergencyStopCommandAlwaysAccepted) {
    validator_.triggerEmergencyStop("test");

    Command command;
    command.channel = 0;
    command.kind = CommandKind::EmergencyStop;
    EXPECT_TRUE(validator_.validate(command).accepted);
}

TEST_F(SafetyValidatorTest, EmergencyStopCommandStillNeedsAKnownChannel) {
    Command command;
    command.channel = 9;
    command.kind = CommandKind::EmergencyStop;

    Verdict verdict = validator_.validate(command);
    EXPECT_FALSE(verdict.accepted);
    EXPECT_EQ(verdict.reason, "unknown channel 9");
}

TEST_F(SafetyValidatorTest, ResetRequiresAcknowledgedViolations) {
    ASSERT_FALSE(validator_.monitor(0, 50));

    SafetyResult refused = validator_.resetEmergencyStop();
    EXPECT_FALSE(refused.ok);
    EXPECT_TRUE(validator_.isEmergencyStopped());

    EXPECT_GE(validator_.acknowledgeViolations(), 1u);
    SafetyResult reset = validator_.resetEmergencyStop();
    EXPECT_TRUE(reset.ok) << reset.message;
    EXPECT_FALSE(validator_.isEmergencyStopped());
    EXPECT_EQ(validator_.status().unresolved_critical, 0u);

    EXPECT_TRUE(validator_.validate(moveTo(1, 1500, 1000)).accepted);
}

TEST_F(SafetyValidatorTest, ManualEmergencyStopResetsWithoutAcknowledgment) {
    validator_.triggerEmergencyStop("operator");
    EXPECT_TRUE(validator_.resetEmergencyStop().ok);
    EXPECT_FALSE(validator_.isEmergencyStopped());
}

TEST_F(SafetyValidatorTest, ListenersFireOncePerActivation) {
    std::vector<std::string> reasons;
    validator_.addEmergencyListener([&reasons](const std::string& reason) {
        reasons.push_back(reason);
    });

    validator_.triggerEmergencyStop("first");
    validator_.triggerEmergencyStop("second");
    ASSERT_EQ(reasons.size(), 1u);
    EXPECT_EQ(reasons[0], "first");

    ASSERT_TRUE(validator_.resetEmergencyStop().ok);
    validator_.triggerEmergencyStop("third");
    EXPECT_EQ(reasons.size(), 2u);
}

TEST_F(SafetyValidatorTest, SafetyZoneRejectsWithoutEmergencyStop) {
    ASSERT_TRUE(validator_.addSafetyZone("arm_clearance", {0}, 1000, 1600).ok);

    Verdict verdict = validator_.validate(moveTo(0, 1800, 1000));
    EXPECT_FALSE(verdict.accepted);
    EXPECT_NE(verdict.reason.find("arm_clearance"), std::string::npos);
    EXPECT_TRUE(hasViolation(validator_, "safety_zone_violation", Severity::Critical));
    EXPECT_FALSE(validator_.isEmergencyStopped());

    // Channels outside the zone are unaffected
    EXPECT_TRUE(validator_.validate(moveTo(1, 1800, 1000)).accepted);

    EXPECT_TRUE(validator_.removeSafetyZone("arm_clearance"));
    EXPECT_TRUE(validator_.validate(moveTo(0, 1800, 1000)).accepted);
}

TEST_F(SafetyValidatorTest, ZoneWithInvertedRangeRefused) {
    EXPECT_FALSE(validator_.addSafetyZone("bad", {0}, 1600, 1000).ok);
    EXPECT_TRUE(validator_.safetyZones().empty());
}

TEST_F(SafetyValidatorTest, UnresolvedCriticalRecordsSurvivePruning) {
    ASSERT_FALSE(validator_.monitor(0, 50));
    validator_.validate(moveTo(1, 2300, 1000));   // warning

    validator_.pruneViolations(std::chrono::seconds(0));
    auto remaining = validator_.violations();
    ASSERT_FALSE(remaining.empty());
    for (const auto& v : remaining) {
        EXPECT_EQ(v.severity, Severity::Critical);
        EXPECT_FALSE(v.resolved);
    }
}
