/**
 * @file test_pigpio_driver.cpp
 * @brief Pin-level behaviour of the pigpio backend
 *
 * Needs a running pigpiod; every test skips when the daemon is not
 * reachable. Drives GPIO 21 only, leave it unconnected or on a spare servo.
 *
 * @license MIT
 */

#include <gtest/gtest.h>

#include <pigpiod_if2.h>

#include <vector>

#include "PigpioDriver.hpp"
#include "ServoController.hpp"

namespace {

constexpr int TEST_GPIO = 21;

ActuatorConfig testChannel() {
    ActuatorConfig config;
    config.channel = 0;
    config.name = "Bench Servo";
    config.home_position = 1500;
    config.limits.min_position = 600;
    config.limits.max_position = 2400;
    config.limits.safe_min = 800;
    config.limits.safe_max = 2200;
    return config;
}

}  // namespace


class PigpioDriverTest : public ::testing::Test {
protected:
    void SetUp() override {
        pi_ = pigpio_start(nullptr, nullptr);
        if (pi_ < 0) {
            GTEST_SKIP() << "pigpiod not reachable";
        }
    }

    void TearDown() override {
        if (pi_ >= 0) {
            set_servo_pulsewidth(pi_, TEST_GPIO, 0);
            pigpio_stop(pi_);
        }
    }

    /// Pulse width the daemon is producing on the test pin; <= 0 when off
    int observedPulseWidth() const {
        return get_servo_pulsewidth(pi_, TEST_GPIO);
    }

    int pi_ = -1;
};


TEST_F(PigpioDriverTest, DisconnectHomesDrivenServo) {
    PigpioDriver driver({{0, TEST_GPIO}}, {testChannel()});
    ASSERT_TRUE(driver.connect());
    ASSERT_TRUE(driver.moveTo(0, 1800, 0));
    EXPECT_EQ(observedPulseWidth(), 1800);

    driver.disconnect();
    EXPECT_EQ(observedPulseWidth(), 1500);
}

TEST_F(PigpioDriverTest, ReleasedServoStaysOffThroughShutdown) {
    {
        PigpioDriver driver({{0, TEST_GPIO}}, {testChannel()});
        ASSERT_TRUE(driver.connect());
        ASSERT_TRUE(driver.moveTo(0, 1800, 0));

        ASSERT_TRUE(driver.emergencyStopAll());
        EXPECT_LE(observedPulseWidth(), 0);
    }
    EXPECT_LE(observedPulseWidth(), 0);
}

TEST_F(PigpioDriverTest, ReleasedControllerDoesNotHomeOnDestruction) {
    {
        ServoController servo(TEST_GPIO, pi_, 600, 2400, 1500);
        ASSERT_TRUE(servo.setPulseWidth(1700));
        ASSERT_TRUE(servo.release());
    }
    EXPECT_LE(observedPulseWidth(), 0);
}

TEST_F(PigpioDriverTest, ReconfigureAppliesInversionWithoutHoming) {
    PigpioDriver driver({{0, TEST_GPIO}}, {testChannel()});
    ASSERT_TRUE(driver.connect());
    ASSERT_TRUE(driver.moveTo(0, 1000, 0));
    EXPECT_EQ(observedPulseWidth(), 1000);

    ActuatorConfig mirrored = testChannel();
    mirrored.inverted = true;
    driver.reconfigure({mirrored});

    // Same logical position, mirrored around 1500
    EXPECT_EQ(observedPulseWidth(), 2000);
    EXPECT_EQ(driver.getStatus(0).position, 1000);

    ASSERT_TRUE(driver.moveTo(0, 1200, 0));
    EXPECT_EQ(observedPulseWidth(), 1800);
}

TEST_F(PigpioDriverTest, ReconfigureNarrowsRangeOfDrivenServo) {
    PigpioDriver driver({{0, TEST_GPIO}}, {testChannel()});
    ASSERT_TRUE(driver.connect());
    ASSERT_TRUE(driver.moveTo(0, 2300, 0));

    ActuatorConfig narrow = testChannel();
    narrow.limits.max_position = 2000;
    narrow.limits.safe_max = 1900;
    driver.reconfigure({narrow});

    EXPECT_EQ(observedPulseWidth(), 2000);
    ASSERT_TRUE(driver.moveTo(0, 2400, 0));
    EXPECT_EQ(observedPulseWidth(), 2000);
}
