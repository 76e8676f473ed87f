/**
 * @file test_command_queue.cpp
 * @brief Admission, dispatch ordering, cancellation and emergency handling
 *
 * @license MIT
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <string>

#include "ActuatorRegistry.hpp"
#include "ChoreographyEngine.hpp"
#include "ChoreographyLibrary.hpp"
#include "CommandQueue.hpp"
#include "SafetyValidator.hpp"
#include "SimulatedDriver.hpp"

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

Command moveTo(int channel, double position, int duration_ms, int delay_ms = 0) {
    Command command;
    command.channel = channel;
    command.value = position;
    command.duration_ms = duration_ms;
    command.delay_ms = delay_ms;
    return command;
}

}  // namespace


class CommandQueueTest : public ::testing::Test {
protected:
    using Clock = ChoreographyEngine::Clock;

    CommandQueueTest()
        : registry_({makeChannel(0), makeChannel(1)}),
          validator_(registry_),
          library_(false),
          now_(Clock::time_point{} + std::chrono::hours(1)),
          engine_(registry_, validator_, driver_, library_, [this] { return now_; }),
          queue_(registry_, validator_, engine_)
    {
        driver_.connect();
        registry_.applySafetyTier(SafetyTier::Production);
    }

    void runFor(int total, int step = 20) {
        for (int t = 0; t < total; t += step) {
            now_ += std::chrono::milliseconds(step);
            engine_.tick();
        }
    }

    bool hasViolation(const std::string& type) const {
        auto all = validator_.violations();
        return std::any_of(all.begin(), all.end(),
                           [&type](const SafetyViolation& v) { return v.type == type; });
    }

    ActuatorRegistry registry_;
    SafetyValidator validator_;
    SimulatedDriver driver_;
    ChoreographyLibrary library_;
    Clock::time_point now_;
    ChoreographyEngine engine_;
    CommandQueue queue_;
};


//=============================================================================
// SINGLE COMMANDS
//=============================================================================

TEST_F(CommandQueueTest, ClampedCommandReachesDriverAtSafeLimit) {
    Admission admission = queue_.submit(moveTo(0, 2300, 500));
    ASSERT_TRUE(admission.accepted) << admission.reason;
    EXPECT_EQ(queue_.status(admission.id), RunStatus::Pending);
    EXPECT_TRUE(hasViolation("position_constrained"));

    queue_.dispatchOnce();
    EXPECT_EQ(queue_.status(admission.id), RunStatus::Running);

    engine_.tick();
    runFor(520);

    ASSERT_FALSE(driver_.writes().empty());
    EXPECT_EQ(driver_.writes().back().position, 2200);
    EXPECT_EQ(queue_.status(admission.id), RunStatus::Completed);
}

TEST_F(CommandQueueTest, TooFastCommandNeverReachesDriver) {
    engine_.seedPosition(1, 1500);

    Admission admission = queue_.submit(moveTo(1, 2500, 100));
    EXPECT_FALSE(admission.accepted);
    EXPECT_EQ(admission.reason, "velocity limit exceeded");

    queue_.dispatchOnce();
    runFor(200);
    EXPECT_TRUE(driver_.writes().empty());
    EXPECT_TRUE(queue_.pendingIds().empty());
}

TEST_F(CommandQueueTest, EmergencyStopCommandBypassesQueue) {
    ASSERT_TRUE(queue_.submit(moveTo(0, 1600, 1000)).accepted);

    Command stop;
    stop.kind = CommandKind::EmergencyStop;
    Admission admission = queue_.submit(stop);
    ASSERT_TRUE(admission.accepted);
    EXPECT_TRUE(validator_.isEmergencyStopped());
    EXPECT_EQ(queue_.status(admission.id), RunStatus::Completed);
    EXPECT_EQ(driver_.emergencyStopCount(), 1);
}

TEST_F(CommandQueueTest, EmergencyStopDropsPendingWork) {
    Admission first = queue_.submit(moveTo(0, 1600, 1000));
    ASSERT_TRUE(first.accepted);

    engine_.emergencyStop("operator");
    queue_.dispatchOnce();

    EXPECT_TRUE(queue_.pendingIds().empty());
    EXPECT_EQ(queue_.status(first.id), RunStatus::Stopped);
    EXPECT_FALSE(queue_.submit(moveTo(0, 1600, 1000)).accepted);
}

TEST_F(CommandQueueTest, CancelPendingItem) {
    Admission admission = queue_.submit(moveTo(0, 1600, 1000));
    ASSERT_TRUE(queue_.cancel(admission.id));
    EXPECT_EQ(queue_.status(admission.id), RunStatus::Stopped);

    queue_.dispatchOnce();
    engine_.tick();
    EXPECT_TRUE(driver_.writes().empty());
}

TEST_F(CommandQueueTest, CancelRunningItemStopsEngineRun) {
    Admission admission = queue_.submit(moveTo(0, 1600, 1000));
    queue_.dispatchOnce();
    engine_.tick();

    EXPECT_TRUE(queue_.cancel(admission.id));
    EXPECT_EQ(queue_.status(admission.id), RunStatus::Stopped);
}

TEST_F(CommandQueueTest, UnknownIdIsNotFound) {
    EXPECT_EQ(queue_.status("missing"), RunStatus::NotFound);
    EXPECT_FALSE(queue_.cancel("missing"));
}


//=============================================================================
// SEQUENCES
//=============================================================================

TEST_F(CommandQueueTest, SequenceWithUnknownChannelRejectedUpFront) {
    Sequence sequence;
    sequence.name = "bad";
    sequence.commands = {moveTo(0, 1600, 1000), moveTo(9, 1500, 1000)};

    Admission admission = queue_.submit(sequence);
    EXPECT_FALSE(admission.accepted);
    EXPECT_EQ(admission.reason, "unknown channel 9");
    EXPECT_TRUE(validator_.violations().empty());
}

TEST_F(CommandQueueTest, SequenceRejectedWholeWhenAnyStepFails) {
    Sequence sequence;
    sequence.name = "jerk";
    sequence.commands = {moveTo(0, 1600, 1000), moveTo(0, 2200, 100, 1000)};

    Admission admission = queue_.submit(sequence);
    EXPECT_FALSE(admission.accepted);
    EXPECT_EQ(admission.reason, "command 1: velocity limit exceeded");
    EXPECT_TRUE(queue_.pendingIds().empty());
}

TEST_F(CommandQueueTest, SequenceValidatedInEffectiveTimeOrder) {
    // Listed order would measure 2100 -> 1700 in 200 ms (2000 us/s);
    // by delay it is 1700 first, then 1700 -> 2100 over 1 s.
    Sequence sequence;
    sequence.name = "ordered";
    sequence.commands = {moveTo(0, 2100, 1000, 2000), moveTo(0, 1700, 200, 0)};

    Admission admission = queue_.submit(sequence);
    EXPECT_TRUE(admission.accepted) << admission.reason;
}

TEST_F(CommandQueueTest, EmptySequenceRejected) {
    Sequence sequence;
    sequence.name = "empty";
    EXPECT_FALSE(queue_.submit(sequence).accepted);
}

TEST_F(CommandQueueTest, SequenceRunsToCompletion) {
    Sequence sequence;
    sequence.name = "look";
    sequence.commands = {moveTo(0, 1600, 400), moveTo(1, 1400, 400, 200)};

    Admission admission = queue_.submit(sequence);
    ASSERT_TRUE(admission.accepted) << admission.reason;
    queue_.dispatchOnce();
    engine_.tick();
    runFor(700);

    EXPECT_EQ(queue_.status(admission.id), RunStatus::Completed);
    EXPECT_EQ(engine_.currentPosition(0), 1600);
    EXPECT_EQ(engine_.currentPosition(1), 1400);
}

TEST_F(CommandQueueTest, QueuedSequencesRunOneAfterAnother) {
    Sequence left;
    left.name = "left";
    left.commands = {moveTo(0, 1600, 400)};
    Sequence right;
    right.name = "right";
    right.commands = {moveTo(1, 1600, 400)};

    Admission a = queue_.submit(left);
    Admission b = queue_.submit(right);
    ASSERT_TRUE(a.accepted) << a.reason;
    ASSERT_TRUE(b.accepted) << b.reason;

    queue_.dispatchOnce();
    EXPECT_EQ(queue_.status(a.id), RunStatus::Running);
    EXPECT_EQ(queue_.status(b.id), RunStatus::Pending);

    engine_.tick();
    runFor(500);
    EXPECT_EQ(queue_.status(a.id), RunStatus::Completed);

    queue_.dispatchOnce();
    EXPECT_EQ(queue_.status(b.id), RunStatus::Running);
}

TEST_F(CommandQueueTest, HigherPrioritySequencePreemptsQueuedOne) {
    Sequence routine;
    routine.name = "routine";
    routine.commands = {moveTo(0, 1600, 2000)};
    Sequence urgent;
    urgent.name = "urgent";
    urgent.commands = {moveTo(1, 1400, 400)};

    Admission a = queue_.submit(routine, 1);
    queue_.dispatchOnce();
    ASSERT_EQ(queue_.status(a.id), RunStatus::Running);

    Admission b = queue_.submit(urgent, 5);
    queue_.dispatchOnce();
    EXPECT_EQ(queue_.status(b.id), RunStatus::Running);
    EXPECT_EQ(queue_.status(a.id), RunStatus::Stopped);
}

TEST_F(CommandQueueTest, BlockedSequenceWaitsWhileCommandsPass) {
    Choreography greet;
    greet.key = "greet";
    greet.priority = 8;
    greet.allows_interruption = false;
    ChoreographyStep step;
    step.channel = 0;
    step.end_position = 1700;
    step.duration_ms = 5000;
    greet.steps = {step};
    ASSERT_TRUE(library_.add(greet));

    Admission choreography = queue_.submitChoreography("greet");
    ASSERT_TRUE(choreography.accepted) << choreography.reason;
    EXPECT_EQ(queue_.status(choreography.id), RunStatus::Running);

    Sequence sequence;
    sequence.name = "idle";
    sequence.commands = {moveTo(1, 1400, 2000)};
    Admission queued = queue_.submit(sequence);
    ASSERT_TRUE(queued.accepted);
    Admission command = queue_.submit(moveTo(1, 1600, 2000));
    ASSERT_TRUE(command.accepted);

    queue_.dispatchOnce();
    EXPECT_EQ(queue_.status(queued.id), RunStatus::Pending);
    EXPECT_EQ(queue_.status(command.id), RunStatus::Running);

    ASSERT_TRUE(queue_.cancel(choreography.id));
    queue_.dispatchOnce();
    EXPECT_EQ(queue_.status(queued.id), RunStatus::Running);
}

TEST_F(CommandQueueTest, UnknownChoreographyRejected) {
    Admission admission = queue_.submitChoreography("nothing_here");
    EXPECT_FALSE(admission.accepted);
    EXPECT_NE(admission.reason.find("unknown choreography"), std::string::npos);
}
