/**
 * @file CommandQueue.hpp
 * @brief Serialized admission and dispatch of commands and sequences
 *
 * Every external motion request funnels through here. Admission runs the
 * safety validator up front, so a rejected request never reaches the
 * engine. Admitted work waits in FIFO order until the dispatch loop hands
 * it to the choreography engine.
 *
 * @section Status Status Values
 *
 *     pending    admitted, not yet handed to the engine
 *     running    executing in the engine
 *     completed  finished normally
 *     failed     driver failure or refused at dispatch
 *     stopped    cancelled, preempted or halted by emergency stop
 *     not_found  unknown or expired id
 *
 * @license MIT
 */

#ifndef COMMAND_QUEUE_HPP
#define COMMAND_QUEUE_HPP

#include <atomic>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "ActuatorRegistry.hpp"
#include "ChoreographyEngine.hpp"
#include "MotionTypes.hpp"
#include "SafetyValidator.hpp"

/// Result of a submit call
struct Admission {
    bool accepted = false;
    std::string id;
    std::string reason;
};

class CommandQueue {
public:
    static constexpr int DEFAULT_DISPATCH_HZ = 20;
    static constexpr std::size_t HISTORY_LIMIT = 256;

    CommandQueue(ActuatorRegistry& registry, SafetyValidator& validator, ChoreographyEngine& engine);
    ~CommandQueue();

    CommandQueue(const CommandQueue&) = delete;
    CommandQueue& operator=(const CommandQueue&) = delete;

    //=========================================================================
    // SUBMISSION
    //=========================================================================

    /**
     * @brief Validate and enqueue a single command
     *
     * Emergency-stop commands skip the queue and take effect immediately.
     */
    Admission submit(const Command& command);

    /**
     * @brief Validate and enqueue a whole sequence
     *
     * Unknown channels reject the sequence before anything else is checked.
     * Commands are then validated in effective-time order (by delay), each
     * position command measured from the previous target on its channel.
     * Any rejection rejects the whole sequence.
     */
    Admission submit(const Sequence& sequence, int priority = 1);

    /// Start a library choreography right away (no queueing)
    Admission submitChoreography(const std::string& name,
                                 double personality_modifier = 1.0,
                                 std::optional<double> intensity = std::nullopt);

    //=========================================================================
    // CONTROL / QUERIES
    //=========================================================================

    /// Remove a pending item or stop a running one
    bool cancel(const std::string& id);

    RunStatus status(const std::string& id) const;

    std::vector<std::string> pendingIds() const;

    /// Hand every dispatchable pending item to the engine
    void dispatchOnce();

    void start(int dispatch_hz = DEFAULT_DISPATCH_HZ);
    void shutdown();

private:
    struct Item {
        std::string id;
        bool is_sequence = false;
        Command command;
        Sequence sequence;
        int priority = 1;
    };

    struct Record {
        std::string id;
        RunStatus status = RunStatus::NotFound;
        bool delegated = false;      ///< Status lives in the engine
        std::string reason;
    };

    ActuatorRegistry& registry_;
    SafetyValidator& validator_;
    ChoreographyEngine& engine_;

    mutable std::mutex mutex_;
    std::deque<Item> pending_;
    std::deque<Record> records_;

    std::atomic<bool> running_{false};
    std::thread thread_;
    int dispatch_hz_ = DEFAULT_DISPATCH_HZ;

    void recordLocked(const std::string& id, RunStatus status, bool delegated,
                      const std::string& reason = "");
    bool removePendingLocked(const std::string& id);
    void dispatchLoop();
};

#endif // COMMAND_QUEUE_HPP
