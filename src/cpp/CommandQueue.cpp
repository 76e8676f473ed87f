/**
 * @file CommandQueue.cpp
 * @brief Command and sequence queue implementation
 *
 * @license MIT
 */

#include "CommandQueue.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <map>
#include <numeric>


//=============================================================================
// CONSTRUCTOR / DESTRUCTOR
//=============================================================================

CommandQueue::CommandQueue(ActuatorRegistry& registry, SafetyValidator& validator,
                           ChoreographyEngine& engine)
    : registry_(registry),
      validator_(validator),
      engine_(engine)
{
}


CommandQueue::~CommandQueue() {
    shutdown();
}


//=============================================================================
// SUBMISSION
//=============================================================================

Admission CommandQueue::submit(const Command& command) {
    Admission admission;
    std::string id = command.id.empty() ? makeShortId() : command.id;

    if (command.kind == CommandKind::EmergencyStop) {
        engine_.emergencyStop("emergency stop command");
        std::lock_guard<std::mutex> lock(mutex_);
        recordLocked(id, RunStatus::Completed, false);
        admission.accepted = true;
        admission.id = id;
        return admission;
    }

    Verdict verdict = validator_.validate(command);
    if (!verdict.accepted) {
        std::cout << "[Queue] Command for channel " << command.channel
                  << " rejected: " << verdict.reason << std::endl;
        admission.reason = verdict.reason;
        return admission;
    }

    Item item;
    item.id = id;
    item.command = verdict.command;
    item.command.id = id;

    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(item);
    admission.accepted = true;
    admission.id = id;
    return admission;
}


Admission CommandQueue::submit(const Sequence& sequence, int priority) {
    Admission admission;

    if (sequence.commands.empty()) {
        admission.reason = "sequence has no commands";
        return admission;
    }
    if (sequence.loop && (sequence.loop_count == 0 || sequence.loop_count < -1)) {
        admission.reason = "loop_count must be positive or -1";
        return admission;
    }

    // Eager existence check over the whole sequence
    for (const auto& command : sequence.commands) {
        if (command.kind != CommandKind::EmergencyStop && !registry_.contains(command.channel)) {
            admission.reason = "unknown channel " + std::to_string(command.channel);
            std::cout << "[Queue] Sequence '" << sequence.name << "' rejected: "
                      << admission.reason << std::endl;
            return admission;
        }
        if (command.duration_ms < 0 || command.delay_ms < 0) {
            admission.reason = "negative duration or delay";
            return admission;
        }
    }

    // Validate in effective-time order, chaining positions per channel
    std::vector<std::size_t> order(sequence.commands.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&sequence](std::size_t a, std::size_t b) {
        return sequence.commands[a].delay_ms < sequence.commands[b].delay_ms;
    });

    Sequence admitted = sequence;
    std::map<int, double> chained;
    for (std::size_t index : order) {
        const Command& command = sequence.commands[index];

        std::optional<double> from;
        auto it = chained.find(command.channel);
        if (it != chained.end()) {
            from = it->second;
        }

        Verdict verdict = validator_.validate(command, from);
        if (!verdict.accepted) {
            admission.reason = "command " + std::to_string(index) + ": " + verdict.reason;
            std::cout << "[Queue] Sequence '" << sequence.name << "' rejected: "
                      << admission.reason << std::endl;
            return admission;
        }
        if (command.kind == CommandKind::Position) {
            chained[command.channel] = verdict.command.value;
        }
        admitted.commands[index] = verdict.command;
    }

    admitted.id = sequence.id.empty() ? makeShortId() : sequence.id;

    Item item;
    item.id = admitted.id;
    item.is_sequence = true;
    item.sequence = admitted;
    item.priority = priority;

    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(item);
    std::cout << "[Queue] Sequence '" << admitted.name << "' (" << admitted.id << ") queued with "
              << admitted.commands.size() << " commands" << std::endl;
    admission.accepted = true;
    admission.id = admitted.id;
    return admission;
}


Admission CommandQueue::submitChoreography(const std::string& name,
                                           double personality_modifier,
                                           std::optional<double> intensity) {
    Admission admission;
    StartResult result = engine_.execute(name, personality_modifier, intensity);
    if (!result.started) {
        admission.reason = result.reason;
        return admission;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    recordLocked(result.run_id, RunStatus::Running, true);
    admission.accepted = true;
    admission.id = result.run_id;
    return admission;
}


//=============================================================================
// CONTROL / QUERIES
//=============================================================================

bool CommandQueue::cancel(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (removePendingLocked(id)) {
            recordLocked(id, RunStatus::Stopped, false, "cancelled before dispatch");
            std::cout << "[Queue] " << id << " cancelled before dispatch" << std::endl;
            return true;
        }
    }
    return engine_.stop(id);
}


RunStatus CommandQueue::status(const std::string& id) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& item : pending_) {
            if (item.id == id) {
                return RunStatus::Pending;
            }
        }
        for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
            if (it->id == id) {
                if (!it->delegated) {
                    return it->status;
                }
                break;
            }
        }
    }
    return engine_.runStatus(id);
}


std::vector<std::string> CommandQueue::pendingIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& item : pending_) {
        ids.push_back(item.id);
    }
    return ids;
}


//=============================================================================
// DISPATCH
//=============================================================================

void CommandQueue::dispatchOnce() {
    std::vector<Item> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        // Emergency stop clears everything still waiting
        if (validator_.isEmergencyStopped()) {
            for (const auto& item : pending_) {
                recordLocked(item.id, RunStatus::Stopped, false, "emergency stop");
            }
            if (!pending_.empty()) {
                std::cout << "[Queue] Dropped " << pending_.size()
                          << " pending item(s) on emergency stop" << std::endl;
            }
            pending_.clear();
            return;
        }
        snapshot.assign(pending_.begin(), pending_.end());
    }

    bool sequence_blocked = false;
    for (const auto& item : snapshot) {
        // Keep sequences in submission order behind a blocked one
        if (item.is_sequence && sequence_blocked) {
            continue;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            bool queued = std::any_of(pending_.begin(), pending_.end(),
                                      [&item](const Item& p) { return p.id == item.id; });
            if (!queued) {
                continue;
            }
        }

        StartResult result = item.is_sequence
            ? engine_.startSequence(item.sequence, item.priority)
            : engine_.startCommand(item.command);

        if (result.blocked) {
            sequence_blocked = true;
            continue;
        }

        bool cancelled = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled = !removePendingLocked(item.id);

            if (!result.started) {
                recordLocked(item.id, RunStatus::Failed, false, result.reason);
                std::cerr << "[Queue] " << item.id << " failed at dispatch: " << result.reason << std::endl;
                continue;
            }
            recordLocked(item.id, RunStatus::Running, true);
        }

        // Cancelled while being dispatched
        if (cancelled) {
            engine_.stop(item.id);
        }
    }
}


void CommandQueue::start(int dispatch_hz) {
    if (running_.exchange(true)) {
        return;
    }
    dispatch_hz_ = dispatch_hz > 0 ? dispatch_hz : DEFAULT_DISPATCH_HZ;
    thread_ = std::thread(&CommandQueue::dispatchLoop, this);
}


void CommandQueue::shutdown() {
    if (!running_.exchange(false)) {
        return;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    std::cout << "[Queue] Dispatch loop stopped" << std::endl;
}


void CommandQueue::dispatchLoop() {
    const double loop_period = 1.0 / dispatch_hz_;
    std::cout << "[Queue] Dispatch loop started at " << dispatch_hz_ << " Hz" << std::endl;

    while (running_) {
        auto cycle_start = std::chrono::steady_clock::now();

        dispatchOnce();

        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - cycle_start).count();
        double sleep_time = loop_period - elapsed;
        if (sleep_time > 0) {
            std::this_thread::sleep_for(std::chrono::duration<double>(sleep_time));
        }
    }
}


//=============================================================================
// HELPERS
//=============================================================================

void CommandQueue::recordLocked(const std::string& id, RunStatus status, bool delegated,
                                const std::string& reason) {
    records_.push_back({id, status, delegated, reason});
    while (records_.size() > HISTORY_LIMIT) {
        records_.pop_front();
    }
}


bool CommandQueue::removePendingLocked(const std::string& id) {
    auto it = std::find_if(pending_.begin(), pending_.end(),
                           [&id](const Item& item) { return item.id == id; });
    if (it == pending_.end()) {
        return false;
    }
    pending_.erase(it);
    return true;
}
