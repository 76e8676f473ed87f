/**
 * @file SafetyValidator.cpp
 * @brief Safety gate implementation
 *
 * @license MIT
 */

#include "SafetyValidator.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iostream>
#include <sstream>


//=============================================================================
// CONSTRUCTOR
//=============================================================================

SafetyValidator::SafetyValidator(ActuatorRegistry& registry)
    : registry_(registry)
{
}


//=============================================================================
// ADMISSION
//=============================================================================

Verdict SafetyValidator::validate(const Command& command, std::optional<double> from_position) {
    return evaluate(command, from_position, true);
}

Verdict SafetyValidator::checkTarget(int channel, double position) {
    Command command;
    command.channel = channel;
    command.value = position;
    return evaluate(command, std::nullopt, false);
}

Verdict SafetyValidator::evaluate(const Command& command, std::optional<double> from_position,
                                  bool check_velocity) {
    Verdict verdict;
    verdict.command = command;

    auto config = registry_.get(command.channel);
    if (!config) {
        verdict.reason = "unknown channel " + std::to_string(command.channel);
        return verdict;
    }
    if (!config->enabled) {
        verdict.reason = "channel " + std::to_string(command.channel) + " is disabled";
        return verdict;
    }

    if (command.kind == CommandKind::EmergencyStop) {
        verdict.accepted = true;
        return verdict;
    }

    if (emergency_stop_.load()) {
        verdict.reason = "emergency stop active";
        return verdict;
    }

    std::ostringstream oss;
    const auto& limits = config->limits;

    switch (command.kind) {
        case CommandKind::Speed:
            if (command.value > limits.max_speed) {
                oss << "Speed " << command.value << " exceeds limit " << limits.max_speed;
                recordViolation(command.channel, "speed_limit_exceeded", Severity::Warning,
                                oss.str(), "command_rejected");
                verdict.reason = "speed limit exceeded";
                return verdict;
            }
            verdict.accepted = true;
            return verdict;

        case CommandKind::Acceleration:
            if (command.value > limits.max_acceleration) {
                oss << "Acceleration " << command.value << " exceeds limit " << limits.max_acceleration;
                recordViolation(command.channel, "acceleration_limit_exceeded", Severity::Warning,
                                oss.str(), "command_rejected");
                verdict.reason = "acceleration limit exceeded";
                return verdict;
            }
            verdict.accepted = true;
            return verdict;

        default:
            break;
    }

    // Position command
    int requested = static_cast<int>(std::lround(command.value));
    int target = std::clamp(requested, limits.safe_min, limits.safe_max);
    if (target != requested) {
        oss << "Position " << requested << " constrained to " << target;
        recordViolation(command.channel, "position_constrained", Severity::Warning,
                        oss.str(), "position_adjusted");
        oss.str("");
    }
    verdict.command.value = target;

    std::optional<double> origin = from_position;
    if (check_velocity && !origin) {
        auto last = lastKnownPosition(command.channel);
        if (last) {
            origin = *last;
        }
    }

    if (check_velocity && origin) {
        // Instant moves are measured over the minimum window
        int window_ms = command.duration_ms > 0 ? command.duration_ms : MIN_VELOCITY_WINDOW_MS;
        double velocity = std::abs(target - *origin) / (window_ms / 1000.0);
        double ceiling = registry_.velocityCeiling(command.channel);
        if (velocity > ceiling) {
            oss << "Commanded velocity " << velocity << " exceeds limit " << ceiling;
            recordViolation(command.channel, "velocity_limit_exceeded", Severity::Warning,
                            oss.str(), "command_rejected");
            verdict.reason = "velocity limit exceeded";
            return verdict;
        }
    }

    std::vector<SafetyZone> zones = safetyZones();
    for (const auto& zone : zones) {
        if (!zone.active) {
            continue;
        }
        if (std::find(zone.channels.begin(), zone.channels.end(), command.channel) == zone.channels.end()) {
            continue;
        }
        if (target < zone.min_position || target > zone.max_position) {
            oss << "Position " << target << " violates safety zone '" << zone.name << "'";
            recordViolation(command.channel, "safety_zone_violation", Severity::Critical,
                            oss.str(), "command_rejected");
            verdict.reason = "safety zone '" + zone.name + "' violated";
            return verdict;
        }
    }

    verdict.accepted = true;
    return verdict;
}


//=============================================================================
// MONITORING
//=============================================================================

bool SafetyValidator::monitor(int channel, int observed) {
    auto config = registry_.get(channel);
    if (!config) {
        std::cerr << "[Safety] Monitor called for unknown channel " << channel << std::endl;
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_positions_[channel] = observed;
    }

    const auto& limits = config->limits;
    if (observed >= limits.min_position && observed <= limits.max_position) {
        return true;
    }

    std::ostringstream oss;
    oss << "Position " << observed << " exceeds limits ["
        << limits.min_position << ", " << limits.max_position << "]";
    recordViolation(channel, "position_limit_exceeded", Severity::Critical,
                    oss.str(), "emergency_stop_triggered");
    triggerEmergencyStop("channel " + std::to_string(channel) + " position limit exceeded");
    return false;
}

std::optional<int> SafetyValidator::lastKnownPosition(int channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_positions_.find(channel);
    if (it == last_positions_.end()) {
        return std::nullopt;
    }
    return it->second;
}


//=============================================================================
// EMERGENCY STOP
//=============================================================================

void SafetyValidator::triggerEmergencyStop(const std::string& reason) {
    if (emergency_stop_.exchange(true)) {
        return;
    }

    recordViolation(-1, "emergency_stop", Severity::Critical,
                    "Emergency stop activated: " + reason, "all_servos_stopped");
    std::cerr << "[Safety] EMERGENCY STOP ACTIVATED (" << reason << ")" << std::endl;

    std::vector<EmergencyListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        listener(reason);
    }
}

SafetyResult SafetyValidator::resetEmergencyStop() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!emergency_stop_.load()) {
        return {true, "Emergency stop not active"};
    }

    for (const auto& v : violations_) {
        if (!v.resolved && v.severity == Severity::Critical && v.type != "emergency_stop") {
            std::cerr << "[Safety] Reset refused: unresolved " << v.type
                      << " on channel " << v.channel << std::endl;
            return {false, "Unresolved critical violation: " + v.description};
        }
    }

    for (auto& v : violations_) {
        if (v.type == "emergency_stop") {
            v.resolved = true;
        }
    }
    emergency_stop_.store(false);

    std::cout << "[Safety] Emergency stop reset" << std::endl;
    return {true, "Emergency stop reset"};
}

void SafetyValidator::addEmergencyListener(EmergencyListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}


//=============================================================================
// SAFETY ZONES
//=============================================================================

SafetyResult SafetyValidator::addSafetyZone(const std::string& name, const std::vector<int>& channels,
                                            int min_position, int max_position) {
    if (name.empty()) {
        return {false, "Safety zone needs a name"};
    }
    if (min_position > max_position) {
        return {false, "Safety zone min exceeds max"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    zones_[name] = SafetyZone{name, channels, min_position, max_position, true};
    std::cout << "[Safety] Zone '" << name << "' [" << min_position << ", "
              << max_position << "] on " << channels.size() << " channel(s)" << std::endl;
    return {true, ""};
}

bool SafetyValidator::removeSafetyZone(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool removed = zones_.erase(name) > 0;
    if (removed) {
        std::cout << "[Safety] Zone '" << name << "' removed" << std::endl;
    }
    return removed;
}

std::vector<SafetyZone> SafetyValidator::safetyZones() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SafetyZone> result;
    for (const auto& entry : zones_) {
        result.push_back(entry.second);
    }
    return result;
}


//=============================================================================
// VIOLATION LOG
//=============================================================================

std::vector<SafetyViolation> SafetyValidator::violations(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto count = static_cast<std::ptrdiff_t>(std::min(limit, violations_.size()));
    return std::vector<SafetyViolation>(violations_.end() - count, violations_.end());
}

std::size_t SafetyValidator::acknowledgeViolations(int channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t changed = 0;
    for (auto& v : violations_) {
        if (v.resolved || v.type == "emergency_stop") {
            continue;
        }
        if (channel == -1 || v.channel == channel) {
            v.resolved = true;
            ++changed;
        }
    }
    std::cout << "[Safety] Acknowledged " << changed << " violation(s)" << std::endl;
    return changed;
}

std::size_t SafetyValidator::pruneViolations(std::chrono::seconds retention) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t before = violations_.size();
    pruneLocked(std::chrono::system_clock::now() - retention);
    return before - violations_.size();
}

SafetyStatus SafetyValidator::status() const {
    SafetyStatus status;
    status.emergency_stop = emergency_stop_.load();
    status.tier = registry_.safetyTier();

    std::lock_guard<std::mutex> lock(mutex_);
    status.violation_count = violations_.size();
    for (const auto& v : violations_) {
        if (!v.resolved && v.severity == Severity::Critical) {
            ++status.unresolved_critical;
        }
    }
    for (const auto& entry : zones_) {
        status.zones.push_back(entry.first);
    }
    return status;
}


//=============================================================================
// HELPERS
//=============================================================================

void SafetyValidator::recordViolation(int channel, const std::string& type, Severity severity,
                                      const std::string& description, const std::string& action) {
    SafetyViolation v;
    v.timestamp = std::chrono::system_clock::now();
    v.channel = channel;
    v.type = type;
    v.severity = severity;
    v.description = description;
    v.action_taken = action;

    std::cerr << "[Safety] " << toString(severity) << " " << type << ": " << description << std::endl;

    std::lock_guard<std::mutex> lock(mutex_);
    violations_.push_back(v);
    pruneLocked(v.timestamp - VIOLATION_RETENTION);
}

void SafetyValidator::pruneLocked(std::chrono::system_clock::time_point cutoff) {
    violations_.erase(
        std::remove_if(violations_.begin(), violations_.end(),
                       [cutoff](const SafetyViolation& v) {
                           bool pinned = !v.resolved && v.severity == Severity::Critical;
                           return !pinned && v.timestamp < cutoff;
                       }),
        violations_.end());
}
