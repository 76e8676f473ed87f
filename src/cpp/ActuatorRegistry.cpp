/**
 * @file ActuatorRegistry.cpp
 * @brief Actuator configuration store implementation
 *
 * @license MIT
 */

#include "ActuatorRegistry.hpp"

#include <iostream>


//=============================================================================
// TIER TABLE
//=============================================================================

MotionCeiling tierCeiling(SafetyTier tier) {
    switch (tier) {
        case SafetyTier::Development:   return {1000.0, 2000.0};
        case SafetyTier::Testing:       return {750.0, 1500.0};
        case SafetyTier::Production:    return {500.0, 1000.0};
        case SafetyTier::Demonstration: return {300.0, 500.0};
        case SafetyTier::Emergency:     return {100.0, 200.0};
    }
    return {100.0, 200.0};
}


//=============================================================================
// PATCH
//=============================================================================

void ActuatorPatch::applyTo(ActuatorConfig& config) const {
    if (name) config.name = *name;
    if (servo_class) config.servo_class = *servo_class;
    if (range_class) config.range_class = *range_class;
    if (min_position) config.limits.min_position = *min_position;
    if (max_position) config.limits.max_position = *max_position;
    if (safe_min) config.limits.safe_min = *safe_min;
    if (safe_max) config.limits.safe_max = *safe_max;
    if (max_speed) config.limits.max_speed = *max_speed;
    if (max_acceleration) config.limits.max_acceleration = *max_acceleration;
    if (emergency_stop_speed) config.limits.emergency_stop_speed = *emergency_stop_speed;
    if (home_position) config.home_position = *home_position;
    if (default_speed) config.default_speed = *default_speed;
    if (default_acceleration) config.default_acceleration = *default_acceleration;
    if (enabled) config.enabled = *enabled;
    if (inverted) config.inverted = *inverted;
    if (safety_tier) config.safety_tier = *safety_tier;
}


//=============================================================================
// CONSTRUCTOR
//=============================================================================

ActuatorRegistry::ActuatorRegistry(const std::vector<ActuatorConfig>& configs) {
    for (const auto& config : configs) {
        std::string error = checkActuatorConfig(config);
        if (!error.empty()) {
            std::cerr << "[Registry] Skipping invalid config: " << error << std::endl;
            continue;
        }
        configs_[config.channel] = config;
    }
}


//=============================================================================
// QUERIES
//=============================================================================

std::optional<ActuatorConfig> ActuatorRegistry::get(int channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = configs_.find(channel);
    if (it == configs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ActuatorConfig> ActuatorRegistry::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ActuatorConfig> result;
    result.reserve(configs_.size());
    for (const auto& entry : configs_) {
        result.push_back(entry.second);
    }
    return result;
}

bool ActuatorRegistry::contains(int channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return configs_.count(channel) > 0;
}

std::size_t ActuatorRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return configs_.size();
}

SafetyTier ActuatorRegistry::safetyTier() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tier_;
}

double ActuatorRegistry::velocityCeiling(int channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = configs_.find(channel);
    if (it == configs_.end()) {
        return 0.0;
    }
    return tierCeiling(it->second.safety_tier).max_velocity;
}

double ActuatorRegistry::accelerationCeiling(int channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = configs_.find(channel);
    if (it == configs_.end()) {
        return 0.0;
    }
    return tierCeiling(it->second.safety_tier).max_acceleration;
}


//=============================================================================
// MUTATION
//=============================================================================

RegistryResult ActuatorRegistry::upsert(int channel, const ActuatorPatch& patch) {
    std::lock_guard<std::mutex> lock(mutex_);

    ActuatorConfig candidate;
    auto it = configs_.find(channel);
    if (it != configs_.end()) {
        candidate = it->second;
    } else {
        candidate.channel = channel;
        candidate.name = "Servo_" + std::to_string(channel);
        candidate.safety_tier = tier_;
    }

    patch.applyTo(candidate);
    candidate.channel = channel;

    std::string error = checkActuatorConfig(candidate);
    if (!error.empty()) {
        std::cerr << "[Registry] Rejected update: " << error << std::endl;
        return {false, error};
    }

    configs_[channel] = candidate;
    std::cout << "[Registry] Channel " << channel << " (" << candidate.name << ") updated" << std::endl;
    return {true, ""};
}

RegistryResult ActuatorRegistry::replaceAll(const std::vector<ActuatorConfig>& configs) {
    std::map<int, ActuatorConfig> replacement;
    for (const auto& config : configs) {
        std::string error = checkActuatorConfig(config);
        if (!error.empty()) {
            return {false, error};
        }
        if (replacement.count(config.channel) > 0) {
            return {false, "Duplicate channel: " + std::to_string(config.channel)};
        }
        replacement[config.channel] = config;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    // Channels missing from the new table stay known but disabled
    std::size_t disabled = 0;
    for (const auto& entry : configs_) {
        if (replacement.count(entry.first) > 0) {
            continue;
        }
        ActuatorConfig kept = entry.second;
        if (kept.enabled) {
            kept.enabled = false;
            ++disabled;
        }
        replacement[entry.first] = kept;
    }

    configs_ = std::move(replacement);
    std::cout << "[Registry] Loaded " << configs.size() << " channels";
    if (disabled > 0) {
        std::cout << ", disabled " << disabled << " absent channel(s)";
    }
    std::cout << std::endl;
    return {true, ""};
}

void ActuatorRegistry::applySafetyTier(SafetyTier tier) {
    std::lock_guard<std::mutex> lock(mutex_);
    tier_ = tier;
    for (auto& entry : configs_) {
        entry.second.safety_tier = tier;
    }

    MotionCeiling ceiling = tierCeiling(tier);
    std::cout << "[Registry] Safety tier " << toString(tier)
              << " (velocity " << ceiling.max_velocity
              << " us/s, acceleration " << ceiling.max_acceleration << " us/s^2)" << std::endl;
}
