/**
 * @file SimulatedDriver.cpp
 * @brief In-memory actuator backend implementation
 *
 * @license MIT
 */

#include "SimulatedDriver.hpp"

#include <iostream>


//=============================================================================
// CONNECTION
//=============================================================================

bool SimulatedDriver::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = true;
    std::cout << "[Driver] Simulated backend connected" << std::endl;
    return true;
}

void SimulatedDriver::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = false;
    std::cout << "[Driver] Simulated backend disconnected" << std::endl;
}

bool SimulatedDriver::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}


//=============================================================================
// MOTION
//=============================================================================

bool SimulatedDriver::moveTo(int channel, int position, int duration_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_ || failing_.count(channel) > 0) {
        return false;
    }
    positions_[channel] = position;
    writes_.push_back({channel, position, duration_ms});
    return true;
}

DriverStatus SimulatedDriver::getStatus(int channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    DriverStatus status;
    status.connected = connected_;

    auto forced = forced_.find(channel);
    if (forced != forced_.end()) {
        status.position = forced->second;
        return status;
    }

    auto it = positions_.find(channel);
    status.position = (it != positions_.end()) ? it->second : DEFAULT_POSITION;
    return status;
}

bool SimulatedDriver::emergencyStopAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++estop_count_;
    std::cerr << "[Driver] Simulated emergency stop" << std::endl;
    return true;
}

void SimulatedDriver::reconfigure(const std::vector<ActuatorConfig>& configs) {
    std::lock_guard<std::mutex> lock(mutex_);
    configs_.clear();
    for (const auto& config : configs) {
        configs_[config.channel] = config;
    }
    ++reconfigure_count_;
}


//=============================================================================
// TEST HOOKS
//=============================================================================

void SimulatedDriver::failChannel(int channel, bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail) {
        failing_.insert(channel);
    } else {
        failing_.erase(channel);
    }
}

void SimulatedDriver::forceObservedPosition(int channel, int position) {
    std::lock_guard<std::mutex> lock(mutex_);
    forced_[channel] = position;
}

void SimulatedDriver::clearObservedPosition(int channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    forced_.erase(channel);
}

std::vector<DriverWrite> SimulatedDriver::writes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return writes_;
}

void SimulatedDriver::clearWrites() {
    std::lock_guard<std::mutex> lock(mutex_);
    writes_.clear();
}

int SimulatedDriver::emergencyStopCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return estop_count_;
}

std::optional<ActuatorConfig> SimulatedDriver::configFor(int channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = configs_.find(channel);
    if (it == configs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

int SimulatedDriver::reconfigureCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reconfigure_count_;
}
