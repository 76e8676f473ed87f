/**
 * @file PigpioDriver.cpp
 * @brief Actuator backend on the pigpio daemon
 *
 * @license MIT
 */

#include <pigpiod_if2.h>
#include <iostream>
#include <utility>

#include "PigpioDriver.hpp"


//=============================================================================
// CONSTRUCTOR / DESTRUCTOR
//=============================================================================

PigpioDriver::PigpioDriver(std::map<int, int> pin_map, const std::vector<ActuatorConfig>& configs)
    : pin_map_(std::move(pin_map))
{
    for (const auto& config : configs) {
        configs_[config.channel] = config;
    }
}


PigpioDriver::~PigpioDriver() {
    if (isConnected()) {
        disconnect();
    }
}


//=============================================================================
// CONNECTION
//=============================================================================

bool PigpioDriver::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pi_ >= 0) {
        return true;
    }

    pi_ = pigpio_start(nullptr, nullptr);  // Connect to local daemon
    if (pi_ < 0) {
        std::cerr << "[Pigpio] Failed to connect to pigpio daemon. "
                  << "Ensure pigpiod is running: sudo systemctl start pigpiod" << std::endl;
        return false;
    }
    std::cout << "[Pigpio] Connected to pigpio daemon (handle: " << pi_ << ")" << std::endl;

    for (const auto& [channel, pin] : pin_map_) {
        ActuatorConfig config;
        auto it = configs_.find(channel);
        if (it != configs_.end()) {
            config = it->second;
        } else {
            std::cerr << "[Pigpio] Channel " << channel << " has no config, using defaults" << std::endl;
        }

        servos_[channel] = std::make_unique<ServoController>(
            pin, pi_,
            config.limits.min_position, config.limits.max_position,
            config.home_position, config.inverted);
        std::cout << "[Pigpio] Channel " << channel << " on GPIO " << pin
                  << (config.inverted ? " (inverted)" : "") << std::endl;
    }
    return true;
}


void PigpioDriver::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pi_ < 0) {
        return;
    }

    std::cout << "[Pigpio] Shutting down..." << std::endl;

    // ServoController destructors home each driven servo, then the handle goes
    std::size_t released = 0;
    for (const auto& entry : servos_) {
        if (entry.second->isReleased()) {
            ++released;
        }
    }
    if (released > 0) {
        std::cout << "[Pigpio] Leaving " << released << " released servo(s) unpowered" << std::endl;
    }
    servos_.clear();
    pigpio_stop(pi_);
    pi_ = -1;

    std::cout << "[Pigpio] Disconnected from pigpio daemon" << std::endl;
}


bool PigpioDriver::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pi_ >= 0;
}


//=============================================================================
// MOTION
//=============================================================================

bool PigpioDriver::moveTo(int channel, int position, int /*duration_ms*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servos_.find(channel);
    if (pi_ < 0 || it == servos_.end()) {
        return false;
    }
    return it->second->setPulseWidth(position);
}


DriverStatus PigpioDriver::getStatus(int channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    DriverStatus status;
    auto it = servos_.find(channel);
    if (pi_ < 0 || it == servos_.end()) {
        return status;
    }
    status.connected = true;
    status.position = it->second->getCurrentPulseWidth();
    return status;
}


bool PigpioDriver::emergencyStopAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    bool ok = true;
    for (auto& entry : servos_) {
        ok = entry.second->release() && ok;
    }
    std::cerr << "[Pigpio] Emergency stop: pulses off on " << servos_.size() << " pin(s)" << std::endl;
    return ok;
}


void PigpioDriver::reconfigure(const std::vector<ActuatorConfig>& configs) {
    std::lock_guard<std::mutex> lock(mutex_);
    configs_.clear();
    for (const auto& config : configs) {
        configs_[config.channel] = config;
    }

    for (auto& [channel, servo] : servos_) {
        auto it = configs_.find(channel);
        if (it == configs_.end()) {
            continue;
        }
        const ActuatorConfig& config = it->second;
        if (!servo->configure(config.limits.min_position, config.limits.max_position,
                              config.home_position, config.inverted)) {
            std::cerr << "[Pigpio] Channel " << channel << " rejected new configuration" << std::endl;
        }
    }
    std::cout << "[Pigpio] Reconfigured " << servos_.size() << " servo(s)" << std::endl;
}
