/**
 * @file PigpioDriver.hpp
 * @brief Actuator backend on the pigpio daemon
 *
 * Maps logical channels onto GPIO pins and drives each with its own
 * ServoController. All controllers share one daemon handle.
 *
 * @section HardwareConfig Hardware Configuration
 *
 *     ┌────────────────────────────────────┐
 *     │  channel 0  Dome Rotation  GPIO 17 │
 *     │  channel 1  Head Tilt      GPIO 27 │
 *     │  channel 2  Periscope      GPIO 22 │
 *     │  ...        (from settings pin map) │
 *     └────────────────────────────────────┘
 *
 * Channels without a pin mapping are reported disconnected and every
 * write to them fails.
 *
 * @section ResourceManagement Resource Management
 *
 *   - connect() opens the daemon handle and creates the controllers
 *   - reconfigure() updates controllers in place, without homing
 *   - disconnect() homes every driven servo, then releases the handle;
 *     servos released by an emergency stop stay off
 *   - The destructor disconnects if still connected
 *
 * @section Dependencies Dependencies
 *
 *   - pigpiod daemon must be running (sudo systemctl start pigpiod)
 *
 * @license MIT
 */

#ifndef PIGPIO_DRIVER_HPP
#define PIGPIO_DRIVER_HPP

#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "ActuatorDriver.hpp"
#include "MotionTypes.hpp"
#include "ServoController.hpp"

class PigpioDriver : public ActuatorDriver {
public:
    /**
     * @param pin_map Channel id -> GPIO pin
     * @param configs Actuator configs providing range, home and inversion
     */
    PigpioDriver(std::map<int, int> pin_map, const std::vector<ActuatorConfig>& configs);

    ~PigpioDriver() override;

    PigpioDriver(const PigpioDriver&) = delete;
    PigpioDriver& operator=(const PigpioDriver&) = delete;

    /**
     * @brief Connect to the local pigpio daemon
     * @return false if pigpiod is not reachable
     */
    bool connect() override;

    void disconnect() override;
    bool isConnected() const override;
    bool moveTo(int channel, int position, int duration_ms) override;
    DriverStatus getStatus(int channel) const override;

    /// Switch pulses off on every pin
    bool emergencyStopAll() override;

    void reconfigure(const std::vector<ActuatorConfig>& configs) override;

    std::string name() const override { return "pigpio"; }

private:
    mutable std::mutex mutex_;
    int pi_ = -1;    ///< Daemon handle, shared by every ServoController
    std::map<int, int> pin_map_;
    std::map<int, ActuatorConfig> configs_;
    std::map<int, std::unique_ptr<ServoController>> servos_;
};

#endif // PIGPIO_DRIVER_HPP
