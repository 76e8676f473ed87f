/**
 * @file ActuatorDriver.hpp
 * @brief Hardware boundary for the motion core
 *
 * The choreography engine only talks to actuators through this interface.
 * Two backends exist:
 *
 *   - SimulatedDriver: in-memory, used for development and tests
 *   - PigpioDriver:    pigpio daemon, one ServoController per GPIO pin
 *
 * The backend is chosen once at startup from the service settings.
 *
 * @license MIT
 */

#ifndef ACTUATOR_DRIVER_HPP
#define ACTUATOR_DRIVER_HPP

#include <string>
#include <vector>

#include "MotionTypes.hpp"

/// Reported state of one channel
struct DriverStatus {
    int position = 0;
    bool moving = false;
    bool connected = false;
};

/**
 * @class ActuatorDriver
 * @brief Abstract actuator backend
 *
 * moveTo() is called from the engine thread only. Implementations must
 * still tolerate getStatus() from other threads.
 */
class ActuatorDriver {
public:
    virtual ~ActuatorDriver() = default;

    /// Open the backend; false if the hardware is unreachable
    virtual bool connect() = 0;

    virtual void disconnect() = 0;

    virtual bool isConnected() const = 0;

    /**
     * @brief Command a channel to a position
     * @param channel Logical channel id
     * @param position Pulse width in microseconds (already clamped)
     * @param duration_ms Hint for backends with hardware ramping; 0 = immediate
     * @return false on write failure
     */
    virtual bool moveTo(int channel, int position, int duration_ms) = 0;

    virtual DriverStatus getStatus(int channel) const = 0;

    /// Stop driving every channel immediately
    virtual bool emergencyStopAll() = 0;

    /**
     * @brief Take over changed actuator configs
     *
     * Called after the registry changes (config set, profile load, tier).
     * Range, home and inversion apply to the next write.
     */
    virtual void reconfigure(const std::vector<ActuatorConfig>& configs) = 0;

    /// Backend name for status reports
    virtual std::string name() const = 0;
};

#endif // ACTUATOR_DRIVER_HPP
