/**
 * @file ServoController.hpp
 * @brief Single-pin PWM servo output via the pigpio daemon
 *
 * Writes pulse widths to one GPIO pin, clamped to the channel's absolute
 * range and mirrored for inverted mounts. Used by PigpioDriver, one
 * instance per mapped channel.
 *
 * @section PWM PWM Specifications
 *
 * Standard hobby servo PWM timing:
 *
 *     ←───────── 20ms Period (50 Hz) ─────────→
 *     ┌────┐
 *     │    │
 *     │    └─────────────────────────────────────
 *     ←────→
 *     Pulse Width:
 *       min_pw  = one mechanical end stop
 *       home_pw = rest position (usually 1500 μs)
 *       max_pw  = other mechanical end stop
 *       0       = pulses off (servo unpowered)
 *
 * @section SafetyFeatures Safety Features
 *
 *   - Pulse width clamping prevents damage from out-of-range values
 *   - Returns to home on destruction unless released
 *   - Copy operations deleted to prevent duplicate hardware access
 *
 * @license MIT
 */

#ifndef SERVO_CONTROLLER_HPP
#define SERVO_CONTROLLER_HPP

/**
 * @class ServoController
 * @brief Low-level PWM servo control via pigpio daemon
 *
 * @note This class does NOT own the pigpio daemon handle. The daemon
 * connection lifecycle is managed by PigpioDriver.
 *
 * Example Usage:
 * @code
 *     int pi = pigpio_start(nullptr, nullptr);
 *     ServoController dome(17, pi, 600, 2400, 1500, false);
 *     dome.setPulseWidth(1800);
 *     dome.release();       // pulses off
 *     // Destructor leaves a released servo limp
 * @endcode
 */
class ServoController {
public:
    //=========================================================================
    // LIFECYCLE
    //=========================================================================

    /**
     * @brief Construct servo controller and drive it to home
     *
     * @param pin_num GPIO pin number for this servo
     * @param pi_handle Handle from pigpio_start() - NOT owned by this class
     * @param min_pw Minimum pulse width in microseconds
     * @param max_pw Maximum pulse width in microseconds
     * @param home_pw Rest position pulse width in microseconds
     * @param inverted Mirror commanded positions around the range center
     */
    ServoController(int pin_num, int pi_handle,
                    int min_pw, int max_pw, int home_pw, bool inverted = false);

    /**
     * @brief Destructor - returns a driven servo to home position
     *
     * A released servo (emergency stop) is left with pulses off.
     *
     * @note Does NOT call pigpio_stop().
     */
    ~ServoController();

    //=========================================================================
    // DELETED OPERATIONS (Prevent Hardware Conflicts)
    //=========================================================================

    ServoController(const ServoController&) = delete;
    ServoController& operator=(const ServoController&) = delete;

    //=========================================================================
    // CONTROL INTERFACE
    //=========================================================================

    /**
     * @brief Set servo position by pulse width
     *
     * Clamped to [min_pw, max_pw], then mirrored if the servo is inverted.
     *
     * @param microseconds Logical pulse width in microseconds
     * @return false if the daemon rejected the write
     */
    bool setPulseWidth(int microseconds);

    /// Return servo to its home position
    bool home();

    /// Stop sending pulses; the servo goes limp until the next write
    bool release();

    /**
     * @brief Change range, home and inversion in place
     *
     * A driven servo is rewritten at its current position, clamped into the
     * new range. A released servo stays released.
     *
     * @return false if the daemon rejected the rewrite
     */
    bool configure(int min_pw, int max_pw, int home_pw, bool inverted);

    //=========================================================================
    // STATE QUERIES
    //=========================================================================

    /// Last logical pulse width commanded (before inversion)
    int getCurrentPulseWidth() const { return current_pw; }

    bool isReleased() const { return released; }

    int getPin() const { return pin; }

private:
    int pi;          ///< pigpio daemon handle (NOT owned)
    int pin;         ///< GPIO pin number
    int min_pw;      ///< Minimum pulse width (microseconds)
    int max_pw;      ///< Maximum pulse width (microseconds)
    int home_pw;     ///< Home position pulse width (microseconds)
    bool inverted;   ///< Mirror around (min_pw + max_pw) / 2
    int current_pw;  ///< Current commanded pulse width (logical)
    bool released;   ///< Pulses currently off

    int clampPulseWidth(int pw) const;

    /// Logical -> physical pulse width
    int toPhysical(int pw) const;
};

#endif // SERVO_CONTROLLER_HPP
