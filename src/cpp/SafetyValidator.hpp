/**
 * @file SafetyValidator.hpp
 * @brief Command admission and runtime safety monitoring
 *
 * Every command passes through validate() before it can reach the engine,
 * and every position the engine writes is echoed back through monitor().
 * The validator owns the system-wide emergency-stop flag.
 *
 * @section Validation Validation Order
 *
 *   1. Channel exists and is enabled
 *   2. Emergency stop not active (emergency-stop commands pass from here)
 *   3. Position clamped into [safe_min, safe_max]  -> warning, command proceeds
 *   4. Implied velocity under the tier ceiling     -> otherwise rejected
 *   5. Active safety zones                         -> otherwise rejected (critical)
 *
 * Velocity is distance over duration_ms; a command with no duration is
 * measured over MIN_VELOCITY_WINDOW_MS.
 *
 * @section StateMachine Emergency Stop State Machine
 *
 *     NORMAL ──trigger / limit breach──> EMERGENCY_STOPPED
 *       ^                                       │
 *       └──────── reset (no unresolved ───────┘
 *                 critical violations)
 *
 * @license MIT
 */

#ifndef SAFETY_VALIDATOR_HPP
#define SAFETY_VALIDATOR_HPP

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ActuatorRegistry.hpp"
#include "MotionTypes.hpp"

/// Outcome of validate(); `command` carries the (possibly clamped) value
struct Verdict {
    bool accepted = false;
    Command command;
    std::string reason;
};

/// Generic ok/message result for validator operations
struct SafetyResult {
    bool ok = false;
    std::string message;
};

/// Named, channel-scoped position sub-range
struct SafetyZone {
    std::string name;
    std::vector<int> channels;
    int min_position = 0;
    int max_position = 0;
    bool active = true;
};

/// Snapshot for status broadcasts
struct SafetyStatus {
    bool emergency_stop = false;
    SafetyTier tier = SafetyTier::Production;
    std::size_t violation_count = 0;
    std::size_t unresolved_critical = 0;
    std::vector<std::string> zones;
};

/**
 * @class SafetyValidator
 * @brief Safety gate between callers and the choreography engine
 */
class SafetyValidator {
public:
    /// Called on the NORMAL -> EMERGENCY_STOPPED transition
    using EmergencyListener = std::function<void(const std::string& reason)>;

    /// Window used for the implied-velocity check of zero-duration commands
    static constexpr int MIN_VELOCITY_WINDOW_MS = 100;

    /// Default violation retention
    static constexpr std::chrono::seconds VIOLATION_RETENTION{3600};

    explicit SafetyValidator(ActuatorRegistry& registry);

    SafetyValidator(const SafetyValidator&) = delete;
    SafetyValidator& operator=(const SafetyValidator&) = delete;

    //=========================================================================
    // ADMISSION
    //=========================================================================

    /**
     * @brief Accept, clamp or reject a command
     *
     * @param command Command to check
     * @param from_position Position to measure velocity from instead of the
     *        last observed one (used for later commands inside a sequence)
     * @return Verdict; on acceptance `command.value` may have been clamped
     */
    Verdict validate(const Command& command,
                     std::optional<double> from_position = std::nullopt);

    /**
     * @brief Bound a choreography step target
     *
     * Same channel, emergency-stop, clamp and zone checks as validate(),
     * without the velocity check.
     *
     * @return Verdict; on acceptance `command.value` is the clamped target
     */
    Verdict checkTarget(int channel, double position);

    //=========================================================================
    // MONITORING
    //=========================================================================

    /**
     * @brief Record an observed position and check absolute limits
     *
     * A position outside [min_position, max_position] triggers an emergency
     * stop and logs a critical position_limit_exceeded violation.
     *
     * @return false on a limit breach or unknown channel
     */
    bool monitor(int channel, int observed);

    std::optional<int> lastKnownPosition(int channel) const;

    //=========================================================================
    // EMERGENCY STOP
    //=========================================================================

    /// Set the emergency-stop flag; idempotent
    void triggerEmergencyStop(const std::string& reason);

    /**
     * @brief Clear the emergency-stop flag
     *
     * Refused while any unresolved critical violation other than the
     * emergency-stop record itself remains (acknowledge it first).
     */
    SafetyResult resetEmergencyStop();

    bool isEmergencyStopped() const { return emergency_stop_.load(); }

    void addEmergencyListener(EmergencyListener listener);

    //=========================================================================
    // SAFETY ZONES
    //=========================================================================

    SafetyResult addSafetyZone(const std::string& name, const std::vector<int>& channels,
                               int min_position, int max_position);
    bool removeSafetyZone(const std::string& name);
    std::vector<SafetyZone> safetyZones() const;

    //=========================================================================
    // VIOLATION LOG
    //=========================================================================

    /// Most recent violations, oldest first
    std::vector<SafetyViolation> violations(std::size_t limit = 100) const;

    /**
     * @brief Mark outstanding violations resolved
     * @param channel Channel to acknowledge, -1 for all
     * @return Number of records changed
     */
    std::size_t acknowledgeViolations(int channel = -1);

    /// Drop records older than `retention`; unresolved critical ones stay
    std::size_t pruneViolations(std::chrono::seconds retention = VIOLATION_RETENTION);

    SafetyStatus status() const;

private:
    ActuatorRegistry& registry_;

    std::atomic<bool> emergency_stop_{false};

    mutable std::mutex mutex_;
    std::deque<SafetyViolation> violations_;
    std::map<std::string, SafetyZone> zones_;
    std::map<int, int> last_positions_;
    std::vector<EmergencyListener> listeners_;

    Verdict evaluate(const Command& command, std::optional<double> from_position,
                     bool check_velocity);
    void recordViolation(int channel, const std::string& type, Severity severity,
                         const std::string& description, const std::string& action);
    void pruneLocked(std::chrono::system_clock::time_point cutoff);
};

#endif // SAFETY_VALIDATOR_HPP
