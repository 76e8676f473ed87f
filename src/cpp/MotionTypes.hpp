/**
 * @file MotionTypes.hpp
 * @brief Shared data model for the astromech motion core
 *
 * Plain value types exchanged between the registry, the safety validator,
 * the choreography engine, the command queue and the control protocol.
 *
 * @section Units Units
 *
 *   - Positions are servo pulse widths in microseconds (the unit pigpio's
 *     set_servo_pulsewidth() takes). 1500 us is mechanical center.
 *   - Durations and delays are milliseconds.
 *   - Speeds/accelerations on ActuatorLimits use the 0-255 controller scale;
 *     the tier ceilings (see ActuatorRegistry) are in us/s and us/s^2.
 *
 * @license MIT
 */

#ifndef MOTION_TYPES_HPP
#define MOTION_TYPES_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>


//=============================================================================
// ENUMERATIONS
//=============================================================================

/// Functional role of an actuator on the droid
enum class ServoClass { Primary, Utility, Panel, Display, Special, Expansion };

/// Mechanical range classification
enum class RangeClass { Full, Limited, Binary, Continuous };

/// Policy bundle controlling velocity/acceleration ceilings
enum class SafetyTier { Development, Testing, Production, Demonstration, Emergency };

/// What a Command asks the actuator to do
enum class CommandKind { Position, Speed, Acceleration, EmergencyStop };

/// Severity of a recorded safety violation
enum class Severity { Warning, Critical };

/**
 * @brief Motion curve families
 *
 * The In/Out/InOut suffix follows the usual convention: In accelerates from
 * rest, Out decelerates into the target, InOut does both.
 */
enum class Easing {
    Linear,
    QuadIn, QuadOut, QuadInOut,
    CubicIn, CubicOut, CubicInOut,
    QuartIn, QuartOut, QuartInOut,
    QuintIn, QuintOut, QuintInOut,
    SineIn, SineOut, SineInOut,
    ExpoIn, ExpoOut, ExpoInOut,
    CircIn, CircOut, CircInOut,
    BackIn, BackOut, BackInOut,
    ElasticIn, ElasticOut,
    BounceIn, BounceOut,
    Organic,      ///< Linear progress with a small decaying wobble
    Mechanical,   ///< Smoothstep, precise with no wobble
    Emotional     ///< Linear progress with a mid-motion emphasis
};


//=============================================================================
// ACTUATOR CONFIGURATION
//=============================================================================

/**
 * @struct ActuatorLimits
 * @brief Position and rate limits for one channel
 *
 * Invariant (checked by checkActuatorConfig()):
 *   min_position < safe_min <= safe_max < max_position
 */
struct ActuatorLimits {
    int min_position = 992;
    int max_position = 2000;
    int safe_min = 1200;
    int safe_max = 1800;
    int max_speed = 100;
    int max_acceleration = 50;
    int emergency_stop_speed = 255;
};

bool operator==(const ActuatorLimits& a, const ActuatorLimits& b);
bool operator!=(const ActuatorLimits& a, const ActuatorLimits& b);

/**
 * @struct ActuatorConfig
 * @brief Static configuration of one addressable actuator
 */
struct ActuatorConfig {
    int channel = 0;
    std::string name;
    ServoClass servo_class = ServoClass::Utility;
    RangeClass range_class = RangeClass::Limited;
    ActuatorLimits limits;
    int home_position = 1500;
    int default_speed = 50;
    int default_acceleration = 20;
    bool enabled = true;
    bool inverted = false;
    SafetyTier safety_tier = SafetyTier::Production;
};

bool operator==(const ActuatorConfig& a, const ActuatorConfig& b);
bool operator!=(const ActuatorConfig& a, const ActuatorConfig& b);

/**
 * @brief Check the limit and home-position invariants of a config
 * @return Empty string if valid, otherwise a human-readable reason
 */
std::string checkActuatorConfig(const ActuatorConfig& config);


//=============================================================================
// COMMANDS AND SEQUENCES
//=============================================================================

/**
 * @struct Command
 * @brief One requested actuator action
 */
struct Command {
    std::string id;
    int channel = 0;
    CommandKind kind = CommandKind::Position;
    double value = 0.0;
    int duration_ms = 0;
    int delay_ms = 0;
    Easing easing = Easing::Linear;
    std::chrono::system_clock::time_point created = std::chrono::system_clock::now();
};

/**
 * @struct Sequence
 * @brief Ordered list of commands with loop control
 *
 * loop_count = -1 loops until stopped.
 */
struct Sequence {
    std::string id;
    std::string name;
    std::vector<Command> commands;
    bool loop = false;
    int loop_count = 1;
};


//=============================================================================
// CHOREOGRAPHY
//=============================================================================

/**
 * @struct ChoreographyStep
 * @brief One eased movement of one channel inside a choreography
 *
 * start_position is the authored "from" value. At run time the engine
 * replaces it with wherever the channel actually is when the step begins.
 */
struct ChoreographyStep {
    int channel = 0;
    int start_position = 1500;
    int end_position = 1500;
    int duration_ms = 0;
    Easing easing = Easing::Linear;
    int delay_ms = 0;                    ///< Start offset from run start
    int hold_ms = 0;                     ///< Hold at end position
    double overshoot = 0.0;              ///< >= 0, fraction of travel
    std::string sync_group;              ///< Steps in a group end together
    int sync_offset_ms = 0;              ///< Staggers the start within the group
    double personality_modifier = 1.0;   ///< Per-step speed scaling
};

/// Audio cue fired at a fixed offset into a choreography
struct AudioSyncPoint {
    int time_ms = 0;
    std::string cue;
};

/**
 * @struct Choreography
 * @brief Named, reusable, multi-channel motion sequence
 */
struct Choreography {
    std::string key;
    std::string name;
    std::string description;
    std::vector<ChoreographyStep> steps;
    int priority = 1;                    ///< 1-10, higher is more important
    bool allows_interruption = true;
    double emotional_intensity = 1.0;    ///< Scales overshoot
    int emergency_stop_time_ms = 500;    ///< Advisory only
    int loop_count = 1;                  ///< -1 loops until stopped
    std::vector<AudioSyncPoint> audio_cues;
};


//=============================================================================
// SAFETY RECORDS
//=============================================================================

/**
 * @struct SafetyViolation
 * @brief Entry in the validator's append-only violation log
 */
struct SafetyViolation {
    std::chrono::system_clock::time_point timestamp;
    int channel = -1;                    ///< -1 for system-wide
    std::string type;
    Severity severity = Severity::Warning;
    std::string description;
    std::string action_taken;
    bool resolved = false;
};


//=============================================================================
// STRING CONVERSIONS
//=============================================================================

std::string toString(ServoClass value);
std::string toString(RangeClass value);
std::string toString(SafetyTier value);
std::string toString(CommandKind value);
std::string toString(Severity value);
std::string toString(Easing value);

std::optional<ServoClass> parseServoClass(const std::string& text);
std::optional<RangeClass> parseRangeClass(const std::string& text);
std::optional<SafetyTier> parseSafetyTier(const std::string& text);
std::optional<CommandKind> parseCommandKind(const std::string& text);
std::optional<Easing> parseEasing(const std::string& text);


//=============================================================================
// HELPERS
//=============================================================================

/// Random 8-character hex identifier for commands, sequences and runs
std::string makeShortId();

/// Seconds since the Unix epoch as used in protocol timestamps
double unixSeconds(std::chrono::system_clock::time_point tp);

/// Current wall-clock time in Unix seconds
double unixNow();

#endif // MOTION_TYPES_HPP
