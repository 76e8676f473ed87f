/**
 * @file MotionTypes.cpp
 * @brief Data model helpers: invariants, string conversions, identifiers
 *
 * @license MIT
 */

#include "MotionTypes.hpp"

#include <array>
#include <random>
#include <sstream>
#include <utility>


//=============================================================================
// NAME TABLES
//=============================================================================

namespace {

template <typename E, std::size_t N>
using NameTable = std::array<std::pair<E, const char*>, N>;

const NameTable<ServoClass, 6> SERVO_CLASS_NAMES = {{
    {ServoClass::Primary, "primary"},
    {ServoClass::Utility, "utility"},
    {ServoClass::Panel, "panel"},
    {ServoClass::Display, "display"},
    {ServoClass::Special, "special"},
    {ServoClass::Expansion, "expansion"},
}};

const NameTable<RangeClass, 4> RANGE_CLASS_NAMES = {{
    {RangeClass::Full, "full"},
    {RangeClass::Limited, "limited"},
    {RangeClass::Binary, "binary"},
    {RangeClass::Continuous, "continuous"},
}};

const NameTable<SafetyTier, 5> SAFETY_TIER_NAMES = {{
    {SafetyTier::Development, "development"},
    {SafetyTier::Testing, "testing"},
    {SafetyTier::Production, "production"},
    {SafetyTier::Demonstration, "demonstration"},
    {SafetyTier::Emergency, "emergency"},
}};

const NameTable<CommandKind, 4> COMMAND_KIND_NAMES = {{
    {CommandKind::Position, "position"},
    {CommandKind::Speed, "speed"},
    {CommandKind::Acceleration, "acceleration"},
    {CommandKind::EmergencyStop, "emergency_stop"},
}};

const NameTable<Easing, 32> EASING_NAMES = {{
    {Easing::Linear, "linear"},
    {Easing::QuadIn, "quad_in"},
    {Easing::QuadOut, "quad_out"},
    {Easing::QuadInOut, "quad_in_out"},
    {Easing::CubicIn, "cubic_in"},
    {Easing::CubicOut, "cubic_out"},
    {Easing::CubicInOut, "cubic_in_out"},
    {Easing::QuartIn, "quart_in"},
    {Easing::QuartOut, "quart_out"},
    {Easing::QuartInOut, "quart_in_out"},
    {Easing::QuintIn, "quint_in"},
    {Easing::QuintOut, "quint_out"},
    {Easing::QuintInOut, "quint_in_out"},
    {Easing::SineIn, "sine_in"},
    {Easing::SineOut, "sine_out"},
    {Easing::SineInOut, "sine_in_out"},
    {Easing::ExpoIn, "expo_in"},
    {Easing::ExpoOut, "expo_out"},
    {Easing::ExpoInOut, "expo_in_out"},
    {Easing::CircIn, "circ_in"},
    {Easing::CircOut, "circ_out"},
    {Easing::CircInOut, "circ_in_out"},
    {Easing::BackIn, "back_in"},
    {Easing::BackOut, "back_out"},
    {Easing::BackInOut, "back_in_out"},
    {Easing::ElasticIn, "elastic_in"},
    {Easing::ElasticOut, "elastic_out"},
    {Easing::BounceIn, "bounce_in"},
    {Easing::BounceOut, "bounce_out"},
    {Easing::Organic, "r2d2_organic"},
    {Easing::Mechanical, "r2d2_mechanical"},
    {Easing::Emotional, "r2d2_emotional"},
}};

// Short names used by older sequence files and dashboard clients
const NameTable<Easing, 13> EASING_ALIASES = {{
    {Easing::QuadIn, "ease_in"},
    {Easing::QuadOut, "ease_out"},
    {Easing::QuadInOut, "ease_in_out"},
    {Easing::Mechanical, "smooth"},
    {Easing::CubicIn, "cubic"},
    {Easing::QuartIn, "quart"},
    {Easing::QuintIn, "quint"},
    {Easing::SineIn, "sine"},
    {Easing::ExpoIn, "expo"},
    {Easing::CircIn, "circ"},
    {Easing::BackIn, "back"},
    {Easing::ElasticIn, "elastic"},
    {Easing::BounceOut, "bounce"},
}};

template <typename E, std::size_t N>
std::string lookupName(const NameTable<E, N>& table, E value) {
    for (const auto& entry : table) {
        if (entry.first == value) {
            return entry.second;
        }
    }
    return "unknown";
}

template <typename E, std::size_t N>
std::optional<E> lookupValue(const NameTable<E, N>& table, const std::string& text) {
    for (const auto& entry : table) {
        if (text == entry.second) {
            return entry.first;
        }
    }
    return std::nullopt;
}

} // namespace


//=============================================================================
// COMPARISON
//=============================================================================

bool operator==(const ActuatorLimits& a, const ActuatorLimits& b) {
    return a.min_position == b.min_position &&
           a.max_position == b.max_position &&
           a.safe_min == b.safe_min &&
           a.safe_max == b.safe_max &&
           a.max_speed == b.max_speed &&
           a.max_acceleration == b.max_acceleration &&
           a.emergency_stop_speed == b.emergency_stop_speed;
}

bool operator!=(const ActuatorLimits& a, const ActuatorLimits& b) {
    return !(a == b);
}

bool operator==(const ActuatorConfig& a, const ActuatorConfig& b) {
    return a.channel == b.channel &&
           a.name == b.name &&
           a.servo_class == b.servo_class &&
           a.range_class == b.range_class &&
           a.limits == b.limits &&
           a.home_position == b.home_position &&
           a.default_speed == b.default_speed &&
           a.default_acceleration == b.default_acceleration &&
           a.enabled == b.enabled &&
           a.inverted == b.inverted &&
           a.safety_tier == b.safety_tier;
}

bool operator!=(const ActuatorConfig& a, const ActuatorConfig& b) {
    return !(a == b);
}


//=============================================================================
// INVARIANTS
//=============================================================================

std::string checkActuatorConfig(const ActuatorConfig& config) {
    const auto& l = config.limits;
    std::ostringstream oss;
    oss << "Channel " << config.channel << ": ";

    if (config.channel < 0) {
        oss << "negative channel id";
        return oss.str();
    }
    if (l.min_position >= l.max_position) {
        oss << "min_position " << l.min_position
            << " must be below max_position " << l.max_position;
        return oss.str();
    }
    if (l.safe_min <= l.min_position || l.safe_max >= l.max_position) {
        oss << "safe range [" << l.safe_min << ", " << l.safe_max
            << "] must lie strictly inside [" << l.min_position << ", " << l.max_position << "]";
        return oss.str();
    }
    if (l.safe_min > l.safe_max) {
        oss << "safe_min " << l.safe_min << " exceeds safe_max " << l.safe_max;
        return oss.str();
    }
    if (config.home_position < l.min_position || config.home_position > l.max_position) {
        oss << "home_position " << config.home_position << " outside limits";
        return oss.str();
    }
    return "";
}


//=============================================================================
// STRING CONVERSIONS
//=============================================================================

std::string toString(ServoClass value) { return lookupName(SERVO_CLASS_NAMES, value); }
std::string toString(RangeClass value) { return lookupName(RANGE_CLASS_NAMES, value); }
std::string toString(SafetyTier value) { return lookupName(SAFETY_TIER_NAMES, value); }
std::string toString(CommandKind value) { return lookupName(COMMAND_KIND_NAMES, value); }
std::string toString(Easing value) { return lookupName(EASING_NAMES, value); }

std::string toString(Severity value) {
    return value == Severity::Critical ? "critical" : "warning";
}

std::optional<ServoClass> parseServoClass(const std::string& text) {
    return lookupValue(SERVO_CLASS_NAMES, text);
}

std::optional<RangeClass> parseRangeClass(const std::string& text) {
    return lookupValue(RANGE_CLASS_NAMES, text);
}

std::optional<SafetyTier> parseSafetyTier(const std::string& text) {
    return lookupValue(SAFETY_TIER_NAMES, text);
}

std::optional<CommandKind> parseCommandKind(const std::string& text) {
    return lookupValue(COMMAND_KIND_NAMES, text);
}

std::optional<Easing> parseEasing(const std::string& text) {
    if (auto easing = lookupValue(EASING_NAMES, text)) {
        return easing;
    }
    return lookupValue(EASING_ALIASES, text);
}


//=============================================================================
// HELPERS
//=============================================================================

std::string makeShortId() {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<unsigned int> dist(0, 0xFFFFFFFFu);

    std::ostringstream oss;
    oss << std::hex;
    oss.width(8);
    oss.fill('0');
    oss << dist(rng);
    return oss.str();
}

double unixSeconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

double unixNow() {
    return unixSeconds(std::chrono::system_clock::now());
}
