/**
 * @file ProfileStore.cpp
 * @brief Persisted actuator profile implementation
 *
 * @license MIT
 */

#include "ProfileStore.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;
using json = nlohmann::json;


namespace {

ActuatorConfig makeConfig(int channel, const std::string& name,
                          ServoClass servo_class, RangeClass range_class,
                          int home_position) {
    ActuatorConfig config;
    config.channel = channel;
    config.name = name;
    config.servo_class = servo_class;
    config.range_class = range_class;
    config.home_position = home_position;
    return config;
}

ActuatorConfig withLimits(ActuatorConfig config, int min_position, int max_position,
                          int safe_min, int safe_max, int max_speed, int max_acceleration) {
    config.limits.min_position = min_position;
    config.limits.max_position = max_position;
    config.limits.safe_min = safe_min;
    config.limits.safe_max = safe_max;
    config.limits.max_speed = max_speed;
    config.limits.max_acceleration = max_acceleration;
    return config;
}

/// Strict non-negative decimal channel key ("7", "07"; not "-1", "7a", "")
bool parseChannelKey(const std::string& key, int& channel) {
    if (key.empty() || key.size() > 6) {
        return false;
    }
    for (char c : key) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    channel = std::stoi(key);
    return true;
}

std::string isoNow() {
    std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

}  // namespace


//=============================================================================
// CONSTRUCTOR
//=============================================================================

ProfileStore::ProfileStore(std::string directory)
    : directory_(std::move(directory))
{
}


//=============================================================================
// DEFAULTS
//=============================================================================

std::vector<ActuatorConfig> ProfileStore::defaultProfile() {
    std::vector<ActuatorConfig> configs;

    // Primary motion
    configs.push_back(withLimits(
        makeConfig(0, "Dome Rotation", ServoClass::Primary, RangeClass::Full, 1500),
        600, 2400, 800, 2200, 80, 40));
    configs.push_back(withLimits(
        makeConfig(1, "Head Tilt", ServoClass::Primary, RangeClass::Limited, 1500),
        1200, 1800, 1300, 1700, 60, 30));
    configs.push_back(withLimits(
        makeConfig(2, "Periscope", ServoClass::Utility, RangeClass::Binary, 1000),
        1000, 2000, 1100, 1900, 100, 50));
    configs.push_back(withLimits(
        makeConfig(3, "Radar Eye", ServoClass::Display, RangeClass::Full, 1500),
        600, 2400, 800, 2200, 120, 60));

    // Utility arms
    configs.push_back(makeConfig(4, "Front Utility Arm", ServoClass::Utility, RangeClass::Limited, 1200));
    configs.push_back(makeConfig(5, "Rear Utility Arm", ServoClass::Utility, RangeClass::Limited, 1200));
    configs.push_back(makeConfig(6, "Utility Arm 1", ServoClass::Utility, RangeClass::Limited, 1500));
    configs.push_back(makeConfig(7, "Utility Arm 2", ServoClass::Utility, RangeClass::Limited, 1500));

    // Panels and specials
    configs.push_back(makeConfig(8, "Door Panel 1", ServoClass::Panel, RangeClass::Binary, 1000));
    configs.push_back(makeConfig(9, "Door Panel 2", ServoClass::Panel, RangeClass::Binary, 1000));
    configs.push_back(makeConfig(10, "Door Panel 3", ServoClass::Panel, RangeClass::Binary, 1000));
    configs.push_back(makeConfig(11, "Holoprojector", ServoClass::Special, RangeClass::Binary, 1000));

    // Displays and expansion
    configs.push_back(makeConfig(12, "Logic Display 1", ServoClass::Display, RangeClass::Limited, 1500));
    configs.push_back(makeConfig(13, "Logic Display 2", ServoClass::Display, RangeClass::Limited, 1500));
    configs.push_back(makeConfig(14, "Auxiliary 1", ServoClass::Expansion, RangeClass::Limited, 1500));
    configs.push_back(makeConfig(15, "Auxiliary 2", ServoClass::Expansion, RangeClass::Limited, 1500));

    return configs;
}


//=============================================================================
// SERIALIZATION
//=============================================================================

json ProfileStore::toJson(const std::vector<ActuatorConfig>& configs,
                          const std::string& name,
                          const std::string& profile) {
    json servos = json::object();
    for (const auto& config : configs) {
        const auto& l = config.limits;
        servos[std::to_string(config.channel)] = {
            {"channel", config.channel},
            {"name", config.name},
            {"servo_type", toString(config.servo_class)},
            {"servo_range", toString(config.range_class)},
            {"limits", {
                {"min_position", l.min_position},
                {"max_position", l.max_position},
                {"max_speed", l.max_speed},
                {"max_acceleration", l.max_acceleration},
                {"safe_min", l.safe_min},
                {"safe_max", l.safe_max},
                {"emergency_stop_speed", l.emergency_stop_speed}
            }},
            {"home_position", config.home_position},
            {"default_speed", config.default_speed},
            {"default_acceleration", config.default_acceleration},
            {"enabled", config.enabled},
            {"inverted", config.inverted},
            {"safety_level", toString(config.safety_tier)}
        };
    }

    return {
        {"metadata", {
            {"name", name},
            {"created", isoNow()},
            {"version", FORMAT_VERSION},
            {"profile", profile},
            {"total_servos", configs.size()}
        }},
        {"servos", servos}
    };
}


std::vector<ActuatorConfig> ProfileStore::fromJson(const json& document) {
    std::vector<ActuatorConfig> configs;

    for (const auto& [key, servo] : document.at("servos").items()) {
        ActuatorConfig config;
        int channel = 0;
        if (!parseChannelKey(key, channel)) {
            throw std::invalid_argument("Invalid channel identifier: " + key);
        }
        config.channel = servo.value("channel", channel);
        config.name = servo.value("name", "Servo_" + std::to_string(config.channel));

        auto servo_class = parseServoClass(servo.value("servo_type", "utility"));
        auto range_class = parseRangeClass(servo.value("servo_range", "limited"));
        auto tier = parseSafetyTier(servo.value("safety_level", "production"));
        if (servo_class) config.servo_class = *servo_class;
        if (range_class) config.range_class = *range_class;
        if (tier) config.safety_tier = *tier;

        if (servo.contains("limits")) {
            const json& l = servo.at("limits");
            config.limits.min_position = l.value("min_position", config.limits.min_position);
            config.limits.max_position = l.value("max_position", config.limits.max_position);
            config.limits.max_speed = l.value("max_speed", config.limits.max_speed);
            config.limits.max_acceleration = l.value("max_acceleration", config.limits.max_acceleration);
            config.limits.safe_min = l.value("safe_min", config.limits.safe_min);
            config.limits.safe_max = l.value("safe_max", config.limits.safe_max);
            config.limits.emergency_stop_speed =
                l.value("emergency_stop_speed", config.limits.emergency_stop_speed);
        }

        config.home_position = servo.value("home_position", config.home_position);
        config.default_speed = servo.value("default_speed", config.default_speed);
        config.default_acceleration = servo.value("default_acceleration", config.default_acceleration);
        config.enabled = servo.value("enabled", config.enabled);
        config.inverted = servo.value("inverted", config.inverted);

        configs.push_back(config);
    }

    std::sort(configs.begin(), configs.end(),
              [](const ActuatorConfig& a, const ActuatorConfig& b) { return a.channel < b.channel; });
    return configs;
}


//=============================================================================
// VALIDATION
//=============================================================================

std::vector<std::string> ProfileStore::validate(const json& document) {
    std::vector<std::string> errors;

    if (!document.is_object()) {
        errors.push_back("Profile is not a JSON object");
        return errors;
    }

    if (!document.contains("metadata") || !document["metadata"].is_object()) {
        errors.push_back("Missing metadata section");
    } else if (!document["metadata"].contains("version")) {
        errors.push_back("Missing version in metadata");
    }

    if (!document.contains("servos") || !document["servos"].is_object()) {
        errors.push_back("Missing servos section");
        return errors;
    }

    std::set<int> seen;
    for (const auto& [key, servo] : document["servos"].items()) {
        int channel = 0;
        if (!parseChannelKey(key, channel)) {
            errors.push_back("Invalid channel identifier: " + key);
            continue;
        }
        std::string prefix = "Channel " + std::to_string(channel) + ": ";

        if (!seen.insert(channel).second) {
            errors.push_back("Duplicate channel: " + std::to_string(channel));
            continue;
        }
        if (!servo.is_object()) {
            errors.push_back(prefix + "Entry is not an object");
            continue;
        }

        try {
            if (servo.contains("channel") && servo["channel"].get<int>() != channel) {
                errors.push_back(prefix + "Key does not match channel field "
                                 + std::to_string(servo["channel"].get<int>()));
            }
            if (!servo.contains("name") || servo["name"].get<std::string>().empty()) {
                errors.push_back(prefix + "Missing name");
            }

            if (servo.contains("servo_type") && !parseServoClass(servo["servo_type"].get<std::string>())) {
                errors.push_back(prefix + "Unknown servo_type '" + servo["servo_type"].get<std::string>() + "'");
            }
            if (servo.contains("servo_range") && !parseRangeClass(servo["servo_range"].get<std::string>())) {
                errors.push_back(prefix + "Unknown servo_range '" + servo["servo_range"].get<std::string>() + "'");
            }
            if (servo.contains("safety_level") && !parseSafetyTier(servo["safety_level"].get<std::string>())) {
                errors.push_back(prefix + "Unknown safety_level '" + servo["safety_level"].get<std::string>() + "'");
            }

            // Limit and home invariants on the fully-defaulted config
            json single = {{"servos", {{key, servo}}}};
            ActuatorConfig config = fromJson(single).front();
            const auto& l = config.limits;
            if (l.min_position >= l.max_position) {
                errors.push_back(prefix + "Invalid position limits");
            } else if (l.safe_min <= l.min_position || l.safe_max >= l.max_position
                       || l.safe_min > l.safe_max) {
                errors.push_back(prefix + "Safe limits exceed position limits");
            } else if (config.home_position < l.min_position || config.home_position > l.max_position) {
                errors.push_back(prefix + "Home position outside limits");
            }
        } catch (const json::exception& e) {
            errors.push_back(prefix + "Malformed entry (" + e.what() + ")");
        }
    }

    return errors;
}


//=============================================================================
// FILES
//=============================================================================

bool ProfileStore::isValidName(const std::string& name) {
    if (name.empty() || name.size() > 64) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
    });
}


std::string ProfileStore::pathFor(const std::string& name) const {
    return (fs::path(directory_) / (name + ".json")).string();
}


bool ProfileStore::save(const std::string& name,
                        const std::vector<ActuatorConfig>& configs,
                        const std::string& profile) const {
    if (!isValidName(name)) {
        std::cerr << "[Profile] Refusing to save invalid profile name '" << name << "'" << std::endl;
        return false;
    }

    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        std::cerr << "[Profile] Cannot create " << directory_ << ": " << ec.message() << std::endl;
        return false;
    }

    // Write beside the target, then rename over it
    std::string path = pathFor(name);
    std::string tmp_path = path + ".tmp";
    {
        std::ofstream file(tmp_path);
        if (!file) {
            std::cerr << "[Profile] Cannot open " << tmp_path << " for writing" << std::endl;
            return false;
        }
        file << toJson(configs, name, profile).dump(2) << std::endl;
        if (!file) {
            std::cerr << "[Profile] Write to " << tmp_path << " failed" << std::endl;
            return false;
        }
    }

    fs::rename(tmp_path, path, ec);
    if (ec) {
        std::cerr << "[Profile] Cannot replace " << path << ": " << ec.message() << std::endl;
        fs::remove(tmp_path, ec);
        return false;
    }

    std::cout << "[Profile] Saved '" << name << "' (" << configs.size() << " servos) to "
              << path << std::endl;
    return true;
}


ProfileLoadResult ProfileStore::load(const std::string& name) const {
    ProfileLoadResult result;

    if (!isValidName(name)) {
        result.errors.push_back("Invalid profile name: " + name);
        return result;
    }

    std::string path = pathFor(name);
    std::ifstream file(path);
    if (!file) {
        std::cout << "[Profile] No profile '" << name << "' at " << path << std::endl;
        return result;
    }
    result.found = true;

    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        result.errors.push_back(std::string("JSON parse error: ") + e.what());
        std::cerr << "[Profile] " << path << ": " << result.errors.back() << std::endl;
        return result;
    }

    result.errors = validate(document);
    if (!result.errors.empty()) {
        std::cerr << "[Profile] '" << name << "' has " << result.errors.size()
                  << " error(s):" << std::endl;
        for (const auto& error : result.errors) {
            std::cerr << "[Profile]   " << error << std::endl;
        }
        return result;
    }

    try {
        result.configs = fromJson(document);
    } catch (const std::exception& e) {
        result.errors.push_back(e.what());
        return result;
    }
    result.profile = document["metadata"].value("profile", "default");

    std::cout << "[Profile] Loaded '" << name << "' (" << result.configs.size()
              << " servos, profile " << result.profile << ")" << std::endl;
    return result;
}


std::vector<std::string> ProfileStore::list() const {
    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) {
        return names;
    }
    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            names.push_back(entry.path().stem().string());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}
