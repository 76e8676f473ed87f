/**
 * @file ProfileStore.hpp
 * @brief Persisted actuator profiles (JSON files on disk)
 *
 * A profile is one JSON file per name inside the store directory:
 *
 *     {
 *       "metadata": {"name", "created", "version", "profile", "total_servos"},
 *       "servos": {
 *         "0": {"channel", "name", "servo_type", "servo_range",
 *               "limits": {"min_position", "max_position", "max_speed",
 *                          "max_acceleration", "safe_min", "safe_max",
 *                          "emergency_stop_speed"},
 *               "home_position", "default_speed", "default_acceleration",
 *               "enabled", "inverted", "safety_level"},
 *         ...
 *       }
 *     }
 *
 * Loading never half-applies a profile: any validation error returns the
 * error list and no configs, and the caller falls back to defaultProfile().
 *
 * @license MIT
 */

#ifndef PROFILE_STORE_HPP
#define PROFILE_STORE_HPP

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "MotionTypes.hpp"

/// Result of ProfileStore::load()
struct ProfileLoadResult {
    bool found = false;                    ///< File existed
    std::vector<ActuatorConfig> configs;   ///< Empty when errors is not
    std::vector<std::string> errors;
    std::string profile;                   ///< metadata.profile
};

class ProfileStore {
public:
    static constexpr const char* FORMAT_VERSION = "2.0";

    explicit ProfileStore(std::string directory);

    /// Compiled-in 16-channel R2-D2 layout
    static std::vector<ActuatorConfig> defaultProfile();

    static nlohmann::json toJson(const std::vector<ActuatorConfig>& configs,
                                 const std::string& name,
                                 const std::string& profile = "default");

    /**
     * @brief Check a profile document
     * @return Human-readable problems; empty if the document is usable
     */
    static std::vector<std::string> validate(const nlohmann::json& document);

    /// Convert a validated document (throws nlohmann::json::exception on type errors)
    static std::vector<ActuatorConfig> fromJson(const nlohmann::json& document);

    bool save(const std::string& name,
              const std::vector<ActuatorConfig>& configs,
              const std::string& profile = "default") const;

    ProfileLoadResult load(const std::string& name) const;

    /// Names of stored profiles, sorted
    std::vector<std::string> list() const;

    const std::string& directory() const { return directory_; }

    /// Profile names are limited to [A-Za-z0-9_-]
    static bool isValidName(const std::string& name);

private:
    std::string directory_;

    std::string pathFor(const std::string& name) const;
};

#endif // PROFILE_STORE_HPP
