/**
 * @file ServiceSettings.hpp
 * @brief Daemon settings loaded from a JSON file
 *
 * @section Example Example settings.json
 *
 *     {
 *       "port": 8767,
 *       "tick_hz": 60,
 *       "dispatch_hz": 20,
 *       "broadcast_hz": 10,
 *       "driver": "pigpio",
 *       "pins": {"0": 17, "1": 27},
 *       "profile_dir": "servo_configs",
 *       "profile_name": "default",
 *       "safety_tier": "production",
 *       "audio_url": "http://localhost:8765/audio",
 *       "choreography_file": "choreographies.json"
 *     }
 *
 * Every key is optional. ASTROMECH_AUDIO_URL in the environment overrides
 * audio_url.
 *
 * @license MIT
 */

#ifndef SERVICE_SETTINGS_HPP
#define SERVICE_SETTINGS_HPP

#include <map>
#include <string>

#include <nlohmann/json.hpp>

#include "MotionTypes.hpp"

struct ServiceSettings {
    std::string bind_address = "0.0.0.0";
    int port = 8767;
    int tick_hz = 60;
    int dispatch_hz = 20;
    int broadcast_hz = 10;
    int ping_interval_s = 30;
    int ping_timeout_s = 10;

    std::string driver = "simulated";            ///< "simulated" | "pigpio"
    std::map<int, int> pins{{0, 17}, {1, 27}};   ///< channel -> GPIO (BCM)

    std::string profile_dir = "servo_configs";
    std::string profile_name = "default";
    SafetyTier safety_tier = SafetyTier::Production;

    std::string audio_url;                       ///< Empty disables audio cues
    std::string choreography_file;               ///< Extra choreographies, optional

    /**
     * @brief Build settings from a parsed document
     * @throws std::runtime_error on out-of-range or mistyped values
     */
    static ServiceSettings fromJson(const nlohmann::json& document);

    /**
     * @brief Load from a file; a missing file yields defaults
     * @throws std::runtime_error if the file exists but is invalid
     */
    static ServiceSettings load(const std::string& path);

    /// Apply environment overrides (ASTROMECH_AUDIO_URL)
    void applyEnvironment();

    nlohmann::json toJson() const;
};

#endif // SERVICE_SETTINGS_HPP
