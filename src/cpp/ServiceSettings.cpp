/**
 * @file ServiceSettings.cpp
 * @brief Daemon settings parsing
 *
 * @license MIT
 */

#include "ServiceSettings.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;


namespace {

int rangeChecked(const json& document, const char* key, int fallback, int lo, int hi) {
    int value = document.value(key, fallback);
    if (value < lo || value > hi) {
        throw std::runtime_error(std::string("Setting '") + key + "' must be in ["
                                 + std::to_string(lo) + ", " + std::to_string(hi) + "], got "
                                 + std::to_string(value));
    }
    return value;
}

}  // namespace


ServiceSettings ServiceSettings::fromJson(const json& document) {
    if (!document.is_object()) {
        throw std::runtime_error("Settings must be a JSON object");
    }

    ServiceSettings settings;
    try {
        settings.bind_address = document.value("bind_address", settings.bind_address);
        settings.port = rangeChecked(document, "port", settings.port, 1, 65535);
        settings.tick_hz = rangeChecked(document, "tick_hz", settings.tick_hz, 1, 1000);
        settings.dispatch_hz = rangeChecked(document, "dispatch_hz", settings.dispatch_hz, 1, 1000);
        settings.broadcast_hz = rangeChecked(document, "broadcast_hz", settings.broadcast_hz, 1, 100);
        settings.ping_interval_s = rangeChecked(document, "ping_interval_s", settings.ping_interval_s, 1, 3600);
        settings.ping_timeout_s = rangeChecked(document, "ping_timeout_s", settings.ping_timeout_s, 1, 3600);

        settings.driver = document.value("driver", settings.driver);
        if (settings.driver != "simulated" && settings.driver != "pigpio") {
            throw std::runtime_error("Unknown driver '" + settings.driver + "'");
        }

        if (document.contains("pins")) {
            settings.pins.clear();
            for (const auto& [key, pin] : document["pins"].items()) {
                int channel = std::stoi(key);
                int gpio = pin.get<int>();
                if (channel < 0 || gpio < 0 || gpio > 53) {
                    throw std::runtime_error("Invalid pin mapping " + key + " -> " + std::to_string(gpio));
                }
                settings.pins[channel] = gpio;
            }
        }

        settings.profile_dir = document.value("profile_dir", settings.profile_dir);
        settings.profile_name = document.value("profile_name", settings.profile_name);

        if (document.contains("safety_tier")) {
            std::string text = document["safety_tier"].get<std::string>();
            auto tier = parseSafetyTier(text);
            if (!tier) {
                throw std::runtime_error("Unknown safety_tier '" + text + "'");
            }
            settings.safety_tier = *tier;
        }

        settings.audio_url = document.value("audio_url", settings.audio_url);
        settings.choreography_file = document.value("choreography_file", settings.choreography_file);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid settings: ") + e.what());
    } catch (const std::logic_error& e) {
        throw std::runtime_error(std::string("Invalid pin channel key: ") + e.what());
    }

    return settings;
}


ServiceSettings ServiceSettings::load(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        std::cout << "[Settings] " << path << " not found, using defaults" << std::endl;
        return ServiceSettings{};
    }

    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Cannot parse " + path + ": " + e.what());
    }

    ServiceSettings settings = fromJson(document);
    std::cout << "[Settings] Loaded " << path << std::endl;
    return settings;
}


void ServiceSettings::applyEnvironment() {
    if (const char* url = std::getenv("ASTROMECH_AUDIO_URL")) {
        audio_url = url;
        std::cout << "[Settings] Audio URL from environment: " << audio_url << std::endl;
    }
}


json ServiceSettings::toJson() const {
    json pin_map = json::object();
    for (const auto& [channel, gpio] : pins) {
        pin_map[std::to_string(channel)] = gpio;
    }
    return {
        {"bind_address", bind_address},
        {"port", port},
        {"tick_hz", tick_hz},
        {"dispatch_hz", dispatch_hz},
        {"broadcast_hz", broadcast_hz},
        {"ping_interval_s", ping_interval_s},
        {"ping_timeout_s", ping_timeout_s},
        {"driver", driver},
        {"pins", pin_map},
        {"profile_dir", profile_dir},
        {"profile_name", profile_name},
        {"safety_tier", toString(safety_tier)},
        {"audio_url", audio_url},
        {"choreography_file", choreography_file}
    };
}
