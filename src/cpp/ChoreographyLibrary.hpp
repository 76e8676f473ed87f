/**
 * @file ChoreographyLibrary.hpp
 * @brief Named multi-channel choreographies
 *
 * Ships a built-in set of dome (channel 0) and head tilt (channel 1)
 * choreographies and can load more from a JSON file:
 *
 * @code{.json}
 *     {
 *       "choreographies": [
 *         {
 *           "key": "double_take",
 *           "name": "Double Take",
 *           "priority": 4,
 *           "allows_interruption": true,
 *           "emotional_intensity": 1.0,
 *           "loop_count": 1,
 *           "steps": [
 *             {"channel": 0, "end_position": 1800, "duration_ms": 300,
 *              "easing": "quad_out", "delay_ms": 0, "hold_ms": 200}
 *           ],
 *           "audio_cues": [{"time_ms": 0, "cue": "surprised"}]
 *         }
 *       ]
 *     }
 * @endcode
 *
 * Step delays are offsets from the start of the run.
 *
 * @license MIT
 */

#ifndef CHOREOGRAPHY_LIBRARY_HPP
#define CHOREOGRAPHY_LIBRARY_HPP

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "MotionTypes.hpp"

/// Result of loading choreographies from JSON
struct LibraryLoadReport {
    std::size_t loaded = 0;
    std::vector<std::string> errors;
};

/// Empty string if the choreography is well formed, otherwise the reason
std::string checkChoreography(const Choreography& choreography);

class ChoreographyLibrary {
public:
    explicit ChoreographyLibrary(bool with_builtins = true);

    ChoreographyLibrary(const ChoreographyLibrary&) = delete;
    ChoreographyLibrary& operator=(const ChoreographyLibrary&) = delete;

    /// The compiled-in choreographies
    static std::vector<Choreography> builtins();

    std::optional<Choreography> find(const std::string& key) const;
    bool contains(const std::string& key) const;

    /// Every choreography ordered by key
    std::vector<Choreography> all() const;

    /// Add or replace; false (and logged) if the choreography is malformed
    bool add(const Choreography& choreography);

    /// Parse a `{"choreographies": [...]}` document
    LibraryLoadReport loadJson(const nlohmann::json& document);

    /// Read and parse a choreography file
    LibraryLoadReport loadFile(const std::string& path);

private:
    mutable std::mutex mutex_;
    std::map<std::string, Choreography> choreographies_;
};

#endif // CHOREOGRAPHY_LIBRARY_HPP
