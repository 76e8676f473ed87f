/**
 * @file ActuatorRegistry.hpp
 * @brief Per-channel actuator configuration store
 *
 * Holds the static configuration of every channel (limits, home position,
 * safety tier) and derives the velocity/acceleration ceilings the safety
 * validator enforces. Everything else in the motion core reads from here.
 *
 * @section TierTable Safety Tier Ceilings
 *
 *     Tier            max velocity (us/s)   max acceleration (us/s^2)
 *     development            1000                  2000
 *     testing                 750                  1500
 *     production              500                  1000
 *     demonstration           300                   500
 *     emergency               100                   200
 *
 * @section Threading Threading
 *
 * All access is serialized by an internal mutex. Accessors return copies so
 * callers never hold references into the guarded map.
 *
 * @license MIT
 */

#ifndef ACTUATOR_REGISTRY_HPP
#define ACTUATOR_REGISTRY_HPP

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "MotionTypes.hpp"

/// Velocity/acceleration bounds for one safety tier
struct MotionCeiling {
    double max_velocity;
    double max_acceleration;
};

/// Look up the ceiling row for a tier
MotionCeiling tierCeiling(SafetyTier tier);

/**
 * @struct ActuatorPatch
 * @brief Partial update applied by ActuatorRegistry::upsert()
 *
 * Unset fields keep their current value.
 */
struct ActuatorPatch {
    std::optional<std::string> name;
    std::optional<ServoClass> servo_class;
    std::optional<RangeClass> range_class;
    std::optional<int> min_position;
    std::optional<int> max_position;
    std::optional<int> safe_min;
    std::optional<int> safe_max;
    std::optional<int> max_speed;
    std::optional<int> max_acceleration;
    std::optional<int> emergency_stop_speed;
    std::optional<int> home_position;
    std::optional<int> default_speed;
    std::optional<int> default_acceleration;
    std::optional<bool> enabled;
    std::optional<bool> inverted;
    std::optional<SafetyTier> safety_tier;

    /// Apply every set field onto a config
    void applyTo(ActuatorConfig& config) const;
};

/// Result of a registry mutation
struct RegistryResult {
    bool ok = false;
    std::string error;
};

/**
 * @class ActuatorRegistry
 * @brief Thread-safe map of channel -> ActuatorConfig
 *
 * Channels are never removed; disable them with a patch instead.
 */
class ActuatorRegistry {
public:
    ActuatorRegistry() = default;

    /// Seed with an initial profile (invalid entries are skipped and logged)
    explicit ActuatorRegistry(const std::vector<ActuatorConfig>& configs);

    ActuatorRegistry(const ActuatorRegistry&) = delete;
    ActuatorRegistry& operator=(const ActuatorRegistry&) = delete;

    //=========================================================================
    // QUERIES
    //=========================================================================

    std::optional<ActuatorConfig> get(int channel) const;

    /// All configs ordered by channel id
    std::vector<ActuatorConfig> all() const;

    bool contains(int channel) const;
    std::size_t size() const;

    /// Tier applied by the last applySafetyTier() call
    SafetyTier safetyTier() const;

    /// Velocity ceiling for a channel (us/s); 0 for unknown channels
    double velocityCeiling(int channel) const;

    /// Acceleration ceiling for a channel (us/s^2); 0 for unknown channels
    double accelerationCeiling(int channel) const;

    //=========================================================================
    // MUTATION
    //=========================================================================

    /**
     * @brief Create or update a channel
     *
     * The patch is applied to a copy; the copy replaces the stored entry only
     * if it satisfies the limit invariants. New channels start from the
     * built-in ActuatorConfig defaults.
     */
    RegistryResult upsert(int channel, const ActuatorPatch& patch);

    /**
     * @brief Replace the whole table (profile load)
     *
     * All-or-nothing: nothing changes if any entry is invalid. Channels
     * absent from `configs` are kept with enabled = false.
     */
    RegistryResult replaceAll(const std::vector<ActuatorConfig>& configs);

    /**
     * @brief Move every channel to a safety tier
     *
     * Lowers or raises the derived velocity/acceleration ceilings. Position
     * limits are untouched.
     */
    void applySafetyTier(SafetyTier tier);

private:
    mutable std::mutex mutex_;
    std::map<int, ActuatorConfig> configs_;
    SafetyTier tier_ = SafetyTier::Production;
};

#endif // ACTUATOR_REGISTRY_HPP
