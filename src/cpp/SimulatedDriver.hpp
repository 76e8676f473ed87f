/**
 * @file SimulatedDriver.hpp
 * @brief In-memory actuator backend
 *
 * Accepts every write while connected and remembers the last position per
 * channel. Tests use the injection hooks to simulate write failures and
 * sensor readings that disagree with the commanded position.
 *
 * @license MIT
 */

#ifndef SIMULATED_DRIVER_HPP
#define SIMULATED_DRIVER_HPP

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

#include "ActuatorDriver.hpp"

/// One recorded moveTo() call
struct DriverWrite {
    int channel;
    int position;
    int duration_ms;
};

class SimulatedDriver : public ActuatorDriver {
public:
    static constexpr int DEFAULT_POSITION = 1500;

    SimulatedDriver() = default;

    bool connect() override;
    void disconnect() override;
    bool isConnected() const override;
    bool moveTo(int channel, int position, int duration_ms) override;
    DriverStatus getStatus(int channel) const override;
    bool emergencyStopAll() override;
    void reconfigure(const std::vector<ActuatorConfig>& configs) override;
    std::string name() const override { return "simulated"; }

    //=========================================================================
    // TEST HOOKS
    //=========================================================================

    /// Make every moveTo() on `channel` fail until cleared
    void failChannel(int channel, bool fail = true);

    /// Report `position` from getStatus() regardless of what was commanded
    void forceObservedPosition(int channel, int position);
    void clearObservedPosition(int channel);

    /// Every successful write, oldest first
    std::vector<DriverWrite> writes() const;
    void clearWrites();

    int emergencyStopCount() const;

    /// Config last handed over by reconfigure()
    std::optional<ActuatorConfig> configFor(int channel) const;
    int reconfigureCount() const;

private:
    mutable std::mutex mutex_;
    bool connected_ = false;
    std::map<int, int> positions_;
    std::map<int, int> forced_;
    std::set<int> failing_;
    std::vector<DriverWrite> writes_;
    int estop_count_ = 0;
    std::map<int, ActuatorConfig> configs_;
    int reconfigure_count_ = 0;
};

#endif // SIMULATED_DRIVER_HPP
