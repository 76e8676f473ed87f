/**
 * @file ControlRouter.hpp
 * @brief JSON control protocol: request routing and status documents
 *
 * Transport-free half of the control server. Each inbound text frame is
 * handed to handle(), which always returns exactly one JSON response
 * carrying a `type` and a `timestamp` (Unix seconds, float).
 *
 * @section Messages Requests -> Responses
 *
 *     servo_command     {command:{channel, position, duration}}   -> command_response
 *     sequence_command  {sequence: "<choreography>" | {...}}      -> sequence_response
 *     stop_sequence     {sequence_id}                             -> sequence_response
 *     emergency_stop    {}                                        -> emergency_response
 *     emergency_reset   {acknowledge?}                            -> emergency_response
 *     config_command    {action: get|set|save|load|list|tier|
 *                                add_zone|remove_zone, ...}       -> config_response
 *     get_choreographies {}                                       -> choreography_list
 *     get_status        {}                                        -> status_update
 *
 * Malformed JSON, unknown types and handler failures produce
 * {type: "error", timestamp, message}.
 *
 * @license MIT
 */

#ifndef CONTROL_ROUTER_HPP
#define CONTROL_ROUTER_HPP

#include <atomic>
#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "ActuatorDriver.hpp"
#include "ActuatorRegistry.hpp"
#include "ChoreographyEngine.hpp"
#include "CommandQueue.hpp"
#include "ProfileStore.hpp"
#include "SafetyValidator.hpp"

class ControlRouter {
public:
    static constexpr std::size_t STATUS_VIOLATION_LIMIT = 20;

    ControlRouter(ActuatorRegistry& registry,
                  SafetyValidator& validator,
                  ChoreographyEngine& engine,
                  CommandQueue& queue,
                  ProfileStore& profiles,
                  ActuatorDriver& driver);

    ControlRouter(const ControlRouter&) = delete;
    ControlRouter& operator=(const ControlRouter&) = delete;

    /// Route one text frame
    nlohmann::json handle(const std::string& text);

    /// Route one parsed message
    nlohmann::json handleMessage(const nlohmann::json& message);

    /// Status payload (the `data` of status_update / initial_status)
    nlohmann::json statusSnapshot() const;

    nlohmann::json statusUpdate() const;
    nlohmann::json initialStatus() const;

    /// Broadcast sent to every client when the emergency stop engages
    static nlohmann::json emergencyNotice(const std::string& reason);

    static nlohmann::json error(const std::string& message);

    void setClientCount(std::size_t count) { clients_ = count; }
    std::size_t clientCount() const { return clients_.load(); }

    /// Profile name used by config_command save/load when none is given
    void setActiveProfile(const std::string& name) { active_profile_ = name; }

private:
    ActuatorRegistry& registry_;
    SafetyValidator& validator_;
    ChoreographyEngine& engine_;
    CommandQueue& queue_;
    ProfileStore& profiles_;
    ActuatorDriver& driver_;

    std::atomic<std::size_t> clients_{0};
    std::string active_profile_ = "default";

    nlohmann::json handleServoCommand(const nlohmann::json& message);
    nlohmann::json handleSequenceCommand(const nlohmann::json& message);
    nlohmann::json handleStopSequence(const nlohmann::json& message);
    nlohmann::json handleEmergencyStop(const nlohmann::json& message);
    nlohmann::json handleEmergencyReset(const nlohmann::json& message);
    nlohmann::json handleConfigCommand(const nlohmann::json& message);
    nlohmann::json handleChoreographyList() const;

    nlohmann::json configResponse(const std::string& action, bool success,
                                  const std::string& message) const;
};

#endif // CONTROL_ROUTER_HPP
