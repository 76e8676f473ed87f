/**
 * @file ControlRouter.cpp
 * @brief JSON control protocol implementation
 *
 * @license MIT
 */

#include "ControlRouter.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <vector>

using json = nlohmann::json;


namespace {

json runToJson(const RunInfo& info) {
    return {
        {"id", info.id},
        {"name", info.name},
        {"kind", toString(info.kind)},
        {"status", toString(info.status)},
        {"priority", info.priority},
        {"allows_interruption", info.allows_interruption},
        {"loops_completed", info.loops_completed},
        {"elapsed_ms", info.elapsed_ms},
        {"reason", info.reason}
    };
}

json violationToJson(const SafetyViolation& v) {
    return {
        {"timestamp", unixSeconds(v.timestamp)},
        {"channel", v.channel},
        {"type", v.type},
        {"severity", toString(v.severity)},
        {"description", v.description},
        {"action_taken", v.action_taken},
        {"resolved", v.resolved}
    };
}

Easing easingFrom(const json& data) {
    if (!data.contains("easing")) {
        return Easing::Linear;
    }
    std::string text = data["easing"].get<std::string>();
    auto easing = parseEasing(text);
    if (!easing) {
        throw std::invalid_argument("unknown easing '" + text + "'");
    }
    return *easing;
}

/// One command object: {channel, type?, value|position, duration?, delay?, easing?}
Command commandFrom(const json& data) {
    Command command;
    if (!data.contains("channel")) {
        throw std::invalid_argument("missing channel");
    }
    command.channel = data["channel"].get<int>();

    std::string type = data.value("type", "position");
    auto kind = parseCommandKind(type);
    if (!kind) {
        throw std::invalid_argument("unknown command type '" + type + "'");
    }
    command.kind = *kind;

    if (data.contains("value")) {
        command.value = data["value"].get<double>();
    } else if (data.contains("position")) {
        command.value = data["position"].get<double>();
    } else if (command.kind != CommandKind::EmergencyStop) {
        throw std::invalid_argument("missing value");
    }

    command.duration_ms = data.value("duration", 0);
    command.delay_ms = data.value("delay", 0);
    command.easing = easingFrom(data);
    return command;
}

ActuatorPatch patchFrom(const json& data) {
    ActuatorPatch patch;
    const json& limits = data.contains("limits") ? data["limits"] : data;

    if (data.contains("name")) patch.name = data["name"].get<std::string>();
    if (data.contains("servo_type")) {
        std::string text = data["servo_type"].get<std::string>();
        patch.servo_class = parseServoClass(text);
        if (!patch.servo_class) throw std::invalid_argument("unknown servo_type '" + text + "'");
    }
    if (data.contains("servo_range")) {
        std::string text = data["servo_range"].get<std::string>();
        patch.range_class = parseRangeClass(text);
        if (!patch.range_class) throw std::invalid_argument("unknown servo_range '" + text + "'");
    }
    if (data.contains("safety_level")) {
        std::string text = data["safety_level"].get<std::string>();
        patch.safety_tier = parseSafetyTier(text);
        if (!patch.safety_tier) throw std::invalid_argument("unknown safety_level '" + text + "'");
    }

    if (limits.contains("min_position")) patch.min_position = limits["min_position"].get<int>();
    if (limits.contains("max_position")) patch.max_position = limits["max_position"].get<int>();
    if (limits.contains("safe_min")) patch.safe_min = limits["safe_min"].get<int>();
    if (limits.contains("safe_max")) patch.safe_max = limits["safe_max"].get<int>();
    if (limits.contains("max_speed")) patch.max_speed = limits["max_speed"].get<int>();
    if (limits.contains("max_acceleration")) patch.max_acceleration = limits["max_acceleration"].get<int>();
    if (limits.contains("emergency_stop_speed")) {
        patch.emergency_stop_speed = limits["emergency_stop_speed"].get<int>();
    }

    if (data.contains("home_position")) patch.home_position = data["home_position"].get<int>();
    if (data.contains("default_speed")) patch.default_speed = data["default_speed"].get<int>();
    if (data.contains("default_acceleration")) {
        patch.default_acceleration = data["default_acceleration"].get<int>();
    }
    if (data.contains("enabled")) patch.enabled = data["enabled"].get<bool>();
    if (data.contains("inverted")) patch.inverted = data["inverted"].get<bool>();
    return patch;
}

}  // namespace


//=============================================================================
// CONSTRUCTOR
//=============================================================================

ControlRouter::ControlRouter(ActuatorRegistry& registry,
                             SafetyValidator& validator,
                             ChoreographyEngine& engine,
                             CommandQueue& queue,
                             ProfileStore& profiles,
                             ActuatorDriver& driver)
    : registry_(registry),
      validator_(validator),
      engine_(engine),
      queue_(queue),
      profiles_(profiles),
      driver_(driver)
{
}


//=============================================================================
// ROUTING
//=============================================================================

json ControlRouter::handle(const std::string& text) {
    json message;
    try {
        message = json::parse(text);
    } catch (const json::parse_error& e) {
        std::cerr << "[Server] Invalid JSON in message: " << e.what() << std::endl;
        return error("Invalid JSON format");
    }
    return handleMessage(message);
}


json ControlRouter::handleMessage(const json& message) {
    if (!message.is_object()) {
        return error("Message must be a JSON object");
    }
    if (message.contains("type") && !message["type"].is_string()) {
        return error("Message type must be a string");
    }
    std::string type = message.value("type", "unknown");

    try {
        if (type == "servo_command") return handleServoCommand(message);
        if (type == "sequence_command") return handleSequenceCommand(message);
        if (type == "stop_sequence") return handleStopSequence(message);
        if (type == "emergency_stop") return handleEmergencyStop(message);
        if (type == "emergency_reset") return handleEmergencyReset(message);
        if (type == "config_command") return handleConfigCommand(message);
        if (type == "get_choreographies") return handleChoreographyList();
        if (type == "get_status") return statusUpdate();
    } catch (const std::exception& e) {
        std::cerr << "[Server] Handler error for " << type << ": " << e.what() << std::endl;
        return error("Handler error: " + std::string(e.what()));
    }

    std::cout << "[Server] Unknown message type: " << type << std::endl;
    return error("Unknown message type: " + type);
}


json ControlRouter::error(const std::string& message) {
    return {
        {"type", "error"},
        {"timestamp", unixNow()},
        {"message", message}
    };
}


//=============================================================================
// MOTION REQUESTS
//=============================================================================

json ControlRouter::handleServoCommand(const json& message) {
    json data = message.contains("command") ? message["command"] : message;
    if (!message.contains("command")) {
        data.erase("type");   // the message type, not a command kind
    }
    if (!data.contains("channel") || !(data.contains("position") || data.contains("value"))) {
        return error("Missing channel or position");
    }

    Command command = commandFrom(data);
    Admission admission = queue_.submit(command);

    json response = {
        {"type", "command_response"},
        {"timestamp", unixNow()},
        {"success", admission.accepted},
        {"command_id", admission.accepted ? json(admission.id) : json(nullptr)}
    };
    if (!admission.accepted) {
        response["message"] = admission.reason;
    }
    return response;
}


json ControlRouter::handleSequenceCommand(const json& message) {
    if (!message.contains("sequence")) {
        return error("Missing sequence");
    }
    const json& data = message["sequence"];
    double modifier = message.value("personality_modifier", 1.0);
    std::optional<double> intensity;
    if (message.contains("emotional_intensity")) {
        intensity = message["emotional_intensity"].get<double>();
    }

    Admission admission;
    if (data.is_string()) {
        admission = queue_.submitChoreography(data.get<std::string>(), modifier, intensity);
    } else if (data.is_object() && !data.contains("commands")) {
        // {"name": "<choreography>"} without inline commands
        admission = queue_.submitChoreography(data.value("name", ""), modifier, intensity);
    } else if (data.is_object()) {
        Sequence sequence;
        sequence.name = data.value("name", "unnamed");
        sequence.loop = data.value("loop", false);
        sequence.loop_count = data.value("loop_count", 1);
        for (const auto& entry : data["commands"]) {
            sequence.commands.push_back(commandFrom(entry));
        }
        admission = queue_.submit(sequence, message.value("priority", 1));
    } else {
        return error("sequence must be a name or an object");
    }

    json response = {
        {"type", "sequence_response"},
        {"timestamp", unixNow()},
        {"success", admission.accepted},
        {"sequence_id", admission.accepted ? json(admission.id) : json(nullptr)}
    };
    if (!admission.accepted) {
        response["message"] = admission.reason;
    }
    return response;
}


json ControlRouter::handleStopSequence(const json& message) {
    bool success = true;
    json id = nullptr;
    if (message.contains("sequence_id")) {
        std::string sequence_id = message["sequence_id"].get<std::string>();
        success = queue_.cancel(sequence_id);
        id = sequence_id;
    } else {
        engine_.stopAll();
    }

    return {
        {"type", "sequence_response"},
        {"timestamp", unixNow()},
        {"success", success},
        {"sequence_id", id},
        {"action", "stop"}
    };
}


//=============================================================================
// EMERGENCY
//=============================================================================

json ControlRouter::handleEmergencyStop(const json& message) {
    std::string reason = message.value("reason", "client request");
    engine_.emergencyStop(reason);
    return {
        {"type", "emergency_response"},
        {"timestamp", unixNow()},
        {"success", true},
        {"message", "Emergency stop activated"}
    };
}


json ControlRouter::handleEmergencyReset(const json& message) {
    if (message.value("acknowledge", false)) {
        std::size_t cleared = validator_.acknowledgeViolations();
        std::cout << "[Server] Acknowledged " << cleared << " violation(s) before reset" << std::endl;
    }
    SafetyResult result = validator_.resetEmergencyStop();
    return {
        {"type", "emergency_response"},
        {"timestamp", unixNow()},
        {"success", result.ok},
        {"message", result.message}
    };
}


json ControlRouter::emergencyNotice(const std::string& reason) {
    return {
        {"type", "emergency_stop_activated"},
        {"timestamp", unixNow()},
        {"reason", reason}
    };
}


//=============================================================================
// CONFIGURATION
//=============================================================================

json ControlRouter::configResponse(const std::string& action, bool success,
                                   const std::string& message) const {
    return {
        {"type", "config_response"},
        {"timestamp", unixNow()},
        {"action", action},
        {"success", success},
        {"message", message}
    };
}


json ControlRouter::handleConfigCommand(const json& message) {
    std::string action = message.value("action", "get");

    if (action == "get") {
        json response = configResponse(action, true, "");
        json profile = ProfileStore::toJson(registry_.all(), active_profile_, toString(registry_.safetyTier()));
        if (message.contains("channel")) {
            std::string key = std::to_string(message["channel"].get<int>());
            if (!profile["servos"].contains(key)) {
                return configResponse(action, false, "unknown channel " + key);
            }
            response["config"] = profile["servos"][key];
        } else {
            response["config"] = profile;
        }
        response["safety_tier"] = toString(registry_.safetyTier());
        return response;
    }

    if (action == "set") {
        if (!message.contains("channel")) {
            return configResponse(action, false, "missing channel");
        }
        int channel = message["channel"].get<int>();
        const json& fields = message.contains("config") ? message["config"] : message;
        RegistryResult result = registry_.upsert(channel, patchFrom(fields));
        if (result.ok) {
            driver_.reconfigure(registry_.all());
        }
        json response = configResponse(action, result.ok, result.ok ? "updated" : result.error);
        response["channel"] = channel;
        return response;
    }

    if (action == "save") {
        std::string name = message.value("name", active_profile_);
        bool ok = profiles_.save(name, registry_.all(), toString(registry_.safetyTier()));
        return configResponse(action, ok, ok ? "saved " + name : "could not save " + name);
    }

    if (action == "load") {
        std::string name = message.value("name", active_profile_);
        ProfileLoadResult loaded = profiles_.load(name);
        if (!loaded.found && loaded.errors.empty()) {
            return configResponse(action, false, "no profile named " + name);
        }
        if (!loaded.errors.empty()) {
            json response = configResponse(action, false, "profile " + name + " is invalid");
            response["errors"] = loaded.errors;
            return response;
        }
        RegistryResult result = registry_.replaceAll(loaded.configs);
        if (result.ok) {
            active_profile_ = name;
            driver_.reconfigure(registry_.all());
        }
        return configResponse(action, result.ok, result.ok ? "loaded " + name : result.error);
    }

    if (action == "list") {
        json response = configResponse(action, true, "");
        response["profiles"] = profiles_.list();
        response["active"] = active_profile_;
        return response;
    }

    if (action == "tier") {
        std::string text = message.value("tier", "");
        auto tier = parseSafetyTier(text);
        if (!tier) {
            return configResponse(action, false, "unknown tier '" + text + "'");
        }
        registry_.applySafetyTier(*tier);
        driver_.reconfigure(registry_.all());
        return configResponse(action, true, "safety tier " + toString(*tier));
    }

    if (action == "add_zone") {
        SafetyResult result = validator_.addSafetyZone(
            message.at("name").get<std::string>(),
            message.at("channels").get<std::vector<int>>(),
            message.at("min_position").get<int>(),
            message.at("max_position").get<int>());
        return configResponse(action, result.ok, result.message);
    }

    if (action == "remove_zone") {
        std::string name = message.at("name").get<std::string>();
        bool ok = validator_.removeSafetyZone(name);
        return configResponse(action, ok, ok ? "removed " + name : "no zone named " + name);
    }

    return configResponse(action, false, "unknown action '" + action + "'");
}


//=============================================================================
// STATUS
//=============================================================================

json ControlRouter::handleChoreographyList() const {
    json list = json::array();
    for (const auto& c : engine_.listChoreographies()) {
        list.push_back({
            {"key", c.key},
            {"name", c.name},
            {"description", c.description},
            {"priority", c.priority},
            {"allows_interruption", c.allows_interruption},
            {"emotional_intensity", c.emotional_intensity},
            {"steps", c.steps.size()}
        });
    }
    return {
        {"type", "choreography_list"},
        {"timestamp", unixNow()},
        {"choreographies", list}
    };
}


json ControlRouter::statusSnapshot() const {
    EngineStatus engine = engine_.status();
    SafetyStatus safety = validator_.status();

    json positions = json::object();
    for (const auto& [channel, position] : engine.positions) {
        positions[std::to_string(channel)] = position;
    }

    json background = json::array();
    for (const auto& info : engine.background) {
        background.push_back(runToJson(info));
    }

    json violations = json::array();
    for (const auto& v : validator_.violations(STATUS_VIOLATION_LIMIT)) {
        violations.push_back(violationToJson(v));
    }

    return {
        {"server_time", unixNow()},
        {"connected_clients", clients_.load()},
        {"websocket_status", "running"},
        {"driver", {
            {"name", driver_.name()},
            {"connected", driver_.isConnected()}
        }},
        {"emergency_stop", safety.emergency_stop},
        {"safety", {
            {"tier", toString(safety.tier)},
            {"violation_count", safety.violation_count},
            {"unresolved_critical", safety.unresolved_critical},
            {"zones", safety.zones},
            {"recent_violations", violations}
        }},
        {"engine", {
            {"running", engine.running},
            {"tick_hz", engine.tick_hz},
            {"ticks", engine.ticks},
            {"foreground", engine.foreground ? runToJson(*engine.foreground) : json(nullptr)},
            {"background", background}
        }},
        {"queue", {
            {"pending", queue_.pendingIds()}
        }},
        {"servo_count", registry_.size()},
        {"profile", active_profile_},
        {"positions", positions}
    };
}


json ControlRouter::statusUpdate() const {
    return {
        {"type", "status_update"},
        {"timestamp", unixNow()},
        {"data", statusSnapshot()}
    };
}


json ControlRouter::initialStatus() const {
    return {
        {"type", "initial_status"},
        {"timestamp", unixNow()},
        {"data", statusSnapshot()}
    };
}
