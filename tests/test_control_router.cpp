/**
 * @file test_control_router.cpp
 * @brief Control protocol routing and response documents
 *
 * @license MIT
 */

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "ActuatorRegistry.hpp"
#include "ChoreographyEngine.hpp"
#include "ChoreographyLibrary.hpp"
#include "CommandQueue.hpp"
#include "ControlRouter.hpp"
#include "ProfileStore.hpp"
#include "SafetyValidator.hpp"
#include "SimulatedDriver.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;


class ControlRouterTest : public ::testing::Test {
protected:
    ControlRouterTest()
        : registry_(ProfileStore::defaultProfile()),
          validator_(registry_),
          engine_(registry_, validator_, driver_, library_),
          queue_(registry_, validator_, engine_),
          dir_(fs::temp_directory_path() / ("astromech_router_"
               + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()))),
          profiles_(dir_.string()),
          router_(registry_, validator_, engine_, queue_, profiles_, driver_)
    {
        driver_.connect();
    }

    ~ControlRouterTest() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    json send(const json& message) {
        json response = router_.handle(message.dump());
        EXPECT_TRUE(response.contains("type"));
        EXPECT_TRUE(response.contains("timestamp"));
        return response;
    }

    ActuatorRegistry registry_;
    SafetyValidator validator_;
    SimulatedDriver driver_;
    ChoreographyLibrary library_;
    ChoreographyEngine engine_;
    CommandQueue queue_;
    fs::path dir_;
    ProfileStore profiles_;
    ControlRouter router_;
};


//=============================================================================
// ERRORS
//=============================================================================

TEST_F(ControlRouterTest, MalformedJsonIsAnError) {
    json response = router_.handle("{not json");
    EXPECT_EQ(response["type"], "error");
    EXPECT_EQ(response["message"], "Invalid JSON format");
    EXPECT_TRUE(response["timestamp"].is_number());
}

TEST_F(ControlRouterTest, UnknownTypeIsNamed) {
    json response = send({{"type", "dance_party"}});
    EXPECT_EQ(response["type"], "error");
    EXPECT_EQ(response["message"], "Unknown message type: dance_party");
}

TEST_F(ControlRouterTest, NonObjectAndBadTypeField) {
    EXPECT_EQ(router_.handle("[1, 2]")["type"], "error");
    EXPECT_EQ(send({{"type", 7}})["type"], "error");
}

TEST_F(ControlRouterTest, HandlerFailureIsReported) {
    json response = send({{"type", "servo_command"},
                          {"command", {{"channel", "zero"}, {"position", 1500}}}});
    EXPECT_EQ(response["type"], "error");
    EXPECT_NE(response["message"].get<std::string>().find("Handler error"), std::string::npos);
}


//=============================================================================
// MOTION
//=============================================================================

TEST_F(ControlRouterTest, ServoCommandIsQueued) {
    json response = send({{"type", "servo_command"},
                          {"command", {{"channel", 0}, {"position", 1600}, {"duration", 1000}}}});
    EXPECT_EQ(response["type"], "command_response");
    EXPECT_TRUE(response["success"].get<bool>());
    ASSERT_TRUE(response["command_id"].is_string());

    auto pending = queue_.pendingIds();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0], response["command_id"].get<std::string>());
}

TEST_F(ControlRouterTest, FlatServoCommandIsAccepted) {
    json response = send({{"type", "servo_command"}, {"channel", 1}, {"position", 1500}, {"duration", 500}});
    EXPECT_TRUE(response["success"].get<bool>());
}

TEST_F(ControlRouterTest, ServoCommandMissingFields) {
    json response = send({{"type", "servo_command"}, {"command", {{"channel", 0}}}});
    EXPECT_EQ(response["type"], "error");
    EXPECT_EQ(response["message"], "Missing channel or position");
}

TEST_F(ControlRouterTest, RejectedServoCommandCarriesReason) {
    json response = send({{"type", "servo_command"},
                          {"command", {{"channel", 42}, {"position", 1500}}}});
    EXPECT_EQ(response["type"], "command_response");
    EXPECT_FALSE(response["success"].get<bool>());
    EXPECT_TRUE(response["command_id"].is_null());
    EXPECT_NE(response["message"].get<std::string>().find("unknown channel"), std::string::npos);
}

TEST_F(ControlRouterTest, SequenceByChoreographyName) {
    json response = send({{"type", "sequence_command"},
                          {"sequence", "curious_investigation_greeting"},
                          {"personality_modifier", 1.5}});
    EXPECT_EQ(response["type"], "sequence_response");
    EXPECT_TRUE(response["success"].get<bool>()) << response.dump();
    EXPECT_EQ(queue_.status(response["sequence_id"].get<std::string>()), RunStatus::Running);

    json stop = send({{"type", "stop_sequence"}, {"sequence_id", response["sequence_id"]}});
    EXPECT_TRUE(stop["success"].get<bool>());
}

TEST_F(ControlRouterTest, InlineSequenceIsQueued) {
    json response = send({
        {"type", "sequence_command"},
        {"sequence", {
            {"name", "nod"},
            {"commands", {
                {{"channel", 1}, {"position", 1600}, {"duration", 800}},
                {{"channel", 1}, {"position", 1400}, {"duration", 800}, {"delay", 800}, {"easing", "sine_in_out"}}
            }}
        }}
    });
    EXPECT_TRUE(response["success"].get<bool>()) << response.dump();
    EXPECT_EQ(queue_.pendingIds().size(), 1u);
}

TEST_F(ControlRouterTest, UnknownChoreographyFails) {
    json response = send({{"type", "sequence_command"}, {"sequence", "moonwalk"}});
    EXPECT_FALSE(response["success"].get<bool>());
    EXPECT_TRUE(response["sequence_id"].is_null());
}


//=============================================================================
// EMERGENCY
//=============================================================================

TEST_F(ControlRouterTest, EmergencyStopAndReset) {
    json stop = send({{"type", "emergency_stop"}});
    EXPECT_EQ(stop["type"], "emergency_response");
    EXPECT_TRUE(validator_.isEmergencyStopped());

    json refused = send({{"type", "servo_command"},
                         {"command", {{"channel", 0}, {"position", 1500}}}});
    EXPECT_FALSE(refused["success"].get<bool>());

    json reset = send({{"type", "emergency_reset"}, {"acknowledge", true}});
    EXPECT_TRUE(reset["success"].get<bool>());
    EXPECT_FALSE(validator_.isEmergencyStopped());
}

TEST_F(ControlRouterTest, EmergencyNoticeShape) {
    json notice = ControlRouter::emergencyNotice("limit switch");
    EXPECT_EQ(notice["type"], "emergency_stop_activated");
    EXPECT_EQ(notice["reason"], "limit switch");
}


//=============================================================================
// CONFIGURATION
//=============================================================================

TEST_F(ControlRouterTest, ConfigGetSingleChannel) {
    json response = send({{"type", "config_command"}, {"action", "get"}, {"channel", 0}});
    EXPECT_TRUE(response["success"].get<bool>());
    EXPECT_EQ(response["config"]["name"], "Dome Rotation");
    EXPECT_EQ(response["safety_tier"], "production");

    json missing = send({{"type", "config_command"}, {"action", "get"}, {"channel", 99}});
    EXPECT_FALSE(missing["success"].get<bool>());
}

TEST_F(ControlRouterTest, ConfigSetPatchesRegistry) {
    json response = send({{"type", "config_command"}, {"action", "set"}, {"channel", 4},
                          {"config", {{"home_position", 1300}, {"limits", {{"safe_min", 1250}}}}}});
    EXPECT_TRUE(response["success"].get<bool>()) << response.dump();
    EXPECT_EQ(registry_.get(4)->home_position, 1300);
    EXPECT_EQ(registry_.get(4)->limits.safe_min, 1250);

    json bad = send({{"type", "config_command"}, {"action", "set"}, {"channel", 4},
                     {"safe_max", 5000}});
    EXPECT_FALSE(bad["success"].get<bool>());
}

TEST_F(ControlRouterTest, ConfigChangesReachTheDriver) {
    EXPECT_EQ(driver_.reconfigureCount(), 0);

    json response = send({{"type", "config_command"}, {"action", "set"}, {"channel", 2},
                          {"config", {{"inverted", true}, {"home_position", 1100}}}});
    ASSERT_TRUE(response["success"].get<bool>()) << response.dump();
    EXPECT_EQ(driver_.reconfigureCount(), 1);
    auto config = driver_.configFor(2);
    ASSERT_TRUE(config.has_value());
    EXPECT_TRUE(config->inverted);
    EXPECT_EQ(config->home_position, 1100);

    // A rejected patch leaves the driver alone
    send({{"type", "config_command"}, {"action", "set"}, {"channel", 2}, {"safe_max", 5000}});
    EXPECT_EQ(driver_.reconfigureCount(), 1);

    ASSERT_TRUE(send({{"type", "config_command"}, {"action", "save"}, {"name", "mirror"}})["success"]
                    .get<bool>());
    ASSERT_TRUE(send({{"type", "config_command"}, {"action", "load"}, {"name", "mirror"}})["success"]
                    .get<bool>());
    EXPECT_EQ(driver_.reconfigureCount(), 2);
    EXPECT_TRUE(driver_.configFor(2)->inverted);
}

TEST_F(ControlRouterTest, ConfigTierChangesCeilings) {
    json response = send({{"type", "config_command"}, {"action", "tier"}, {"tier", "demonstration"}});
    EXPECT_TRUE(response["success"].get<bool>());
    EXPECT_EQ(registry_.safetyTier(), SafetyTier::Demonstration);

    EXPECT_FALSE(send({{"type", "config_command"}, {"action", "tier"}, {"tier", "ludicrous"}})["success"]
                     .get<bool>());
}

TEST_F(ControlRouterTest, ConfigSaveListLoad) {
    ASSERT_TRUE(send({{"type", "config_command"}, {"action", "save"}, {"name", "parade"}})["success"]
                    .get<bool>());

    json list = send({{"type", "config_command"}, {"action", "list"}});
    EXPECT_EQ(list["profiles"], json::array({"parade"}));

    json load = send({{"type", "config_command"}, {"action", "load"}, {"name", "parade"}});
    EXPECT_TRUE(load["success"].get<bool>()) << load.dump();
    EXPECT_EQ(registry_.size(), 16u);

    json missing = send({{"type", "config_command"}, {"action", "load"}, {"name", "nowhere"}});
    EXPECT_FALSE(missing["success"].get<bool>());
}

TEST_F(ControlRouterTest, ConfigZones) {
    json added = send({{"type", "config_command"}, {"action", "add_zone"}, {"name", "arms"},
                       {"channels", {4, 5}}, {"min_position", 1000}, {"max_position", 1600}});
    EXPECT_TRUE(added["success"].get<bool>()) << added.dump();
    EXPECT_EQ(validator_.safetyZones().size(), 1u);

    json removed = send({{"type", "config_command"}, {"action", "remove_zone"}, {"name", "arms"}});
    EXPECT_TRUE(removed["success"].get<bool>());
}


//=============================================================================
// STATUS
//=============================================================================

TEST_F(ControlRouterTest, StatusUpdateCarriesSnapshot) {
    json response = send({{"type", "get_status"}});
    EXPECT_EQ(response["type"], "status_update");

    const json& data = response["data"];
    EXPECT_EQ(data["servo_count"], 16);
    EXPECT_FALSE(data["emergency_stop"].get<bool>());
    EXPECT_EQ(data["driver"]["name"], driver_.name());
    EXPECT_TRUE(data["driver"]["connected"].get<bool>());
    EXPECT_TRUE(data["engine"]["foreground"].is_null());
}

TEST_F(ControlRouterTest, ChoreographyListHasBuiltins) {
    json response = send({{"type", "get_choreographies"}});
    EXPECT_EQ(response["type"], "choreography_list");
    EXPECT_EQ(response["choreographies"].size(), 7u);
}
