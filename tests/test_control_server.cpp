/**
 * @file test_control_server.cpp
 * @brief WebSocket transport against real clients on loopback
 *
 * @license MIT
 */

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include "ActuatorRegistry.hpp"
#include "ChoreographyEngine.hpp"
#include "ChoreographyLibrary.hpp"
#include "CommandQueue.hpp"
#include "ControlRouter.hpp"
#include "ControlServer.hpp"
#include "ProfileStore.hpp"
#include "SafetyValidator.hpp"
#include "SimulatedDriver.hpp"

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace fs = std::filesystem;
using tcp = net::ip::tcp;
using json = nlohmann::json;

namespace {

/// Blocking WebSocket client with bounded reads
class TestClient {
public:
    explicit TestClient(unsigned short port)
        : ws_(ioc_)
    {
        tcp::resolver resolver(ioc_);
        auto results = resolver.resolve("127.0.0.1", std::to_string(port));
        net::connect(ws_.next_layer(), results.begin(), results.end());
        ws_.handshake("127.0.0.1:" + std::to_string(port), "/");
    }

    ~TestClient() {
        if (!open_) {
            return;
        }
        beast::error_code ec;
        ws_.close(websocket::close_code::normal, ec);
    }

    void send(const std::string& text) {
        ws_.text(true);
        ws_.write(net::buffer(text));
    }

    /// Next message, or nullopt if none arrives within `timeout`
    std::optional<json> read(std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
        beast::flat_buffer buffer;
        bool done = false;
        beast::error_code result;
        ws_.async_read(buffer, [&done, &result](beast::error_code ec, std::size_t) {
            done = true;
            result = ec;
        });

        ioc_.restart();
        ioc_.run_for(timeout);
        if (!done) {
            // Drain the aborted read before `buffer` goes away
            beast::error_code ignored;
            ws_.next_layer().cancel(ignored);
            ioc_.restart();
            ioc_.run();
            open_ = false;
            return std::nullopt;
        }
        if (result) {
            open_ = false;
            return std::nullopt;
        }
        return json::parse(beast::buffers_to_string(buffer.data()));
    }

    /// Skip messages until one of `type` arrives
    std::optional<json> readUntil(const std::string& type,
                                  std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            auto message = read(remaining);
            if (!message) {
                return std::nullopt;
            }
            if (message->value("type", "") == type) {
                return message;
            }
        }
        return std::nullopt;
    }

private:
    net::io_context ioc_;
    websocket::stream<tcp::socket> ws_;
    bool open_ = true;
};

}  // namespace


class ControlServerTest : public ::testing::Test {
protected:
    static constexpr int BROADCAST_HZ = 20;

    ControlServerTest()
        : registry_(ProfileStore::defaultProfile()),
          validator_(registry_),
          engine_(registry_, validator_, driver_, library_),
          queue_(registry_, validator_, engine_),
          dir_(fs::temp_directory_path() / ("astromech_server_"
               + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()))),
          profiles_(dir_.string()),
          router_(registry_, validator_, engine_, queue_, profiles_, driver_),
          server_(router_, "127.0.0.1", 0, BROADCAST_HZ, std::chrono::seconds(30))
    {
        driver_.connect();
        validator_.addEmergencyListener([this](const std::string& reason) {
            server_.broadcast(ControlRouter::emergencyNotice(reason).dump());
        });
        server_.start();
    }

    ~ControlServerTest() override {
        server_.shutdown();
        std::error_code ec;
        fs::remove_all(dir_, ec);
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
    ControlServer server_;
};


TEST_F(ControlServerTest, BindsAnEphemeralPort) {
    EXPECT_NE(server_.port(), 0);
}

TEST_F(ControlServerTest, InitialStatusIsPushedOnConnect) {
    TestClient client(server_.port());

    auto first = client.read();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ((*first)["type"], "initial_status");
    EXPECT_EQ((*first)["data"]["servo_count"], 16);
    EXPECT_FALSE((*first)["data"]["emergency_stop"].get<bool>());
}

TEST_F(ControlServerTest, MalformedInputKeepsConnectionOpen) {
    TestClient client(server_.port());
    ASSERT_TRUE(client.readUntil("initial_status").has_value());

    client.send("{not json");
    auto error = client.readUntil("error");
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ((*error)["message"], "Invalid JSON format");

    client.send(json{{"type", "get_choreographies"}}.dump());
    auto list = client.readUntil("choreography_list");
    ASSERT_TRUE(list.has_value());
    EXPECT_EQ((*list)["choreographies"].size(), 7u);
}

TEST_F(ControlServerTest, EmergencyStopReachesEveryClient) {
    TestClient operator_console(server_.port());
    TestClient observer(server_.port());
    ASSERT_TRUE(operator_console.readUntil("initial_status").has_value());
    ASSERT_TRUE(observer.readUntil("initial_status").has_value());

    operator_console.send(json{{"type", "emergency_stop"}}.dump());

    auto reply = operator_console.readUntil("emergency_response");
    ASSERT_TRUE(reply.has_value());
    EXPECT_TRUE((*reply)["success"].get<bool>());

    auto notice = observer.readUntil("emergency_stop_activated");
    ASSERT_TRUE(notice.has_value());
    EXPECT_TRUE((*notice)["reason"].is_string());
    EXPECT_TRUE(validator_.isEmergencyStopped());
}

TEST_F(ControlServerTest, StatusUpdatesAreBroadcastPeriodically) {
    TestClient client(server_.port());
    ASSERT_TRUE(client.readUntil("initial_status").has_value());

    auto first = client.readUntil("status_update");
    auto second = client.readUntil("status_update");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ((*second)["data"]["connected_clients"], 1);
}

TEST_F(ControlServerTest, ClientCountFollowsConnections) {
    {
        TestClient a(server_.port());
        TestClient b(server_.port());
        ASSERT_TRUE(a.readUntil("initial_status").has_value());
        ASSERT_TRUE(b.readUntil("initial_status").has_value());
        EXPECT_EQ(server_.clientCount(), 2u);
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (server_.clientCount() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(server_.clientCount(), 0u);
}
