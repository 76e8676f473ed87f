/**
 * @file ControlServer.cpp
 * @brief Boost.Beast WebSocket server implementation
 *
 * @license MIT
 */

#include "ControlServer.hpp"

#include <deque>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;


//=============================================================================
// SESSION
//=============================================================================

class ControlServer::Session : public std::enable_shared_from_this<ControlServer::Session> {
public:
    Session(tcp::socket&& socket, ControlServer& server)
        : ws_(std::move(socket)),
          server_(server)
    {
        beast::error_code ec;
        auto remote = beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
        id_ = ec ? std::string("unknown") : remote.address().to_string() + ":" + std::to_string(remote.port());
    }

    void run() {
        // The websocket stream manages its own timeouts from here on
        beast::get_lowest_layer(ws_).expires_never();

        websocket::stream_base::timeout timeout{};
        timeout.handshake_timeout = std::chrono::seconds(30);
        timeout.idle_timeout = server_.idle_timeout_;
        timeout.keep_alive_pings = true;
        ws_.set_option(timeout);

        ws_.set_option(websocket::stream_base::decorator(
            [](websocket::response_type& res) {
                res.set(beast::http::field::server, "astromechd");
            }));

        ws_.async_accept(beast::bind_front_handler(&Session::onAccept, shared_from_this()));
    }

    void send(const std::shared_ptr<const std::string>& message, bool droppable = false) {
        if (closing_) {
            return;
        }
        if (droppable && outbox_.size() >= MAX_OUTBOX) {
            return;
        }
        outbox_.push_back(message);
        if (outbox_.size() > 1) {
            return;  // a write is already in flight
        }
        doWrite();
    }

    void close() {
        if (closing_) {
            return;
        }
        closing_ = true;
        ws_.async_close(websocket::close_code::going_away,
                        [self = shared_from_this()](beast::error_code) {
                            self->server_.leave(self);
                        });
    }

    const std::string& id() const { return id_; }

private:
    websocket::stream<beast::tcp_stream> ws_;
    ControlServer& server_;
    beast::flat_buffer buffer_;
    std::deque<std::shared_ptr<const std::string>> outbox_;
    std::string id_;
    bool closing_ = false;

    void onAccept(beast::error_code ec) {
        if (ec) {
            std::cerr << "[Server] Handshake with " << id_ << " failed: " << ec.message() << std::endl;
            return;
        }
        server_.join(shared_from_this());
        send(std::make_shared<const std::string>(server_.router_.initialStatus().dump()));
        doRead();
    }

    void doRead() {
        ws_.async_read(buffer_, beast::bind_front_handler(&Session::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t /*bytes*/) {
        if (ec == websocket::error::closed) {
            std::cout << "[Server] Client disconnected: " << id_ << std::endl;
            server_.leave(shared_from_this());
            return;
        }
        if (ec) {
            if (ec != net::error::operation_aborted) {
                std::cerr << "[Server] Read error for " << id_ << ": " << ec.message() << std::endl;
            }
            server_.leave(shared_from_this());
            return;
        }

        std::string text = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());

        send(std::make_shared<const std::string>(server_.router_.handle(text).dump()));
        doRead();
    }

    void doWrite() {
        ws_.text(true);
        ws_.async_write(net::buffer(*outbox_.front()),
                        beast::bind_front_handler(&Session::onWrite, shared_from_this()));
    }

    void onWrite(beast::error_code ec, std::size_t /*bytes*/) {
        if (ec) {
            if (ec != net::error::operation_aborted) {
                std::cerr << "[Server] Write error for " << id_ << ": " << ec.message() << std::endl;
            }
            outbox_.clear();
            server_.leave(shared_from_this());
            return;
        }
        outbox_.pop_front();
        if (!outbox_.empty()) {
            doWrite();
        }
    }
};


//=============================================================================
// CONSTRUCTOR / DESTRUCTOR
//=============================================================================

ControlServer::ControlServer(ControlRouter& router,
                             std::string address,
                             unsigned short port,
                             int broadcast_hz,
                             std::chrono::seconds idle_timeout)
    : router_(router),
      address_(std::move(address)),
      port_(port),
      broadcast_period_(1000 / (broadcast_hz > 0 ? broadcast_hz : 10)),
      idle_timeout_(idle_timeout),
      acceptor_(ioc_),
      broadcast_timer_(ioc_),
      shutdown_timer_(ioc_)
{
}


ControlServer::~ControlServer() {
    shutdown();
}


//=============================================================================
// LIFECYCLE
//=============================================================================

void ControlServer::start() {
    if (running_.exchange(true)) {
        return;
    }

    beast::error_code ec;
    auto address = net::ip::make_address(address_, ec);
    if (ec) {
        running_ = false;
        throw std::runtime_error("Invalid bind address '" + address_ + "': " + ec.message());
    }
    tcp::endpoint endpoint(address, port_);

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        running_ = false;
        beast::error_code ignored;
        acceptor_.close(ignored);
        throw std::runtime_error("Cannot listen on " + address_ + ":" + std::to_string(port_)
                                 + ": " + ec.message());
    }
    bound_port_ = acceptor_.local_endpoint().port();

    doAccept();
    scheduleBroadcast();
    thread_ = std::thread([this] { ioc_.run(); });

    std::cout << "[Server] Listening on ws://" << address_ << ":" << bound_port_ << std::endl;
}


void ControlServer::shutdown() {
    if (!running_.exchange(false)) {
        return;
    }

    net::post(ioc_, [this] {
        beast::error_code ec;
        acceptor_.close(ec);
        broadcast_timer_.cancel();

        if (sessions_.empty()) {
            ioc_.stop();
            return;
        }

        // Grace period for the close handshakes
        shutdown_timer_.expires_after(std::chrono::seconds(2));
        shutdown_timer_.async_wait([this](beast::error_code) { ioc_.stop(); });

        std::vector<std::shared_ptr<Session>> open(sessions_.begin(), sessions_.end());
        for (auto& session : open) {
            session->close();
        }
    });

    if (thread_.joinable()) {
        thread_.join();
    }
    sessions_.clear();
    client_count_ = 0;
    router_.setClientCount(0);
    std::cout << "[Server] Stopped" << std::endl;
}


void ControlServer::broadcast(std::string text) {
    auto message = std::make_shared<const std::string>(std::move(text));
    net::post(ioc_, [this, message] {
        for (const auto& session : sessions_) {
            session->send(message);
        }
    });
}


//=============================================================================
// ACCEPT / BROADCAST (io thread)
//=============================================================================

void ControlServer::doAccept() {
    acceptor_.async_accept(ioc_, beast::bind_front_handler(&ControlServer::onAccept, this));
}


void ControlServer::onAccept(beast::error_code ec, tcp::socket socket) {
    if (ec == net::error::operation_aborted || !acceptor_.is_open()) {
        return;
    }
    if (ec) {
        std::cerr << "[Server] Accept failed: " << ec.message() << std::endl;
    } else {
        std::make_shared<Session>(std::move(socket), *this)->run();
    }
    doAccept();
}


void ControlServer::scheduleBroadcast() {
    broadcast_timer_.expires_after(broadcast_period_);
    broadcast_timer_.async_wait([this](beast::error_code ec) {
        if (ec) {
            return;
        }
        if (!sessions_.empty()) {
            auto message = std::make_shared<const std::string>(router_.statusUpdate().dump());
            for (const auto& session : sessions_) {
                session->send(message, true);
            }
        }
        scheduleBroadcast();
    });
}


void ControlServer::join(const std::shared_ptr<Session>& session) {
    sessions_.insert(session);
    client_count_ = sessions_.size();
    router_.setClientCount(sessions_.size());
    std::cout << "[Server] Client connected: " << session->id()
              << " (" << sessions_.size() << " total)" << std::endl;
}


void ControlServer::leave(const std::shared_ptr<Session>& session) {
    if (sessions_.erase(session) == 0) {
        return;
    }
    client_count_ = sessions_.size();
    router_.setClientCount(sessions_.size());

    if (!running_ && sessions_.empty()) {
        shutdown_timer_.cancel();
    }
}
