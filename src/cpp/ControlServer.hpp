/**
 * @file ControlServer.hpp
 * @brief WebSocket transport for the control protocol
 *
 * One io_context thread runs the acceptor, every client session and the
 * status broadcast timer. Protocol handling is delegated to ControlRouter.
 *
 * @section Threads Cross-thread Use
 *
 * broadcast() may be called from any thread; the message is posted onto
 * the io thread. Sessions are only ever touched from the io thread.
 *
 * @section Keepalive Keepalive
 *
 * Beast's idle timeout with keep-alive pings: a ping goes out after half
 * the idle timeout without traffic, and the session closes when the full
 * timeout passes with no reply.
 *
 * @license MIT
 */

#ifndef CONTROL_SERVER_HPP
#define CONTROL_SERVER_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <set>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/error.hpp>

#include "ControlRouter.hpp"

class ControlServer {
public:
    /// Outbound messages queued per client before status updates are dropped
    static constexpr std::size_t MAX_OUTBOX = 64;

    /**
     * @param port 0 picks an ephemeral port (see port())
     * @param idle_timeout Session idle limit; the ping goes out at half of it
     */
    ControlServer(ControlRouter& router,
                  std::string address,
                  unsigned short port,
                  int broadcast_hz,
                  std::chrono::seconds idle_timeout);

    ~ControlServer();

    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    /**
     * @brief Bind, listen and start the io thread
     * @throws std::runtime_error if the address cannot be bound
     */
    void start();

    /// Close every session and join the io thread
    void shutdown();

    /// Send a text frame to every connected client (thread-safe)
    void broadcast(std::string text);

    std::size_t clientCount() const { return client_count_.load(); }

    /// Port actually bound (valid after start())
    unsigned short port() const { return bound_port_; }

private:
    class Session;

    ControlRouter& router_;
    std::string address_;
    unsigned short port_;
    unsigned short bound_port_ = 0;
    std::chrono::milliseconds broadcast_period_;
    std::chrono::seconds idle_timeout_;

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::steady_timer broadcast_timer_;
    boost::asio::steady_timer shutdown_timer_;

    std::set<std::shared_ptr<Session>> sessions_;   ///< io thread only
    std::atomic<std::size_t> client_count_{0};
    std::atomic<bool> running_{false};
    std::thread thread_;

    void doAccept();
    void onAccept(boost::beast::error_code ec, boost::asio::ip::tcp::socket socket);
    void scheduleBroadcast();

    void join(const std::shared_ptr<Session>& session);
    void leave(const std::shared_ptr<Session>& session);
};

#endif // CONTROL_SERVER_HPP
