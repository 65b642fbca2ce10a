#pragma once
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <unordered_set>
#include "config.hpp"
#include "http_handlers.hpp"
#include "router.hpp"

namespace net = boost::asio;
namespace beast = boost::beast;
using tcp = net::ip::tcp;

enum class ServerState { Starting, Serving, Draining, Stopped };

class Server {
public:
    Server(net::io_context& io, const AppConfig& cfg, KeyValueStore& store, Metrics& metrics);

    // Probes the store, then binds and starts accepting. Throws if the probe
    // fails or the endpoint cannot be bound.
    net::awaitable<void> start();

    // Stops accepting, closes idle keep-alive connections and lets the
    // in-flight ones finish their current request.
    void stop();

    // Waits for all connections to close. Returns false when grace expired first.
    net::awaitable<bool> waitDrained(std::chrono::steady_clock::duration grace);

    // start(), serve until SIGINT/SIGTERM, then drain. Returns the exit code.
    net::awaitable<int> run();

    ServerState state() const { return state_.load(); }
    unsigned short port() const { return boundPort_; }
    std::size_t activeConnections() const;

private:
    struct Connection {
        explicit Connection(tcp::socket socket) : stream(std::move(socket)) {}
        beast::tcp_stream stream;
        bool idle = true; // only touched on the stream's strand
    };

    net::awaitable<void> acceptLoop();
    net::awaitable<void> session(std::shared_ptr<Connection> conn);
    net::awaitable<bool> awaitConnectionsClosed(std::chrono::steady_clock::duration grace);
    bool draining() const { return state_.load() != ServerState::Serving; }

    void track(const std::shared_ptr<Connection>& conn);
    void untrack(const std::shared_ptr<Connection>& conn);

    net::io_context& io_;
    AppConfig cfg_;
    KeyValueStore& store_;
    HandlerContext ctx_;
    Router router_;

    net::strand<net::io_context::executor_type> strand_;
    tcp::acceptor acceptor_;
    unsigned short boundPort_ = 0;
    std::atomic<ServerState> state_{ServerState::Starting};

    mutable std::mutex mutex_;
    std::unordered_set<std::shared_ptr<Connection>> connections_;
    std::shared_ptr<net::steady_timer> drainTimer_; // set while waitDrained() runs
};
