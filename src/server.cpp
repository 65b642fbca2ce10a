#include "server.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/http.hpp>
#include <csignal>
#include <iostream>
#include "timeout.hpp"

namespace {

void logException(const char* tag, std::exception_ptr e) {
    if (!e) return;
    try {
        std::rethrow_exception(e);
    } catch (const std::exception& ex) {
        std::cerr << "[" << tag << "] " << ex.what() << '\n';
    }
}

} // namespace

Server::Server(net::io_context& io, const AppConfig& cfg, KeyValueStore& store, Metrics& metrics)
    : io_(io),
      cfg_(cfg),
      store_(store),
      ctx_{store, metrics, cfg.timeouts},
      router_(makeRouter(ctx_, cfg.server.authToken)),
      strand_(net::make_strand(io)),
      acceptor_(strand_) {}

net::awaitable<void> Server::start() {
    state_ = ServerState::Starting;
    co_await withTimeout(store_.ping(), cfg_.server.startupProbeTimeout);

    tcp::endpoint ep{net::ip::make_address(cfg_.server.bindHost), cfg_.server.port};
    acceptor_.open(ep.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(ep);
    acceptor_.listen();
    boundPort_ = acceptor_.local_endpoint().port();

    state_ = ServerState::Serving;
    std::cout << "[startup] listening on " << cfg_.server.bindHost << ":" << boundPort_ << '\n';

    net::co_spawn(strand_, acceptLoop(),
                  [](std::exception_ptr e) { logException("accept-error", e); });
}

net::awaitable<void> Server::acceptLoop() {
    for (;;) {
        boost::system::error_code ec;
        tcp::socket socket = co_await acceptor_.async_accept(
            net::make_strand(io_), net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            if (ec == net::error::operation_aborted || !acceptor_.is_open()) break;
            std::cerr << "[accept-error] " << ec.message() << '\n';
            continue;
        }

        auto conn = std::make_shared<Connection>(std::move(socket));
        track(conn);
        net::co_spawn(conn->stream.get_executor(), session(conn),
                      [this, conn](std::exception_ptr e) {
                          logException("session-error", e);
                          untrack(conn);
                      });
    }
}

net::awaitable<void> Server::session(std::shared_ptr<Connection> conn) {
    beast::flat_buffer buffer;

    for (;;) {
        // Between requests the connection is idle and may be closed by stop().
        if (buffer.size() == 0) {
            conn->idle = true;
            if (draining()) break;
            boost::system::error_code idle_ec;
            conn->stream.expires_after(cfg_.server.idleTimeout);
            std::size_t n = co_await conn->stream.async_read_some(
                buffer.prepare(4096), net::redirect_error(net::use_awaitable, idle_ec));
            if (idle_ec) break;
            buffer.commit(n);
        }
        conn->idle = false;

        http::request<http::string_body> req;
        boost::system::error_code read_ec;
        conn->stream.expires_after(cfg_.server.readTimeout);
        co_await http::async_read(conn->stream, buffer, req,
                                  net::redirect_error(net::use_awaitable, read_ec));
        if (read_ec) break;

        Response res;
        try {
            res = co_await router_.dispatch(req);
        } catch (const std::exception& e) {
            std::cerr << "[request-error] " << e.what() << '\n';
            res = makeError(req, http::status::internal_server_error, "internal server error");
            res.keep_alive(false);
        }
        if (draining()) res.keep_alive(false);

        boost::system::error_code write_ec;
        conn->stream.expires_after(cfg_.server.writeTimeout);
        co_await http::async_write(conn->stream, res,
                                   net::redirect_error(net::use_awaitable, write_ec));
        if (write_ec || !res.keep_alive()) break;
    }

    boost::system::error_code ec;
    conn->stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    co_return;
}

void Server::stop() {
    ServerState expected = ServerState::Serving;
    if (!state_.compare_exchange_strong(expected, ServerState::Draining)) return;

    net::post(strand_, [this] {
        boost::system::error_code ec;
        acceptor_.close(ec);
    });

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& conn : connections_) {
        net::post(conn->stream.get_executor(), [conn] {
            if (conn->idle) conn->stream.cancel();
        });
    }
}

net::awaitable<bool> Server::waitDrained(std::chrono::steady_clock::duration grace) {
    co_return co_await net::co_spawn(strand_, awaitConnectionsClosed(grace), net::use_awaitable);
}

// Runs on strand_. untrack() cancels the timer once the last connection is gone;
// the timer expiring on its own means the grace period ran out.
net::awaitable<bool> Server::awaitConnectionsClosed(std::chrono::steady_clock::duration grace) {
    auto timer = std::make_shared<net::steady_timer>(strand_);
    timer->expires_after(grace);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drainTimer_ = timer;
    }

    bool drained = false;
    for (;;) {
        if (activeConnections() == 0) {
            drained = true;
            break;
        }
        boost::system::error_code ec;
        co_await timer->async_wait(net::redirect_error(net::use_awaitable, ec));
        if (!ec) break;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        drainTimer_.reset();
    }
    state_ = ServerState::Stopped;
    co_return drained;
}

net::awaitable<int> Server::run() {
    co_await start();

    net::signal_set signals(co_await net::this_coro::executor, SIGINT, SIGTERM);
    int sig = co_await signals.async_wait(net::use_awaitable);
    std::cout << "[shutdown] signal " << sig << " received, draining connections" << '\n';

    stop();
    if (!co_await waitDrained(cfg_.server.gracePeriod)) {
        std::cerr << "[shutdown] grace period expired with " << activeConnections()
                  << " connection(s) still open" << '\n';
        co_return 1;
    }
    std::cout << "[shutdown] server exited" << '\n';
    co_return 0;
}

std::size_t Server::activeConnections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

void Server::track(const std::shared_ptr<Connection>& conn) {
    std::lock_guard<std::mutex> lock(mutex_);
    connections_.insert(conn);
}

void Server::untrack(const std::shared_ptr<Connection>& conn) {
    std::shared_ptr<net::steady_timer> waiter;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connections_.erase(conn);
        if (connections_.empty()) waiter = drainTimer_;
    }
    if (waiter) net::post(strand_, [waiter] { waiter->cancel(); });
}
