#pragma once
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/deferred.hpp>
#include <boost/asio/experimental/parallel_group.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <type_traits>

namespace net = boost::asio;

class OperationTimeout : public std::runtime_error {
public:
    OperationTimeout() : std::runtime_error("operation timed out") {}
};

// Races op against a timer; whichever finishes first cancels the other.
// A failure of op is rethrown as is, the timer winning throws OperationTimeout.
template <typename T>
net::awaitable<T> withTimeout(net::awaitable<T> op, std::chrono::steady_clock::duration limit) {
    auto ex = co_await net::this_coro::executor;
    net::steady_timer timer(ex);
    timer.expires_after(limit);

    auto group = net::experimental::make_parallel_group(
        net::co_spawn(ex, std::move(op), net::deferred),
        timer.async_wait(net::deferred));

    if constexpr (std::is_void_v<T>) {
        auto [order, opError, timerError] =
            co_await group.async_wait(net::experimental::wait_for_one(), net::use_awaitable);
        if (order[0] != 0) throw OperationTimeout();
        if (opError) std::rethrow_exception(opError);
    } else {
        auto [order, opError, value, timerError] =
            co_await group.async_wait(net::experimental::wait_for_one(), net::use_awaitable);
        if (order[0] != 0) throw OperationTimeout();
        if (opError) std::rethrow_exception(opError);
        co_return std::move(value);
    }
}
