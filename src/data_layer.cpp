#include "data_layer.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/consign.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/redis/request.hpp>
#include <boost/redis/response.hpp>
#include <charconv>
#include <stdexcept>

namespace {

template <class Response>
net::awaitable<void> execOnConnection(std::shared_ptr<redis::connection> conn,
                                      const redis::request& req, Response& resp) {
    co_await conn->async_exec(req, resp, net::use_awaitable);
}

// Hops onto the connection's strand for the duration of one command.
template <class Response>
net::awaitable<void> exec(const std::shared_ptr<redis::connection>& conn,
                          const redis::request& req, Response& resp) {
    co_await net::co_spawn(conn->get_executor(), execOnConnection(conn, req, resp),
                           net::use_awaitable);
}

} // namespace

DataLayer::DataLayer(net::io_context& io, const RedisConfig& cfg, Metrics& metrics)
    : cfg_(cfg), metrics_(metrics) {

    redis::config rc;
    rc.addr.host = cfg_.host;
    rc.addr.port = cfg_.port;
    rc.password = cfg_.password;
    rc.clientname = "kvrest";

    conn_ = std::make_shared<redis::connection>(net::make_strand(io));
    conn_->async_run(rc, redis::logger{redis::logger::level::err},
                     net::consign(net::detached, conn_));
}

net::awaitable<void> DataLayer::ping() {
    redis::request req;
    req.push("PING");
    redis::response<std::string> resp;

    try {
        co_await exec(conn_, req, resp);
        const std::string& reply = std::get<0>(resp).value();
        if (reply != "PONG")
            throw std::runtime_error("unexpected PING reply: " + reply);
    } catch (const std::exception&) {
        metrics_.incRedisPingFailure();
        throw;
    }
    metrics_.incRedisPingSuccess();
}

net::awaitable<std::optional<std::string>> DataLayer::get(const std::string& key) {
    redis::request req;
    req.push("GET", key);

    redis::response<std::optional<std::string>> resp;
    co_await exec(conn_, req, resp);
    co_return std::get<0>(resp).value();
}

net::awaitable<void> DataLayer::set(const std::string& key, const std::string& value,
                                    std::optional<std::chrono::seconds> ttl) {
    redis::request req;
    if (ttl)
        req.push("SET", key, value, "EX", ttl->count());
    else
        req.push("SET", key, value);

    redis::response<redis::ignore_t> resp;
    co_await exec(conn_, req, resp);
}

net::awaitable<long long> DataLayer::del(const std::string& key) {
    redis::request req;
    req.push("DEL", key);

    redis::response<long long> resp;
    co_await exec(conn_, req, resp);
    co_return std::get<0>(resp).value();
}

net::awaitable<ScanBatch> DataLayer::scan(std::uint64_t cursor, const std::string& pattern,
                                          std::size_t count) {
    redis::request req;
    req.push("SCAN", cursor, "MATCH", pattern, "COUNT", count);

    redis::generic_response resp;
    co_await exec(conn_, req, resp);
    metrics_.incKvScanBatches();
    co_return parseScanReply(resp);
}

void DataLayer::close() {
    conn_->cancel();
}

ScanBatch parseScanReply(const redis::generic_response& resp) {
    if (resp.has_error())
        throw std::runtime_error("SCAN failed: " + resp.error().diagnostic);

    // Depth 1 holds the cursor followed by the key array header; keys sit at depth 2.
    ScanBatch batch;
    bool haveCursor = false;
    for (auto const& node : resp.value()) {
        if (node.depth == 1 && !haveCursor) {
            const auto& text = node.value;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), batch.cursor);
            if (ec != std::errc() || ptr != text.data() + text.size() || text.empty())
                throw std::runtime_error("malformed SCAN cursor: " + text);
            haveCursor = true;
        } else if (node.depth == 2) {
            batch.keys.push_back(node.value);
        }
    }
    if (!haveCursor) throw std::runtime_error("malformed SCAN reply");
    return batch;
}
