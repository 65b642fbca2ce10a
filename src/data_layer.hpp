#pragma once
#include <boost/asio/io_context.hpp>
#include <boost/redis/connection.hpp>
#include <boost/redis/response.hpp>
#include <memory>
#include <string>
#include "config.hpp"
#include "metrics.hpp"
#include "store.hpp"

namespace net = boost::asio;
namespace redis = boost::redis;

// KeyValueStore backed by a single multiplexed Valkey/Redis connection.
// The connection lives on its own strand; every command is executed there.
class DataLayer : public KeyValueStore {
public:
    DataLayer(net::io_context& io, const RedisConfig& cfg, Metrics& metrics);

    net::awaitable<void> ping() override;
    net::awaitable<std::optional<std::string>> get(const std::string& key) override;
    net::awaitable<void> set(const std::string& key, const std::string& value,
                             std::optional<std::chrono::seconds> ttl) override;
    net::awaitable<long long> del(const std::string& key) override;
    net::awaitable<ScanBatch> scan(std::uint64_t cursor, const std::string& pattern,
                                   std::size_t count) override;

    // Stops the reconnect loop and fails pending commands.
    void close();

private:
    RedisConfig cfg_;
    Metrics& metrics_;
    std::shared_ptr<redis::connection> conn_;
};

// Converts a generic SCAN reply ([cursor, [key...]]) into a batch.
ScanBatch parseScanReply(const redis::generic_response& resp);
