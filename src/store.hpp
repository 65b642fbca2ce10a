#pragma once
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace net = boost::asio;

// One page of a cursor scan. cursor == 0 means the enumeration is complete.
struct ScanBatch {
    std::uint64_t cursor = 0;
    std::vector<std::string> keys;
};

// Command surface the HTTP layer needs from the backing store.
// Failures are reported by throwing; a missing key is not a failure.
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual net::awaitable<void> ping() = 0;
    virtual net::awaitable<std::optional<std::string>> get(const std::string& key) = 0;
    virtual net::awaitable<void> set(const std::string& key, const std::string& value,
                                     std::optional<std::chrono::seconds> ttl) = 0;
    // Returns the number of keys removed.
    virtual net::awaitable<long long> del(const std::string& key) = 0;
    // count is a hint; the store may return more or fewer keys.
    virtual net::awaitable<ScanBatch> scan(std::uint64_t cursor, const std::string& pattern,
                                           std::size_t count) = 0;
};
