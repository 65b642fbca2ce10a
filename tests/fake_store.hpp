#pragma once
#include <boost/asio/error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>
#include <fnmatch.h>
#include <map>
#include "store.hpp"

// In-memory KeyValueStore with a manual clock for TTLs, injectable failures
// and delays, and SCAN paging over the sorted key space.
class FakeStore : public KeyValueStore {
public:
    using Clock = std::chrono::steady_clock;

    net::awaitable<void> ping() override {
        co_await before();
        pings++;
    }

    net::awaitable<std::optional<std::string>> get(const std::string& key) override {
        co_await before();
        auto it = live(key);
        if (it == data_.end()) co_return std::nullopt;
        co_return it->second.value;
    }

    net::awaitable<void> set(const std::string& key, const std::string& value,
                             std::optional<std::chrono::seconds> ttl) override {
        co_await before();
        Entry e{value, std::nullopt};
        if (ttl) e.expiresAt = now() + *ttl;
        data_[key] = std::move(e);
        lastTtl = ttl;
    }

    net::awaitable<long long> del(const std::string& key) override {
        co_await before();
        auto it = live(key);
        if (it == data_.end()) co_return 0;
        data_.erase(it);
        co_return 1;
    }

    net::awaitable<ScanBatch> scan(std::uint64_t cursor, const std::string& pattern,
                                   std::size_t count) override {
        co_await before();
        if (failScanAfter && scanCalls >= *failScanAfter)
            throw boost::system::system_error(net::error::connection_reset);
        scanCalls++;
        lastScanCount = count;

        // The cursor is the index into the sorted key list; batch size ignores
        // the count hint when batchSize is set.
        std::vector<std::string> all;
        for (auto it = data_.begin(); it != data_.end(); ++it)
            if (!expired(it->second)) all.push_back(it->first);

        const std::size_t step = batchSize ? batchSize : count;
        ScanBatch batch;
        std::size_t i = cursor;
        for (; i < all.size() && i < cursor + step; ++i) {
            if (fnmatch(pattern.c_str(), all[i].c_str(), 0) == 0) batch.keys.push_back(all[i]);
        }
        batch.cursor = i >= all.size() ? 0 : i;
        co_return batch;
    }

    void put(const std::string& key, const std::string& value) { data_[key] = Entry{value, std::nullopt}; }
    void advance(std::chrono::seconds s) { offset_ += s; }
    std::size_t size() const { return data_.size(); }

    bool failing = false;
    Clock::duration delay{};
    std::size_t batchSize = 0;
    std::optional<std::size_t> failScanAfter;

    std::size_t pings = 0;
    std::size_t scanCalls = 0;
    std::size_t lastScanCount = 0;
    std::optional<std::chrono::seconds> lastTtl;

private:
    struct Entry {
        std::string value;
        std::optional<Clock::time_point> expiresAt;
    };
    using Map = std::map<std::string, Entry>;

    net::awaitable<void> before() {
        if (delay > Clock::duration::zero()) {
            net::steady_timer timer(co_await net::this_coro::executor);
            timer.expires_after(delay);
            co_await timer.async_wait(net::use_awaitable);
        }
        if (failing) throw boost::system::system_error(net::error::connection_refused);
    }

    Clock::time_point now() const { return Clock::now() + offset_; }
    bool expired(const Entry& e) const { return e.expiresAt && *e.expiresAt <= now(); }

    Map::iterator live(const std::string& key) {
        auto it = data_.find(key);
        if (it == data_.end()) return it;
        if (expired(it->second)) {
            data_.erase(it);
            return data_.end();
        }
        return it;
    }

    Map data_;
    Clock::duration offset_{};
};
