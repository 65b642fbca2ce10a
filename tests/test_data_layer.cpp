#include <gtest/gtest.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/redis/adapter/result.hpp>
#include <boost/redis/resp3/node.hpp>
#include <boost/redis/resp3/type.hpp>
#include <boost/system/result.hpp>
#include <stdexcept>
#include <vector>
#include "data_layer.hpp"
#include "timeout.hpp"

using namespace std::chrono_literals;

namespace {

using redis::resp3::type;

redis::resp3::node makeNode(type t, std::size_t aggregateSize, std::size_t depth,
                            const std::string& value = {}) {
    redis::resp3::node n;
    n.data_type = t;
    n.aggregate_size = aggregateSize;
    n.depth = depth;
    n.value = value;
    return n;
}

// Builds the node sequence of a SCAN reply: [cursor, [keys...]].
std::vector<redis::resp3::node> scanReply(const std::string& cursor,
                                          const std::vector<std::string>& keys) {
    std::vector<redis::resp3::node> nodes;
    nodes.push_back(makeNode(type::array, 2, 0));
    nodes.push_back(makeNode(type::blob_string, 1, 1, cursor));
    nodes.push_back(makeNode(type::array, keys.size(), 1));
    for (const auto& k : keys) nodes.push_back(makeNode(type::blob_string, 1, 2, k));
    return nodes;
}

} // namespace

TEST(ScanReplyTest, FinalBatchWithKeys) {
    redis::generic_response resp = scanReply("0", {"user:1", "user:2"});
    auto batch = parseScanReply(resp);
    EXPECT_EQ(batch.cursor, 0u);
    EXPECT_EQ(batch.keys, (std::vector<std::string>{"user:1", "user:2"}));
}

TEST(ScanReplyTest, ContinuationWithEmptyKeyArray) {
    redis::generic_response resp = scanReply("17592186044416", {});
    auto batch = parseScanReply(resp);
    EXPECT_EQ(batch.cursor, 17592186044416u);
    EXPECT_TRUE(batch.keys.empty());
}

TEST(ScanReplyTest, ErrorReplyThrows) {
    redis::generic_response resp{boost::system::in_place_error,
                                 redis::adapter::error{type::simple_error, "ERR invalid cursor"}};
    EXPECT_THROW(parseScanReply(resp), std::runtime_error);
}

TEST(ScanReplyTest, ReplyWithoutCursorThrows) {
    redis::generic_response resp = std::vector<redis::resp3::node>{makeNode(type::array, 0, 0)};
    EXPECT_THROW(parseScanReply(resp), std::runtime_error);
}

TEST(ScanReplyTest, NonNumericCursorThrows) {
    redis::generic_response resp = scanReply("next", {"a"});
    EXPECT_THROW(parseScanReply(resp), std::runtime_error);

    redis::generic_response partial = scanReply("12abc", {"a"});
    EXPECT_THROW(parseScanReply(partial), std::runtime_error);
}

TEST(DataLayerTest, UnansweredPingCountsAsFailure) {
    net::io_context io;
    Metrics metrics;
    RedisConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = "1"; // nothing listens here

    DataLayer data(io, cfg, metrics);
    std::exception_ptr failure;
    net::co_spawn(io, withTimeout(data.ping(), 200ms), [&](std::exception_ptr e) {
        failure = e;
        data.close();
        io.stop();
    });
    io.run();

    ASSERT_TRUE(failure);
    auto store = metrics.snapshot()["store"];
    EXPECT_EQ(store["ping_failure"], 1);
    EXPECT_EQ(store["ping_success"], 0);
}
