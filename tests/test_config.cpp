#include <gtest/gtest.h>
#include <map>
#include <stdexcept>
#include <string>
#include "config.hpp"

namespace {

EnvLookup envFrom(const std::map<std::string, std::string>& vars) {
    return [vars](const char* name) -> const char* {
        auto it = vars.find(name);
        return it == vars.end() ? nullptr : it->second.c_str();
    };
}

} // namespace

TEST(ConfigTest, Defaults) {
    auto cfg = loadConfig(envFrom({}));
    EXPECT_EQ(cfg.server.port, 8080);
    EXPECT_EQ(cfg.server.bindHost, "0.0.0.0");
    EXPECT_TRUE(cfg.server.authToken.empty());
    EXPECT_GE(cfg.server.threads, 2u);
    EXPECT_EQ(cfg.redis.host, "localhost");
    EXPECT_EQ(cfg.redis.port, "6379");
    EXPECT_TRUE(cfg.redis.password.empty());

    EXPECT_EQ(cfg.server.readTimeout, std::chrono::seconds(10));
    EXPECT_EQ(cfg.server.writeTimeout, std::chrono::seconds(10));
    EXPECT_EQ(cfg.server.idleTimeout, std::chrono::seconds(120));
    EXPECT_EQ(cfg.server.gracePeriod, std::chrono::seconds(10));
    EXPECT_EQ(cfg.timeouts.get, std::chrono::seconds(5));
    EXPECT_EQ(cfg.timeouts.list, std::chrono::seconds(10));
    EXPECT_EQ(cfg.timeouts.health, std::chrono::seconds(2));
}

TEST(ConfigTest, ReadsEnvironment) {
    auto cfg = loadConfig(envFrom({
        {"PORT", "9090"},
        {"BIND_HOST", "127.0.0.1"},
        {"VALKEY_ADDRESS", "cache.internal:6380"},
        {"VALKEY_PASSWORD", "pw"},
        {"AUTH_TOKEN", "secret"},
        {"THREADS", "3"},
    }));
    EXPECT_EQ(cfg.server.port, 9090);
    EXPECT_EQ(cfg.server.bindHost, "127.0.0.1");
    EXPECT_EQ(cfg.server.authToken, "secret");
    EXPECT_EQ(cfg.server.threads, 3u);
    EXPECT_EQ(cfg.redis.host, "cache.internal");
    EXPECT_EQ(cfg.redis.port, "6380");
    EXPECT_EQ(cfg.redis.password, "pw");
}

TEST(ConfigTest, EmptyVariablesFallBackToDefaults) {
    auto cfg = loadConfig(envFrom({{"PORT", ""}, {"VALKEY_ADDRESS", ""}}));
    EXPECT_EQ(cfg.server.port, 8080);
    EXPECT_EQ(cfg.redis.host, "localhost");
}

TEST(ConfigTest, RejectsBadPort) {
    EXPECT_THROW(loadConfig(envFrom({{"PORT", "http"}})), std::invalid_argument);
    EXPECT_THROW(loadConfig(envFrom({{"PORT", "0"}})), std::invalid_argument);
    EXPECT_THROW(loadConfig(envFrom({{"PORT", "70000"}})), std::invalid_argument);
    EXPECT_THROW(loadConfig(envFrom({{"PORT", "80x"}})), std::invalid_argument);
}

TEST(ConfigTest, ParsesStoreAddresses) {
    auto plain = parseStoreAddress("redis");
    EXPECT_EQ(plain.host, "redis");
    EXPECT_EQ(plain.port, "6379");

    auto v6 = parseStoreAddress("[::1]:7000");
    EXPECT_EQ(v6.host, "::1");
    EXPECT_EQ(v6.port, "7000");

    auto v6NoPort = parseStoreAddress("[::1]");
    EXPECT_EQ(v6NoPort.host, "::1");
    EXPECT_EQ(v6NoPort.port, "6379");

    EXPECT_THROW(parseStoreAddress(":6379"), std::invalid_argument);
    EXPECT_THROW(parseStoreAddress("host:port"), std::invalid_argument);
    EXPECT_THROW(parseStoreAddress("[::1"), std::invalid_argument);
}
