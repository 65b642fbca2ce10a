#pragma once
#include <chrono>
#include <functional>
#include <string>

struct RedisConfig {
    std::string host = "localhost";
    std::string port = "6379";
    std::string password; // from env VALKEY_PASSWORD
};

struct ServerConfig {
    std::string bindHost = "0.0.0.0";
    unsigned short port = 8080;
    std::string authToken; // from env AUTH_TOKEN, empty disables auth
    unsigned threads = 2;

    std::chrono::steady_clock::duration readTimeout = std::chrono::seconds(10);
    std::chrono::steady_clock::duration writeTimeout = std::chrono::seconds(10);
    std::chrono::steady_clock::duration idleTimeout = std::chrono::seconds(120);
    std::chrono::steady_clock::duration gracePeriod = std::chrono::seconds(10);
    std::chrono::steady_clock::duration startupProbeTimeout = std::chrono::seconds(5);
};

// Deadlines applied around store calls, one per operation.
struct HandlerTimeouts {
    std::chrono::steady_clock::duration get = std::chrono::seconds(5);
    std::chrono::steady_clock::duration set = std::chrono::seconds(5);
    std::chrono::steady_clock::duration del = std::chrono::seconds(5);
    std::chrono::steady_clock::duration list = std::chrono::seconds(10);
    std::chrono::steady_clock::duration health = std::chrono::seconds(2);
};

struct AppConfig {
    ServerConfig server;
    RedisConfig redis;
    HandlerTimeouts timeouts;
};

using EnvLookup = std::function<const char*(const char*)>;

// Splits "host:port" or "[v6addr]:port". A missing port keeps the default.
RedisConfig parseStoreAddress(const std::string& address);

AppConfig loadConfig(const EnvLookup& env);
AppConfig loadConfig();
