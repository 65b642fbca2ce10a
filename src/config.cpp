#include "config.hpp"
#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <thread>

namespace {

std::string envOr(const EnvLookup& env, const char* name, const std::string& fallback) {
    const char* v = env(name);
    if (!v || !*v) return fallback;
    return v;
}

unsigned long parseUnsigned(const std::string& text, const char* name, unsigned long max) {
    std::size_t used = 0;
    unsigned long n = 0;
    try {
        n = std::stoul(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("invalid ") + name + ": " + text);
    }
    if (used != text.size() || text.front() == '-' || n == 0 || n > max)
        throw std::invalid_argument(std::string("invalid ") + name + ": " + text);
    return n;
}

} // namespace

RedisConfig parseStoreAddress(const std::string& address) {
    RedisConfig rc;
    if (address.empty()) return rc;

    if (address.front() == '[') {
        auto close = address.find(']');
        if (close == std::string::npos)
            throw std::invalid_argument("invalid VALKEY_ADDRESS: " + address);
        rc.host = address.substr(1, close - 1);
        if (close + 1 < address.size()) {
            if (address[close + 1] != ':')
                throw std::invalid_argument("invalid VALKEY_ADDRESS: " + address);
            rc.port = address.substr(close + 2);
        }
    } else {
        auto colon = address.rfind(':');
        if (colon == std::string::npos) {
            rc.host = address;
        } else {
            rc.host = address.substr(0, colon);
            rc.port = address.substr(colon + 1);
        }
    }

    if (rc.host.empty())
        throw std::invalid_argument("invalid VALKEY_ADDRESS: " + address);
    parseUnsigned(rc.port, "VALKEY_ADDRESS port", 65535);
    return rc;
}

AppConfig loadConfig(const EnvLookup& env) {
    AppConfig cfg;

    cfg.server.port = static_cast<unsigned short>(
        parseUnsigned(envOr(env, "PORT", "8080"), "PORT", 65535));
    cfg.server.bindHost = envOr(env, "BIND_HOST", cfg.server.bindHost);
    cfg.server.authToken = envOr(env, "AUTH_TOKEN", "");

    const unsigned hw = std::max(2u, std::thread::hardware_concurrency());
    cfg.server.threads = static_cast<unsigned>(
        parseUnsigned(envOr(env, "THREADS", std::to_string(hw)), "THREADS", 1024));

    cfg.redis = parseStoreAddress(envOr(env, "VALKEY_ADDRESS", "localhost:6379"));
    cfg.redis.password = envOr(env, "VALKEY_PASSWORD", "");
    return cfg;
}

AppConfig loadConfig() {
    return loadConfig([](const char* name) { return std::getenv(name); });
}
