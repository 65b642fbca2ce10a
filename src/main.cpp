#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <exception>
#include <iostream>
#include <thread>
#include <vector>
#include "config.hpp"
#include "data_layer.hpp"
#include "metrics.hpp"
#include "server.hpp"

namespace net = boost::asio;

int main() {
    AppConfig cfg;
    try {
        cfg = loadConfig();
    } catch (const std::exception& e) {
        std::cerr << "[fatal] " << e.what() << '\n';
        return 1;
    }

    net::io_context io;
    Metrics metrics;
    DataLayer data(io, cfg.redis, metrics);
    Server server(io, cfg, data, metrics);

    std::cout << "[startup] store at " << cfg.redis.host << ":" << cfg.redis.port << '\n';
    if (!cfg.redis.password.empty())
        std::cout << "[startup] store password authentication enabled" << '\n';
    if (!cfg.server.authToken.empty())
        std::cout << "[startup] token authentication enabled" << '\n';
    else
        std::cout << "[startup] warning: no AUTH_TOKEN configured, API is unsecured" << '\n';

    int exitCode = 1;
    net::co_spawn(io, server.run(), [&](std::exception_ptr e, int code) {
        if (e) {
            try {
                std::rethrow_exception(e);
            } catch (const std::exception& ex) {
                std::cerr << "[fatal] " << ex.what() << '\n';
            }
            code = 1;
        }
        exitCode = code;
        data.close();
        io.stop();
    });

    // Handlers still running past the grace period are abandoned by io.stop().
    std::vector<std::thread> workers;
    workers.reserve(cfg.server.threads - 1);
    for (unsigned i = 0; i + 1 < cfg.server.threads; ++i) workers.emplace_back([&]{ io.run(); });
    io.run();
    for (auto& t : workers) t.join();
    return exitCode;
}
