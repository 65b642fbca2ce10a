#pragma once
#include <functional>
#include <string>
#include <vector>
#include "http_handlers.hpp"

struct RouteParams {
    std::string key;
    QueryParams query;
};

enum class RouteAccess { Public, Protected };

struct Route {
    using Handler = std::function<net::awaitable<Response>(const Request&, const RouteParams&)>;

    http::verb verb;
    std::string pattern; // literal segments plus at most one "{key}"
    RouteAccess access;
    Handler handler;
};

// Immutable dispatch table. Protected routes pass the authorization gate first.
// GET routes also answer HEAD.
class Router {
public:
    Router(std::vector<Route> routes, std::string authToken, Metrics& metrics);

    net::awaitable<Response> dispatch(const Request& req) const;

private:
    struct CompiledRoute {
        Route route;
        std::vector<std::string> segments;
    };

    net::awaitable<Response> resolve(const Request& req) const;
    static bool accepts(http::verb routeVerb, http::verb method);

    // Empty optional: path mismatch. Otherwise the raw captured segment (may be empty).
    static std::optional<std::string_view> match(const CompiledRoute& r,
                                                 const std::vector<std::string_view>& path);

    std::vector<CompiledRoute> routes_;
    std::string authToken_;
    Metrics& metrics_;
};

// The service's route table bound to ctx.
Router makeRouter(HandlerContext& ctx, const std::string& authToken);
