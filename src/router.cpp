#include "router.hpp"
#include "auth.hpp"

namespace {
constexpr std::string_view kKeyParam = "{key}";
}

Router::Router(std::vector<Route> routes, std::string authToken, Metrics& metrics)
    : authToken_(std::move(authToken)), metrics_(metrics) {
    for (auto& route : routes) {
        CompiledRoute compiled{std::move(route), {}};
        for (auto seg : pathSegments(compiled.route.pattern)) compiled.segments.emplace_back(seg);
        routes_.push_back(std::move(compiled));
    }
}

std::optional<std::string_view> Router::match(const CompiledRoute& r,
                                              const std::vector<std::string_view>& path) {
    if (r.segments.size() != path.size()) return std::nullopt;

    std::string_view captured;
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (r.segments[i] == kKeyParam)
            captured = path[i];
        else if (r.segments[i] != path[i])
            return std::nullopt;
    }
    return captured;
}

bool Router::accepts(http::verb routeVerb, http::verb method) {
    return routeVerb == method || (routeVerb == http::verb::get && method == http::verb::head);
}

net::awaitable<Response> Router::dispatch(const Request& req) const {
    auto res = co_await resolve(req);
    // HEAD keeps the headers of the GET answer, Content-Length included, but sends no body.
    if (req.method() == http::verb::head) res.body().clear();
    co_return res;
}

net::awaitable<Response> Router::resolve(const Request& req) const {
    metrics_.incHttpTotal();

    const std::string target(req.target());
    auto split = splitTarget(target);
    auto path = pathSegments(split.path);

    const CompiledRoute* found = nullptr;
    std::string_view rawKey;
    std::string allowed;
    for (const auto& r : routes_) {
        auto captured = match(r, path);
        if (!captured) continue;
        if (accepts(r.route.verb, req.method())) {
            found = &r;
            rawKey = *captured;
            break;
        }
        if (!allowed.empty()) allowed += ", ";
        allowed += std::string(http::to_string(r.route.verb));
        if (r.route.verb == http::verb::get) allowed += ", HEAD";
    }

    if (!found) {
        metrics_.incHttpRouteOther();
        if (allowed.empty())
            co_return makeError(req, http::status::not_found, "not found");
        auto res = makeError(req, http::status::method_not_allowed, "method not allowed");
        res.set(http::field::allow, allowed);
        co_return res;
    }

    if (found->route.access == RouteAccess::Protected) {
        auto header = req[http::field::authorization];
        auto decision = authorize(authToken_, std::string_view(header.data(), header.size()));
        if (decision != AuthDecision::Admit) {
            if (decision == AuthDecision::CredentialMissing)
                metrics_.incAuthMissing();
            else
                metrics_.incAuthInvalid();
            co_return makeError(req, http::status::unauthorized, rejectionMessage(decision));
        }
    }

    RouteParams params;
    auto key = urlDecode(rawKey);
    if (!key)
        co_return makeError(req, http::status::bad_request, "invalid request path");
    params.key = std::move(*key);
    params.query = parseQuery(split.query);

    co_return co_await found->route.handler(req, params);
}

Router makeRouter(HandlerContext& ctx, const std::string& authToken) {
    std::vector<Route> routes;

    routes.push_back({http::verb::get, "/health", RouteAccess::Public,
        [&ctx](const Request& req, const RouteParams&) { return handleHealth(req, ctx); }});
    routes.push_back({http::verb::get, "/metrics", RouteAccess::Protected,
        [&ctx](const Request& req, const RouteParams&) { return handleMetrics(req, ctx); }});
    routes.push_back({http::verb::get, "/keys", RouteAccess::Protected,
        [&ctx](const Request& req, const RouteParams& p) { return handleListKeys(req, p.query, ctx); }});
    routes.push_back({http::verb::get, "/keys/{key}", RouteAccess::Protected,
        [&ctx](const Request& req, const RouteParams& p) { return handleGetKey(req, p.key, ctx); }});
    routes.push_back({http::verb::post, "/keys/{key}", RouteAccess::Protected,
        [&ctx](const Request& req, const RouteParams& p) { return handleSetKey(req, p.key, ctx); }});
    routes.push_back({http::verb::delete_, "/keys/{key}", RouteAccess::Protected,
        [&ctx](const Request& req, const RouteParams& p) { return handleDeleteKey(req, p.key, ctx); }});

    return Router(std::move(routes), authToken, ctx.metrics);
}
