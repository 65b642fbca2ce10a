#include "http_handlers.hpp"
#include <charconv>
#include <iostream>
#include <limits>
#include "timeout.hpp"

namespace {

// subject is the key, or the pattern for scans.
void logStoreFailure(const char* op, const std::string& subject, const std::exception& e) {
    std::cerr << "[store-error] op=" << op;
    if (!subject.empty()) std::cerr << " subject=" << subject;
    std::cerr << " error=" << e.what() << '\n';
}

void countFailure(Metrics& metrics, const std::exception& e) {
    if (dynamic_cast<const OperationTimeout*>(&e))
        metrics.incStoreTimeouts();
    else
        metrics.incStoreFailures();
}

Response internalError(const Request& req) {
    return makeError(req, http::status::internal_server_error, "internal server error");
}

struct SetBody {
    std::string value;
    long long expiration = 0;
};

// nullopt when the body is not a JSON object (or null) of the expected shape.
std::optional<SetBody> parseSetBody(const std::string& raw) {
    auto j = nlohmann::json::parse(raw, nullptr, false);
    if (j.is_discarded()) return std::nullopt;
    if (j.is_null()) return SetBody{};
    if (!j.is_object()) return std::nullopt;

    SetBody body;
    if (auto it = j.find("value"); it != j.end() && !it->is_null()) {
        if (!it->is_string()) return std::nullopt;
        body.value = it->get<std::string>();
    }
    if (auto it = j.find("expiration"); it != j.end() && !it->is_null()) {
        if (!it->is_number_integer()) return std::nullopt;
        if (it->is_number_unsigned() &&
            it->get<unsigned long long>() >
                static_cast<unsigned long long>(std::numeric_limits<long long>::max()))
            return std::nullopt;
        body.expiration = it->get<long long>();
    }
    return body;
}

} // namespace

Response makeJson(const Request& req, http::status status, const nlohmann::json& body) {
    Response res{status, req.version()};
    res.set(http::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    res.prepare_payload();
    return res;
}

Response makeError(const Request& req, http::status status, const std::string& message) {
    return makeJson(req, status, {{"error", message}});
}

std::size_t parseListLimit(std::string_view raw) {
    auto start = raw.find_first_not_of(" \t\r\n");
    raw.remove_prefix(start == std::string_view::npos ? raw.size() : start);
    if (!raw.empty() && raw.front() == '+') raw.remove_prefix(1);

    long long n = 0;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), n);
    if (ec != std::errc() || ptr == raw.data()) return kDefaultListLimit;
    if (n < 1 || n > static_cast<long long>(kMaxListLimit)) return kDefaultListLimit;
    return static_cast<std::size_t>(n);
}

net::awaitable<std::vector<std::string>>
collectKeys(KeyValueStore& store, const std::string& pattern, std::size_t limit) {
    std::uint64_t cursor = 0;
    std::vector<std::string> keys;

    do {
        ScanBatch batch = co_await store.scan(cursor, pattern, limit);
        keys.insert(keys.end(), std::make_move_iterator(batch.keys.begin()),
                    std::make_move_iterator(batch.keys.end()));
        cursor = batch.cursor;
    } while (cursor != 0 && keys.size() < limit);

    if (keys.size() > limit) keys.resize(limit);
    co_return keys;
}

net::awaitable<Response> handleHealth(const Request& req, HandlerContext& ctx) {
    ctx.metrics.incHttpRouteHealth();
    try {
        co_await withTimeout(ctx.store.ping(), ctx.timeouts.health);
    } catch (const std::exception& e) {
        logStoreFailure("ping", {}, e);
        co_return makeError(req, http::status::service_unavailable, "Valkey connection failed");
    }
    co_return makeJson(req, http::status::ok, {{"status", "healthy"}});
}

net::awaitable<Response> handleMetrics(const Request& req, HandlerContext& ctx) {
    ctx.metrics.incHttpRouteMetrics();
    co_return makeJson(req, http::status::ok, ctx.metrics.snapshot());
}

net::awaitable<Response>
handleGetKey(const Request& req, const std::string& key, HandlerContext& ctx) {
    ctx.metrics.incHttpRouteKeyGet();
    if (key.empty())
        co_return makeError(req, http::status::bad_request, "key is required");

    std::optional<std::string> value;
    try {
        value = co_await withTimeout(ctx.store.get(key), ctx.timeouts.get);
    } catch (const std::exception& e) {
        logStoreFailure("get", key, e);
        countFailure(ctx.metrics, e);
        co_return internalError(req);
    }

    if (!value) {
        ctx.metrics.incKvGetMisses();
        co_return makeError(req, http::status::not_found, "key not found");
    }
    ctx.metrics.incKvGetHits();

    co_return makeJson(req, http::status::ok, {{"key", key}, {"value", *value}});
}

net::awaitable<Response>
handleSetKey(const Request& req, const std::string& key, HandlerContext& ctx) {
    ctx.metrics.incHttpRouteKeySet();
    if (key.empty())
        co_return makeError(req, http::status::bad_request, "key is required");

    auto body = parseSetBody(req.body());
    if (!body)
        co_return makeError(req, http::status::bad_request, "invalid request body");
    if (body->value.empty())
        co_return makeError(req, http::status::bad_request, "value is required");

    std::optional<std::chrono::seconds> ttl;
    if (body->expiration > 0) ttl = std::chrono::seconds(body->expiration);

    try {
        co_await withTimeout(ctx.store.set(key, body->value, ttl), ctx.timeouts.set);
    } catch (const std::exception& e) {
        logStoreFailure("set", key, e);
        countFailure(ctx.metrics, e);
        co_return internalError(req);
    }

    ctx.metrics.incKvSets();
    co_return makeJson(req, http::status::created, {{"status", "created"}, {"key", key}});
}

net::awaitable<Response>
handleDeleteKey(const Request& req, const std::string& key, HandlerContext& ctx) {
    ctx.metrics.incHttpRouteKeyDelete();
    if (key.empty())
        co_return makeError(req, http::status::bad_request, "key is required");

    long long removed = 0;
    try {
        removed = co_await withTimeout(ctx.store.del(key), ctx.timeouts.del);
    } catch (const std::exception& e) {
        logStoreFailure("del", key, e);
        countFailure(ctx.metrics, e);
        co_return internalError(req);
    }

    if (removed == 0) {
        ctx.metrics.incKvDeleteMisses();
        co_return makeError(req, http::status::not_found, "key not found");
    }
    ctx.metrics.incKvDeleteHits();
    co_return makeJson(req, http::status::ok, {{"status", "deleted"}, {"key", key}});
}

net::awaitable<Response>
handleListKeys(const Request& req, const QueryParams& query, HandlerContext& ctx) {
    ctx.metrics.incHttpRouteKeyList();

    std::string pattern = "*";
    if (auto it = query.find("pattern"); it != query.end() && !it->second.empty())
        pattern = it->second;

    std::size_t limit = kDefaultListLimit;
    if (auto it = query.find("limit"); it != query.end() && !it->second.empty())
        limit = parseListLimit(it->second);

    std::vector<std::string> keys;
    try {
        keys = co_await withTimeout(collectKeys(ctx.store, pattern, limit), ctx.timeouts.list);
    } catch (const std::exception& e) {
        logStoreFailure("scan", pattern, e);
        countFailure(ctx.metrics, e);
        co_return internalError(req);
    }

    const auto count = keys.size();
    co_return makeJson(req, http::status::ok, {{"keys", std::move(keys)}, {"count", count}});
}
