#pragma once
#include <boost/asio/awaitable.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>
#include "config.hpp"
#include "metrics.hpp"
#include "store.hpp"
#include "url.hpp"

namespace http = boost::beast::http;
namespace net  = boost::asio;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

struct HandlerContext {
    KeyValueStore& store;
    Metrics& metrics;
    HandlerTimeouts timeouts;
};

constexpr std::size_t kDefaultListLimit = 100;
constexpr std::size_t kMaxListLimit = 1000;

Response makeJson(const Request& req, http::status status, const nlohmann::json& body);
Response makeError(const Request& req, http::status status, const std::string& message);

// Leading integer of raw, or kDefaultListLimit when absent, unparsable or
// outside [1, kMaxListLimit].
std::size_t parseListLimit(std::string_view raw);

// Follows the scan cursor until it returns to 0 or limit keys were collected.
// The result never holds more than limit keys.
net::awaitable<std::vector<std::string>>
collectKeys(KeyValueStore& store, const std::string& pattern, std::size_t limit);

net::awaitable<Response> handleHealth(const Request& req, HandlerContext& ctx);
net::awaitable<Response> handleMetrics(const Request& req, HandlerContext& ctx);

net::awaitable<Response>
handleGetKey(const Request& req, const std::string& key, HandlerContext& ctx);

net::awaitable<Response>
handleSetKey(const Request& req, const std::string& key, HandlerContext& ctx);

net::awaitable<Response>
handleDeleteKey(const Request& req, const std::string& key, HandlerContext& ctx);

net::awaitable<Response>
handleListKeys(const Request& req, const QueryParams& query, HandlerContext& ctx);
