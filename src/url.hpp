#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Decoded query parameters. Only the first occurrence of a name is kept.
using QueryParams = std::map<std::string, std::string>;

struct SplitTarget {
    std::string_view path;
    std::string_view query;
};

SplitTarget splitTarget(std::string_view target);

// Percent-decoding. With plusAsSpace, '+' decodes to ' ' (query strings).
// Returns nullopt on a malformed escape.
std::optional<std::string> urlDecode(std::string_view in, bool plusAsSpace = false);

// Malformed pairs are skipped.
QueryParams parseQuery(std::string_view query);

// Splits "/a/b/" into {"a", "b", ""}. The leading slash is dropped.
std::vector<std::string_view> pathSegments(std::string_view path);
