#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>

namespace ql::util {

std::unordered_map<std::string, std::string> parse_query_params(std::string_view target);

// Target without its query string, e.g. "/api/links?limit=5" -> "/api/links"
std::string_view target_path(std::string_view target);

std::string url_decode(std::string_view value);

// Throws std::invalid_argument naming `field` when `value` is not a base-10 integer.
int64_t parseInt64(const std::string& value, const std::string& field);

std::string_view trim(std::string_view s);

}
