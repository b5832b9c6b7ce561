#include "util/parse.hpp"

#include <charconv>
#include <sstream>
#include <stdexcept>

namespace ql::util {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r' || s.front() == '\n'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n'))
        s.remove_suffix(1);
    return s;
}

static int hexValue(const char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string url_decode(const std::string_view value) {
    std::string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.length(); ++i) {
        if (value[i] == '%') {
            if (i + 2 >= value.length())
                throw std::invalid_argument("Invalid percent-encoding in URL");
            const int hi = hexValue(value[i + 1]);
            const int lo = hexValue(value[i + 2]);
            if (hi < 0 || lo < 0) throw std::invalid_argument("Invalid percent-encoding in URL");
            result += static_cast<char>(hi * 16 + lo);
            i += 2;
        }
        else if (value[i] == '+') result += ' ';
        else result += value[i];
    }
    return result;
}

std::string_view target_path(const std::string_view target) {
    const auto pos = target.find('?');
    return pos == std::string_view::npos ? target : target.substr(0, pos);
}

std::unordered_map<std::string, std::string> parse_query_params(const std::string_view target) {
    std::unordered_map<std::string, std::string> params;

    const auto pos = target.find('?');
    if (pos == std::string_view::npos) return params;

    const std::string query(target.substr(pos + 1));
    std::istringstream stream(query);
    std::string pair;

    while (std::getline(stream, pair, '&')) {
        const auto eq = pair.find('=');
        if (eq != std::string::npos) {
            const auto key = url_decode(pair.substr(0, eq));
            const auto value = url_decode(pair.substr(eq + 1));
            params[key] = value;
        }
    }

    return params;
}

int64_t parseInt64(const std::string& value, const std::string& field) {
    int64_t out = 0;
    const auto* begin = value.data();
    const auto* end = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(begin, end, out);
    if (value.empty() || ec != std::errc() || ptr != end)
        throw std::invalid_argument("Invalid integer for '" + field + "': " + value);
    return out;
}

}
