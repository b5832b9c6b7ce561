#include "link/UrlValidator.hpp"
#include "link/Errors.hpp"
#include "util/parse.hpp"

#include <algorithm>
#include <cctype>

namespace ql::link {

namespace {

[[noreturn]] void reject(const std::string& why) {
    throw LinkError(ErrorCode::InvalidUrl, "Invalid URL: " + why);
}

bool isAlpha(const char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }
bool isDigit(const char c) { return c >= '0' && c <= '9'; }

// Length of a leading "scheme://" (scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )), or 0.
size_t schemePrefixLength(const std::string_view url) {
    if (url.empty() || !isAlpha(url[0])) return 0;
    size_t i = 1;
    while (i < url.size() && (isAlpha(url[i]) || isDigit(url[i]) || url[i] == '+' || url[i] == '-' || url[i] == '.')) ++i;
    if (url.substr(i, 3) != "://") return 0;
    return i;
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

void checkHost(const std::string_view host) {
    if (host.empty()) reject("missing host");

    if (host.front() == '[') {
        if (host.back() != ']' || host.size() < 3) reject("malformed IPv6 host");
        for (const char c : host.substr(1, host.size() - 2))
            if (!(std::isxdigit(static_cast<unsigned char>(c)) || c == ':' || c == '.')) reject("malformed IPv6 host");
        return;
    }

    for (const char c : host)
        if (!(isAlpha(c) || isDigit(c) || c == '.' || c == '-')) reject("host contains invalid characters");
    if (host.front() == '.' || host.front() == '-' || host.back() == '-') reject("malformed host");
}

void checkPort(const std::string_view port) {
    if (port.empty() || port.size() > 5) reject("malformed port");
    unsigned int value = 0;
    for (const char c : port) {
        if (!isDigit(c)) reject("malformed port");
        value = value * 10 + static_cast<unsigned int>(c - '0');
    }
    if (value == 0 || value > 65535) reject("port out of range");
}

}

std::string normalizeUrl(const std::string_view raw, const bool assumeHttpsScheme) {
    const auto trimmed = util::trim(raw);
    if (trimmed.empty()) reject("empty");

    for (const char c : trimmed)
        if (static_cast<unsigned char>(c) <= 0x20 || c == 0x7f) reject("contains whitespace or control characters");

    std::string url(trimmed);
    auto schemeLen = schemePrefixLength(url);
    if (schemeLen == 0) {
        if (!assumeHttpsScheme) reject("missing scheme");
        url = "https://" + url;
        schemeLen = 5;
    }

    if (url.size() > MAX_URL_LENGTH) reject("longer than " + std::to_string(MAX_URL_LENGTH) + " characters");

    const auto scheme = lower(std::string_view(url).substr(0, schemeLen));
    if (scheme != "http" && scheme != "https") reject("scheme must be http or https");

    const std::string_view rest = std::string_view(url).substr(schemeLen + 3);
    const auto authority = rest.substr(0, rest.find_first_of("/?#"));

    auto hostPort = authority;
    if (const auto at = hostPort.rfind('@'); at != std::string_view::npos) hostPort = hostPort.substr(at + 1);

    std::string_view host = hostPort;
    if (!hostPort.empty() && hostPort.front() == '[') {
        const auto close = hostPort.find(']');
        if (close == std::string_view::npos) reject("malformed IPv6 host");
        host = hostPort.substr(0, close + 1);
        const auto after = hostPort.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') reject("malformed host");
            checkPort(after.substr(1));
        }
    } else if (const auto colon = hostPort.find(':'); colon != std::string_view::npos) {
        host = hostPort.substr(0, colon);
        checkPort(hostPort.substr(colon + 1));
    }

    checkHost(host);
    return url;
}

}
