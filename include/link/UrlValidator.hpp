#pragma once

#include <string>
#include <string_view>

namespace ql::link {

constexpr size_t MAX_URL_LENGTH = 2048;

// Trims, optionally prefixes https://, and checks the result is an absolute http(s) URL.
// Returns the URL to store. Throws LinkError(InvalidUrl).
std::string normalizeUrl(std::string_view raw, bool assumeHttpsScheme = true);

}
