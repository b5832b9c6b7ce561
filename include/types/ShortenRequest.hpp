#pragma once

#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace ql::types {

struct ShortenRequest {
    std::string original_url;
    std::optional<std::string> custom_short;

    // Field-level checks only; URL syntax is validated by the service.
    // Throws link::LinkError(InvalidUrl | InvalidCode).
    static ShortenRequest fromJson(const nlohmann::json& body);

    static ShortenRequest fromBody(const std::string& body);
};

struct ShortenResult {
    std::string original_url;
    std::string short_url;
    std::optional<std::string> qr_code_url;
};

void to_json(nlohmann::json& j, const ShortenResult& result);

}
