#include "types/ShortenRequest.hpp"
#include "link/Errors.hpp"

#include <nlohmann/json.hpp>

using namespace ql::types;
using ql::link::ErrorCode;
using ql::link::LinkError;

ShortenRequest ShortenRequest::fromJson(const nlohmann::json& body) {
    if (!body.is_object()) throw LinkError(ErrorCode::InvalidUrl, "Request body must be a JSON object");

    const auto url = body.find("original_url");
    if (url == body.end() || url->is_null()) throw LinkError(ErrorCode::InvalidUrl, "Missing field 'original_url'");
    if (!url->is_string()) throw LinkError(ErrorCode::InvalidUrl, "Field 'original_url' must be a string");

    ShortenRequest req;
    req.original_url = url->get<std::string>();

    if (const auto custom = body.find("custom_short"); custom != body.end() && !custom->is_null()) {
        if (!custom->is_string()) throw LinkError(ErrorCode::InvalidCode, "Field 'custom_short' must be a string");
        req.custom_short = custom->get<std::string>();
    }

    return req;
}

ShortenRequest ShortenRequest::fromBody(const std::string& body) {
    const auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded()) throw LinkError(ErrorCode::InvalidUrl, "Request body is not valid JSON");
    return fromJson(parsed);
}

void ql::types::to_json(nlohmann::json& j, const ShortenResult& result) {
    j = nlohmann::json{
        {"original_url", result.original_url},
        {"short_url", result.short_url},
        {"qr_code_url", result.qr_code_url ? nlohmann::json(*result.qr_code_url) : nlohmann::json(nullptr)}
    };
}
