#include "protocols/http/Router.hpp"
#include "link/Errors.hpp"
#include "link/LinkStore.hpp"
#include "link/RedirectResolver.hpp"
#include "link/ShortenService.hpp"
#include "link/CodeGenerator.hpp"
#include "config/Config.hpp"
#include "runtime/Deps.hpp"
#include "types/ListQueryParams.hpp"
#include "types/ShortenRequest.hpp"
#include "util/parse.hpp"
#include "logging/LogRegistry.hpp"

#include <nlohmann/json.hpp>

using namespace ql::protocols::http;
using namespace ql::logging;
using namespace ql::types;
using ql::link::LinkError;

namespace {

constexpr std::string_view API_LINKS_PREFIX = "/api/links/";
constexpr std::string_view QR_SUFFIX = "/qr";

std::string_view targetOf(const request& req) {
    return {req.target().data(), req.target().size()};
}

std::string describe(const request& req) {
    return std::string(req.method_string().data(), req.method_string().size()) + " " + std::string(targetOf(req));
}

string_response methodNotAllowed(const request& req, const std::string& allow) {
    auto res = Router::makeErrorResponse(req, "method_not_allowed", "Method not allowed", status::method_not_allowed);
    res.set(field::allow, allow);
    return res;
}

}

Router::Router(std::shared_ptr<runtime::Deps> deps, std::string corsAllowOrigin)
    : deps_(std::move(deps)), corsAllowOrigin_(std::move(corsAllowOrigin)) {
    if (!deps_) throw std::invalid_argument("Router requires service dependencies");
}

string_response Router::route(const request& req) const {
    auto res = routeUnchecked(req);
    if (!corsAllowOrigin_.empty()) res.set(field::access_control_allow_origin, corsAllowOrigin_);
    return res;
}

string_response Router::routeUnchecked(const request& req) const {
    if (!corsAllowOrigin_.empty() && req.method() == verb::options) return handlePreflight(req);

    try {
        return dispatch(req);
    } catch (const LinkError& e) {
        const auto code = e.code();
        if (code == link::ErrorCode::GenerationExhausted)
            LogRegistry::http()->error("[Router] {}: {}", describe(req), e.what());
        else
            LogRegistry::http()->debug("[Router] {}: {}", describe(req), e.what());
        return makeErrorResponse(req, link::to_string(code), e.what(), static_cast<status>(link::http_status(code)));
    } catch (const std::exception& e) {
        LogRegistry::http()->error("[Router] Unhandled exception for {}: {}", describe(req), e.what());
        return makeErrorResponse(req, "internal_error", "Internal server error", status::internal_server_error);
    }
}

string_response Router::dispatch(const request& req) const {
    const std::string path(util::target_path(targetOf(req)));

    if (path == "/healthz") {
        if (req.method() != verb::get && req.method() != verb::head) return methodNotAllowed(req, "GET, HEAD");
        return handleHealth(req);
    }

    if (path == "/shorten") {
        if (req.method() != verb::post) return methodNotAllowed(req, "POST");
        return handleShorten(req);
    }

    if (path == "/api/links") {
        if (req.method() != verb::get) return methodNotAllowed(req, "GET");
        return handleListLinks(req);
    }

    if (path.starts_with(API_LINKS_PREFIX)) {
        auto rest = path.substr(API_LINKS_PREFIX.size());
        if (rest.ends_with(QR_SUFFIX)) {
            rest.resize(rest.size() - QR_SUFFIX.size());
            if (rest.empty() || rest.find('/') != std::string::npos)
                return makeErrorResponse(req, "not_found", "Not found", status::not_found);
            if (req.method() != verb::post) return methodNotAllowed(req, "POST");
            return handleRegenerateQr(req, rest);
        }
        if (rest.empty() || rest.find('/') != std::string::npos)
            return makeErrorResponse(req, "not_found", "Not found", status::not_found);
        if (req.method() != verb::get) return methodNotAllowed(req, "GET");
        return handleGetLink(req, rest);
    }

    // /{short_code}
    if (path.size() > 1 && path.find('/', 1) == std::string::npos) {
        if (req.method() != verb::get && req.method() != verb::head) return methodNotAllowed(req, "GET, HEAD");
        return handleRedirect(req, path.substr(1));
    }

    return makeErrorResponse(req, "not_found", "Not found", status::not_found);
}

string_response Router::handleHealth(const request& req) {
    string_response res{status::ok, req.version()};
    res.set(field::content_type, "text/plain");
    res.keep_alive(req.keep_alive());
    res.body() = "ok";
    res.prepare_payload();
    return res;
}

string_response Router::handlePreflight(const request& req) {
    string_response res{status::no_content, req.version()};
    res.set(field::access_control_allow_methods, "GET, HEAD, POST, OPTIONS");
    res.set(field::access_control_allow_headers, "Content-Type");
    res.set(field::access_control_max_age, "600");
    res.keep_alive(req.keep_alive());
    res.prepare_payload();
    return res;
}

string_response Router::handleShorten(const request& req) const {
    const auto shortenReq = ShortenRequest::fromBody(req.body());
    const auto result = deps_->shortenService->shorten(shortenReq);
    return makeJsonResponse(req, result, status::created);
}

string_response Router::handleRedirect(const request& req, const std::string& shortCode) const {
    const auto target = deps_->redirectResolver->resolve(shortCode);
    if (!target) return makeErrorResponse(req, "not_found", "Short code not found", status::not_found);
    return makeRedirectResponse(req, *target);
}

string_response Router::handleListLinks(const request& req) const {
    ListQueryParams params;
    try {
        params = ListQueryParams::fromQuery(util::parse_query_params(targetOf(req)));
    } catch (const std::invalid_argument& e) {
        return makeErrorResponse(req, "invalid_query", e.what(), status::bad_request);
    }
    return makeJsonResponse(req, deps_->linkStore->list(params));
}

string_response Router::handleGetLink(const request& req, const std::string& shortCode) const {
    if (!link::CodeGenerator::isValidCode(shortCode, config::MAX_SHORT_CODE_LENGTH))
        return makeErrorResponse(req, "not_found", "Short code not found", status::not_found);

    const auto found = deps_->linkStore->findByCode(shortCode);
    if (!found) return makeErrorResponse(req, "not_found", "Short code not found", status::not_found);
    return makeJsonResponse(req, found);
}

string_response Router::handleRegenerateQr(const request& req, const std::string& shortCode) const {
    const auto updated = deps_->shortenService->regenerateQr(shortCode);
    if (!updated) return makeErrorResponse(req, "not_found", "Short code not found", status::not_found);
    return makeJsonResponse(req, updated);
}

string_response Router::makeJsonResponse(const request& req, const nlohmann::json& j, const status s) {
    string_response res{s, req.version()};
    res.set(field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = j.dump();
    res.prepare_payload();
    return res;
}

string_response Router::makeErrorResponse(const request& req, const std::string& error,
                                          const std::string& message, const status s) {
    return makeJsonResponse(req, nlohmann::json{{"error", error}, {"message", message}}, s);
}

string_response Router::makeRedirectResponse(const request& req, const std::string& location) {
    string_response res{status::found, req.version()};
    res.set(field::location, location);
    res.set(field::cache_control, "no-store");
    res.keep_alive(req.keep_alive());
    res.prepare_payload();
    return res;
}
