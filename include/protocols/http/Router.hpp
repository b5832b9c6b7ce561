#pragma once

#include <boost/beast/http.hpp>
#include <nlohmann/json_fwd.hpp>
#include <memory>
#include <string>

namespace ql::runtime {
struct Deps;
}

namespace ql::protocols::http {

using request = boost::beast::http::request<boost::beast::http::string_body>;
using string_response = boost::beast::http::response<boost::beast::http::string_body>;

using field = boost::beast::http::field;
using verb = boost::beast::http::verb;
using status = boost::beast::http::status;

class Router {
public:
    // A non-empty `corsAllowOrigin` answers OPTIONS preflights and tags every response with it.
    explicit Router(std::shared_ptr<runtime::Deps> deps, std::string corsAllowOrigin = "");

    // Never throws; failures become JSON error responses.
    [[nodiscard]] string_response route(const request& req) const;

    static string_response makeJsonResponse(const request& req, const nlohmann::json& j, status s = status::ok);

    static string_response makeErrorResponse(const request& req, const std::string& error,
                                             const std::string& message, status s);

    static string_response makeRedirectResponse(const request& req, const std::string& location);

private:
    std::shared_ptr<runtime::Deps> deps_;
    std::string corsAllowOrigin_;

    string_response routeUnchecked(const request& req) const;
    static string_response handlePreflight(const request& req);
    string_response dispatch(const request& req) const;

    string_response handleShorten(const request& req) const;
    string_response handleRedirect(const request& req, const std::string& shortCode) const;
    string_response handleListLinks(const request& req) const;
    string_response handleGetLink(const request& req, const std::string& shortCode) const;
    string_response handleRegenerateQr(const request& req, const std::string& shortCode) const;
    static string_response handleHealth(const request& req);
};

}
