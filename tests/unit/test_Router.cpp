#include <gtest/gtest.h>
#include "support/FakeBlobStore.hpp"
#include "config/Config.hpp"
#include "link/MemoryLinkStore.hpp"
#include "protocols/http/Router.hpp"
#include "runtime/Deps.hpp"

#include <nlohmann/json.hpp>

using namespace ql::protocols::http;
using ql::test::FakeBlobStore;

class RouterTest : public ::testing::Test {
protected:
    ql::config::Config cfg;
    std::shared_ptr<ql::link::MemoryLinkStore> store = std::make_shared<ql::link::MemoryLinkStore>();
    std::shared_ptr<FakeBlobStore> blobs = std::make_shared<FakeBlobStore>();
    std::unique_ptr<Router> router;

    void SetUp() override {
        cfg.shortener.base_url = "https://qk.test";
        router = std::make_unique<Router>(ql::runtime::Deps::build(cfg, store, blobs));
    }

    static request make(const verb method, const std::string& target, const std::string& body = "") {
        request req{method, target, 11};
        if (!body.empty()) {
            req.set(field::content_type, "application/json");
            req.body() = body;
        }
        req.prepare_payload();
        return req;
    }

    string_response call(const verb method, const std::string& target, const std::string& body = "") const {
        return router->route(make(method, target, body));
    }

    static nlohmann::json json(const string_response& res) { return nlohmann::json::parse(res.body()); }

    static std::string header(const string_response& res, const field f) {
        const auto v = res[f];
        return {v.data(), v.size()};
    }
};

TEST_F(RouterTest, HealthCheck) {
    const auto res = call(verb::get, "/healthz");
    EXPECT_EQ(res.result(), status::ok);
    EXPECT_EQ(res.body(), "ok");
}

TEST_F(RouterTest, ShortenReturnsCreated) {
    const auto res = call(verb::post, "/shorten", R"({"original_url":"https://example.com/x","custom_short":"ex"})");
    ASSERT_EQ(res.result(), status::created);
    EXPECT_EQ(header(res, field::content_type), "application/json");

    const auto body = json(res);
    EXPECT_EQ(body.at("original_url"), "https://example.com/x");
    EXPECT_EQ(body.at("short_url"), "https://qk.test/ex");
    EXPECT_EQ(body.at("qr_code_url"), "https://cdn.test/qr-codes/qr/ex.png");
}

TEST_F(RouterTest, ShortenErrorsMapToStatusAndCode) {
    auto res = call(verb::post, "/shorten", "{not json");
    EXPECT_EQ(res.result(), status::bad_request);
    EXPECT_EQ(json(res).at("error"), "invalid_url");

    res = call(verb::post, "/shorten", R"j({"original_url":"javascript:alert(1)"})j");
    EXPECT_EQ(res.result(), status::bad_request);
    EXPECT_EQ(json(res).at("error"), "invalid_url");

    res = call(verb::post, "/shorten", R"({"original_url":"https://example.com","custom_short":"a b"})");
    EXPECT_EQ(res.result(), status::bad_request);
    EXPECT_EQ(json(res).at("error"), "invalid_code");

    (void)call(verb::post, "/shorten", R"({"original_url":"https://example.com","custom_short":"dup"})");
    res = call(verb::post, "/shorten", R"({"original_url":"https://example.org","custom_short":"dup"})");
    EXPECT_EQ(res.result(), status::conflict);
    const auto body = json(res);
    EXPECT_EQ(body.at("error"), "code_taken");
    EXPECT_TRUE(body.at("message").is_string());
}

TEST_F(RouterTest, RedirectsKnownCode) {
    (void)store->create("go", "https://example.com/target?a=1");
    for (const auto method : {verb::get, verb::head}) {
        const auto res = call(method, "/go");
        EXPECT_EQ(res.result(), status::found);
        EXPECT_EQ(header(res, field::location), "https://example.com/target?a=1");
        EXPECT_EQ(header(res, field::cache_control), "no-store");
    }
}

TEST_F(RouterTest, UnknownOrMalformedCodeIsNotFound) {
    auto res = call(verb::get, "/nothere");
    EXPECT_EQ(res.result(), status::not_found);
    EXPECT_EQ(json(res).at("error"), "not_found");

    res = call(verb::get, "/bad-code");
    EXPECT_EQ(res.result(), status::not_found);

    res = call(verb::get, "/");
    EXPECT_EQ(res.result(), status::not_found);

    res = call(verb::get, "/a/b");
    EXPECT_EQ(res.result(), status::not_found);
}

TEST_F(RouterTest, WrongMethodIsRejected) {
    auto res = call(verb::get, "/shorten");
    EXPECT_EQ(res.result(), status::method_not_allowed);
    EXPECT_EQ(header(res, field::allow), "POST");
    EXPECT_EQ(json(res).at("error"), "method_not_allowed");

    res = call(verb::post, "/somecode");
    EXPECT_EQ(res.result(), status::method_not_allowed);
    EXPECT_EQ(header(res, field::allow), "GET, HEAD");

    res = call(verb::delete_, "/api/links");
    EXPECT_EQ(res.result(), status::method_not_allowed);
}

TEST_F(RouterTest, GetLinkReturnsRecord) {
    (void)store->create("info", "https://example.com/info");
    const auto res = call(verb::get, "/api/links/info");
    ASSERT_EQ(res.result(), status::ok);
    const auto body = json(res);
    EXPECT_EQ(body.at("short_code"), "info");
    EXPECT_EQ(body.at("original_url"), "https://example.com/info");
    EXPECT_TRUE(body.at("qr_code_url").is_null());
    EXPECT_TRUE(body.at("created_at").is_string());

    EXPECT_EQ(call(verb::get, "/api/links/missing").result(), status::not_found);
}

TEST_F(RouterTest, ListLinksPagesNewestFirst) {
    for (int i = 0; i < 5; ++i) (void)store->create("c" + std::to_string(i), "https://example.com/" + std::to_string(i));

    auto res = call(verb::get, "/api/links?limit=2");
    ASSERT_EQ(res.result(), status::ok);
    auto body = json(res);
    ASSERT_TRUE(body.is_array());
    ASSERT_EQ(body.size(), 2u);
    EXPECT_EQ(body[0].at("short_code"), "c4");
    EXPECT_EQ(body[1].at("short_code"), "c3");

    res = call(verb::get, "/api/links?limit=2&offset=4");
    body = json(res);
    ASSERT_EQ(body.size(), 1u);
    EXPECT_EQ(body[0].at("short_code"), "c0");

    res = call(verb::get, "/api/links");
    EXPECT_EQ(json(res).size(), 5u);
}

TEST_F(RouterTest, ListLinksRejectsBadQuery) {
    const auto res = call(verb::get, "/api/links?limit=ten");
    EXPECT_EQ(res.result(), status::bad_request);
    EXPECT_EQ(json(res).at("error"), "invalid_query");
}

TEST_F(RouterTest, RegenerateQr) {
    blobs->failUploads = true;
    (void)call(verb::post, "/shorten", R"({"original_url":"https://example.com","custom_short":"qrless"})");
    EXPECT_TRUE(json(call(verb::get, "/api/links/qrless")).at("qr_code_url").is_null());

    auto res = call(verb::post, "/api/links/qrless/qr");
    EXPECT_EQ(res.result(), status::bad_gateway);
    EXPECT_EQ(json(res).at("error"), "storage_upload_error");

    blobs->failUploads = false;
    res = call(verb::post, "/api/links/qrless/qr");
    ASSERT_EQ(res.result(), status::ok);
    EXPECT_EQ(json(res).at("qr_code_url"), "https://cdn.test/qr-codes/qr/qrless.png");

    EXPECT_EQ(call(verb::post, "/api/links/ghost/qr").result(), status::not_found);
    EXPECT_EQ(call(verb::get, "/api/links/qrless/qr").result(), status::method_not_allowed);
}

TEST_F(RouterTest, QrUploadFailureStillCreates) {
    blobs->failUploads = true;
    const auto res = call(verb::post, "/shorten", R"({"original_url":"https://example.com/y","custom_short":"noqr"})");
    ASSERT_EQ(res.result(), status::created);
    const auto body = json(res);
    ASSERT_TRUE(body.contains("qr_code_url"));
    EXPECT_TRUE(body.at("qr_code_url").is_null());
    EXPECT_EQ(body.at("short_url"), "https://qk.test/noqr");
    EXPECT_EQ(call(verb::get, "/noqr").result(), status::found);
}

TEST_F(RouterTest, RouteNamesAreRejectedAsCustomCodes) {
    for (const std::string name : {"shorten", "healthz"}) {
        const auto res = call(verb::post, "/shorten",
                              R"({"original_url":"https://example.com","custom_short":")" + name + R"("})");
        EXPECT_EQ(res.result(), status::bad_request) << name;
        EXPECT_EQ(json(res).at("error"), "invalid_code") << name;
    }
    EXPECT_EQ(store->size(), 0u);

    EXPECT_EQ(call(verb::get, "/healthz").body(), "ok");
    EXPECT_EQ(call(verb::get, "/shorten").result(), status::method_not_allowed);
}

TEST_F(RouterTest, NoCorsHeadersWhenDisabled) {
    const auto res = call(verb::get, "/healthz");
    EXPECT_EQ(res.count(field::access_control_allow_origin), 0u);
    EXPECT_EQ(call(verb::options, "/shorten").result(), status::method_not_allowed);
}

TEST_F(RouterTest, CorsHeadersAndPreflight) {
    const Router cors(ql::runtime::Deps::build(cfg, store, blobs), "*");

    const auto preflight = cors.route(make(verb::options, "/shorten"));
    EXPECT_EQ(preflight.result(), status::no_content);
    EXPECT_EQ(header(preflight, field::access_control_allow_origin), "*");
    EXPECT_NE(header(preflight, field::access_control_allow_methods).find("POST"), std::string::npos);
    EXPECT_EQ(header(preflight, field::access_control_allow_headers), "Content-Type");
    EXPECT_TRUE(preflight.body().empty());

    const auto created = cors.route(make(verb::post, "/shorten", R"({"original_url":"https://example.com"})"));
    EXPECT_EQ(created.result(), status::created);
    EXPECT_EQ(header(created, field::access_control_allow_origin), "*");

    const auto missing = cors.route(make(verb::get, "/unknown"));
    EXPECT_EQ(missing.result(), status::not_found);
    EXPECT_EQ(header(missing, field::access_control_allow_origin), "*");
}
