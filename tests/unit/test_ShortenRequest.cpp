#include <gtest/gtest.h>
#include "link/Errors.hpp"
#include "types/ShortenRequest.hpp"

#include <nlohmann/json.hpp>

using namespace ql::types;
using namespace ql::link;

namespace {

ErrorCode errorFor(const std::string& body) {
    try {
        (void)ShortenRequest::fromBody(body);
    } catch (const LinkError& e) {
        return e.code();
    }
    ADD_FAILURE() << "expected body to be rejected: " << body;
    return ErrorCode::NotFound;
}

}

TEST(ShortenRequest, ParsesUrlAndOptionalCustomCode) {
    const auto withCode = ShortenRequest::fromBody(R"({"original_url":"https://example.com","custom_short":"abc"})");
    EXPECT_EQ(withCode.original_url, "https://example.com");
    EXPECT_EQ(withCode.custom_short, "abc");

    const auto nullCode = ShortenRequest::fromBody(R"({"original_url":"https://example.com","custom_short":null})");
    EXPECT_FALSE(nullCode.custom_short.has_value());

    const auto noCode = ShortenRequest::fromBody(R"({"original_url":"https://example.com"})");
    EXPECT_FALSE(noCode.custom_short.has_value());
}

TEST(ShortenRequest, EmptyCustomCodeIsKeptForValidation) {
    const auto req = ShortenRequest::fromBody(R"({"original_url":"https://example.com","custom_short":""})");
    ASSERT_TRUE(req.custom_short.has_value());
    EXPECT_TRUE(req.custom_short->empty());
}

TEST(ShortenRequest, RejectsMalformedBodies) {
    EXPECT_EQ(errorFor("not json"), ErrorCode::InvalidUrl);
    EXPECT_EQ(errorFor(""), ErrorCode::InvalidUrl);
    EXPECT_EQ(errorFor("[]"), ErrorCode::InvalidUrl);
    EXPECT_EQ(errorFor("{}"), ErrorCode::InvalidUrl);
    EXPECT_EQ(errorFor(R"({"original_url":null})"), ErrorCode::InvalidUrl);
    EXPECT_EQ(errorFor(R"({"original_url":42})"), ErrorCode::InvalidUrl);
    EXPECT_EQ(errorFor(R"({"original_url":"https://example.com","custom_short":7})"), ErrorCode::InvalidCode);
}

TEST(ShortenResult, SerializesNullQrUrl) {
    const nlohmann::json j = ShortenResult{"https://example.com", "https://qk.test/abc", std::nullopt};
    EXPECT_EQ(j.at("original_url"), "https://example.com");
    EXPECT_EQ(j.at("short_url"), "https://qk.test/abc");
    EXPECT_TRUE(j.at("qr_code_url").is_null());
}
