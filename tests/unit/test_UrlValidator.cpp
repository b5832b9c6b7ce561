#include <gtest/gtest.h>
#include "link/Errors.hpp"
#include "link/UrlValidator.hpp"

using namespace ql::link;

namespace {

ErrorCode errorFor(const std::string& url, const bool assumeHttps = true) {
    try {
        (void)normalizeUrl(url, assumeHttps);
    } catch (const LinkError& e) {
        return e.code();
    }
    ADD_FAILURE() << "expected '" << url << "' to be rejected";
    return ErrorCode::NotFound;
}

}

TEST(UrlValidator, AcceptsHttpAndHttpsUnchanged) {
    EXPECT_EQ(normalizeUrl("https://example.com/a/b"), "https://example.com/a/b");
    EXPECT_EQ(normalizeUrl("http://example.com"), "http://example.com");
    EXPECT_EQ(normalizeUrl("HTTPS://Example.COM/Path?q=1#frag"), "HTTPS://Example.COM/Path?q=1#frag");
    EXPECT_EQ(normalizeUrl("https://example.com:8443/x"), "https://example.com:8443/x");
    EXPECT_EQ(normalizeUrl("https://user:pw@example.com/"), "https://user:pw@example.com/");
    EXPECT_EQ(normalizeUrl("http://[::1]:8080/"), "http://[::1]:8080/");
    EXPECT_EQ(normalizeUrl("http://127.0.0.1/"), "http://127.0.0.1/");
}

TEST(UrlValidator, TrimsSurroundingWhitespace) {
    EXPECT_EQ(normalizeUrl("  https://example.com/x \n"), "https://example.com/x");
}

TEST(UrlValidator, PrefixesHttpsWhenSchemeMissing) {
    EXPECT_EQ(normalizeUrl("example.com/path"), "https://example.com/path");
    EXPECT_EQ(normalizeUrl("example.com/?next=http://other.org"), "https://example.com/?next=http://other.org");
}

TEST(UrlValidator, MissingSchemeRejectedWhenPrefixingDisabled) {
    EXPECT_EQ(errorFor("example.com/path", false), ErrorCode::InvalidUrl);
}

TEST(UrlValidator, RejectsMalformedUrls) {
    for (const auto& bad : std::vector<std::string>{
             "", "   ", "ftp://example.com/file", "javascript://alert(1)", "https://", "https:///path",
             "https://exa mple.com", "https://example.com/a b", "https://ex_ample.com", "https://example.com:0/",
             "https://example.com:70000/", "https://example.com:80a/", "https://[::1/", "https://example.com:/x",
             "https://.example.com", std::string("https://example.com/\x01")}) {
        EXPECT_EQ(errorFor(bad), ErrorCode::InvalidUrl) << bad;
    }
}

TEST(UrlValidator, RejectsOverlongUrls) {
    const std::string longUrl = "https://example.com/" + std::string(MAX_URL_LENGTH, 'a');
    EXPECT_EQ(errorFor(longUrl), ErrorCode::InvalidUrl);

    const std::string prefix = "https://example.com/";
    const std::string atLimit = prefix + std::string(MAX_URL_LENGTH - prefix.size(), 'a');
    EXPECT_EQ(normalizeUrl(atLimit), atLimit);
}
