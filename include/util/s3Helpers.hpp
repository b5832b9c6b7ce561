#pragma once

#include <curl/curl.h>
#include <map>
#include <string>

namespace ql::types {
struct S3Credentials;
}

namespace ql::util {

std::string sha256Hex(const std::string& data);
std::string hmacSha256Hex(const std::string& key, const std::string& data);
std::string hmacSha256Raw(const std::string& key, const std::string& data);
std::string escapeKeyPreserveSlashes(CURL* curl, const std::string& key);
size_t writeToString(const char* ptr, size_t size, size_t nmemb, void* userdata);

// AWS Signature V4. `headers` must hold x-amz-date and is signed in full.
std::string buildAuthorizationHeader(const types::S3Credentials& creds,
                                     const std::string& method, const std::string& canonicalPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash, const std::string& canonicalQuery = "");

void ensureCurlGlobalInit();

}
