#include "util/s3Helpers.hpp"
#include "types/S3Credentials.hpp"

#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace ql::util {

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

static std::string toHex(const unsigned char* data, const size_t len) {
    std::ostringstream oss;
    for (size_t i = 0; i < len; ++i) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    return oss.str();
}

std::string sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return toHex(hash, SHA256_DIGEST_LENGTH);
}

std::string hmacSha256Hex(const std::string& key, const std::string& data) {
    const auto raw = hmacSha256Raw(key, data);
    return toHex(reinterpret_cast<const unsigned char*>(raw.data()), raw.size());
}

std::string hmacSha256Raw(const std::string& key, const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    unsigned int len = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, &len))
        throw std::runtime_error("HMAC-SHA256 failed");
    return {reinterpret_cast<char*>(digest), len};
}

std::string escapeKeyPreserveSlashes(CURL* curl, const std::string& key) {
    std::ostringstream out;
    size_t start = 0;
    while (true) {
        const auto slash = key.find('/', start);
        const auto seg = key.substr(start, slash == std::string::npos ? std::string::npos : slash - start);

        char* esc = curl_easy_escape(curl, seg.c_str(), static_cast<int>(seg.length()));
        if (!esc) throw std::runtime_error("curl_easy_escape failed for key: " + key);
        out << esc;
        curl_free(esc);

        if (slash == std::string::npos) break;
        out << '/';
        start = slash + 1;
    }
    return out.str();
}

size_t writeToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string buildAuthorizationHeader(const types::S3Credentials& creds,
                                     const std::string& method,
                                     const std::string& canonicalPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash,
                                     const std::string& canonicalQuery) {
    const std::string service = "s3";
    const std::string algorithm = "AWS4-HMAC-SHA256";
    const std::string amzDate = headers.at("x-amz-date");
    const std::string dateStamp = amzDate.substr(0, 8); // YYYYMMDD, same instant as amzDate

    // std::map keeps the headers sorted, as SigV4 requires
    std::string canonicalHeaders, signedHeaders;
    for (auto it = headers.begin(); it != headers.end(); ++it) {
        canonicalHeaders += it->first + ":" + it->second + "\n";
        signedHeaders += it->first;
        if (std::next(it) != headers.end()) signedHeaders += ";";
    }

    std::ostringstream canonicalRequest;
    canonicalRequest << method << "\n"
                     << canonicalPath << "\n"
                     << canonicalQuery << "\n"
                     << canonicalHeaders << "\n"
                     << signedHeaders << "\n"
                     << payloadHash;

    const std::string credentialScope = dateStamp + "/" + creds.region + "/" + service + "/aws4_request";
    std::ostringstream stringToSign;
    stringToSign << algorithm << "\n"
                 << amzDate << "\n"
                 << credentialScope << "\n"
                 << sha256Hex(canonicalRequest.str());

    const std::string kDate    = hmacSha256Raw("AWS4" + creds.secret_access_key, dateStamp);
    const std::string kRegion  = hmacSha256Raw(kDate, creds.region);
    const std::string kService = hmacSha256Raw(kRegion, service);
    const std::string kSigning = hmacSha256Raw(kService, "aws4_request");

    const std::string signature = hmacSha256Hex(kSigning, stringToSign.str());

    std::ostringstream authHeader;
    authHeader << algorithm << " "
               << "Credential=" << creds.access_key << "/" << credentialScope << ", "
               << "SignedHeaders=" << signedHeaders << ", "
               << "Signature=" << signature;
    return authHeader.str();
}

}
