#include "storage/s3/S3Controller.hpp"
#include "config/Config.hpp"
#include "link/Errors.hpp"
#include "logging/LogRegistry.hpp"
#include "util/s3Helpers.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <cstring>
#include <fmt/format.h>

using namespace ql::storage;
using namespace ql::types;
using namespace ql::util;
using namespace ql::logging;
using ql::link::ErrorCode;
using ql::link::LinkError;

namespace {

std::string rstripSlashes(std::string s) {
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}

struct ReadCursor {
    const std::vector<uint8_t>* buf;
    size_t pos = 0;
};

}

S3Controller::S3Controller(S3Credentials creds, std::string bucket, std::string publicBaseUrl)
    : creds_(std::move(creds)), bucket_(std::move(bucket)), publicBaseUrl_(rstripSlashes(std::move(publicBaseUrl))) {
    creds_.endpoint = rstripSlashes(creds_.endpoint);
    if (creds_.endpoint.find("://") == std::string::npos)
        throw std::invalid_argument("S3Controller requires an endpoint with a scheme, got: " + creds_.endpoint);
    if (bucket_.empty()) throw std::invalid_argument("S3Controller requires a bucket");
    if (publicBaseUrl_.empty()) publicBaseUrl_ = creds_.endpoint + "/" + bucket_;
    ensureCurlGlobalInit();
}

S3Controller::S3Controller(const config::BlobStorageConfig& cfg)
    : S3Controller(S3Credentials{cfg.endpoint, cfg.region, cfg.access_key, cfg.secret_access_key},
                   cfg.bucket, cfg.public_base_url) {}

S3Controller::~S3Controller() = default;

std::string S3Controller::upload(const std::string& key,
                                 const std::vector<uint8_t>& bytes,
                                 const std::string& contentType) {
    const std::string payloadHash = sha256Hex({bytes.begin(), bytes.end()});

    CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(static_cast<CURL*>(tmpHandle), key);

    SList hdrs = makeSigHeaders("PUT", canonical, payloadHash);
    hdrs.add("Content-Type: " + contentType);

    ReadCursor cursor{&bytes};

    const HttpResponse resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_READDATA, &cursor);
        curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(bytes.size()));
        curl_easy_setopt(h, CURLOPT_READFUNCTION,
            +[](char* out, const size_t size, const size_t nmemb, void* userdata) -> size_t {
                auto* c = static_cast<ReadCursor*>(userdata);
                const size_t toCopy = std::min(size * nmemb, c->buf->size() - c->pos);
                std::memcpy(out, c->buf->data() + c->pos, toCopy);
                c->pos += toCopy;
                return toCopy;
            });
    });

    if (!resp.ok()) {
        LogRegistry::cloud()->error("[S3Controller] upload of '{}' failed: CURL={} HTTP={} Response:\n{}",
                                    key, static_cast<int>(resp.curl), resp.http, resp.body);
        if (resp.curl != CURLE_OK)
            throw LinkError(ErrorCode::StorageUploadError,
                            fmt::format("Blob upload failed: {}", curl_easy_strerror(resp.curl)));
        throw LinkError(ErrorCode::StorageUploadError,
                        fmt::format("Blob upload failed with HTTP {}", resp.http));
    }

    LogRegistry::cloud()->debug("[S3Controller] Uploaded '{}' ({} bytes) to bucket '{}'", key, bytes.size(), bucket_);
    return publicUrl(key);
}

std::string S3Controller::publicUrl(const std::string& key) const {
    return publicBaseUrl_ + "/" + key;
}

std::map<std::string, std::string> S3Controller::buildHeaderMap(const std::string& payloadHash) const {
    return {
        {"host", creds_.endpoint.substr(creds_.endpoint.find("//") + 2)},
        {"x-amz-content-sha256", payloadHash},
        {"x-amz-date", getCurrentTimestamp()}
    };
}

std::pair<std::string, std::string> S3Controller::constructPaths(CURL* curl, const std::string& key) const {
    const auto escapedKey = escapeKeyPreserveSlashes(curl, key);
    const auto canonicalPath = "/" + bucket_ + "/" + escapedKey;
    const auto url = creds_.endpoint + canonicalPath;
    return {canonicalPath, url};
}

SList S3Controller::makeSigHeaders(const std::string& method,
                                   const std::string& canonical,
                                   const std::string& payloadHash) const {
    const auto base = buildHeaderMap(payloadHash);
    const auto auth = buildAuthorizationHeader(creds_, method, canonical, base, payloadHash);

    SList out;
    out.add("Authorization: " + auth);
    for (const auto& [k, v] : base) out.add(k + ": " + v);
    return out;
}
