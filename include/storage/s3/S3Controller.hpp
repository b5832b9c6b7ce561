#pragma once

#include "storage/BlobStore.hpp"
#include "types/S3Credentials.hpp"
#include "util/curlWrappers.hpp"

#include <map>
#include <string>
#include <utility>

namespace ql::config {
struct BlobStorageConfig;
}

namespace ql::storage {

// Minimal S3 client: signed single-part PUT of small objects.
class S3Controller final : public BlobStore {
public:
    S3Controller(types::S3Credentials creds, std::string bucket, std::string publicBaseUrl = "");

    explicit S3Controller(const config::BlobStorageConfig& cfg);

    ~S3Controller() override;

    std::string upload(const std::string& key,
                       const std::vector<uint8_t>& bytes,
                       const std::string& contentType) override;

    [[nodiscard]] std::string publicUrl(const std::string& key) const override;

private:
    types::S3Credentials creds_;
    std::string bucket_;
    std::string publicBaseUrl_;

    [[nodiscard]] std::map<std::string, std::string> buildHeaderMap(const std::string& payloadHash) const;

    std::pair<std::string, std::string> constructPaths(CURL* curl, const std::string& key) const;

    [[nodiscard]] util::SList makeSigHeaders(const std::string& method,
                                             const std::string& canonical,
                                             const std::string& payloadHash) const;
};

}
