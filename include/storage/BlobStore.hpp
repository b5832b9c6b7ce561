#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ql::storage {

class BlobStore {
public:
    virtual ~BlobStore() = default;

    // Stores `bytes` under `key` and returns the publicly reachable URL.
    // Throws link::LinkError(StorageUploadError) on failure.
    virtual std::string upload(const std::string& key,
                               const std::vector<uint8_t>& bytes,
                               const std::string& contentType) = 0;

    [[nodiscard]] virtual std::string publicUrl(const std::string& key) const = 0;
};

}
