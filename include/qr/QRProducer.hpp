#pragma once

#include "qr/QRRenderer.hpp"

#include <memory>
#include <string>

namespace ql::storage {
class BlobStore;
}

namespace ql::qr {

class QRProducer {
public:
    static constexpr const auto* CONTENT_TYPE = "image/png";

    QRProducer(std::shared_ptr<storage::BlobStore> blobStore, const config::QRConfig& cfg);

    // Renders `shortUrl` and uploads it as <key_prefix><shortCode>.png; returns the public URL.
    // Throws link::LinkError(RenderError | StorageUploadError).
    std::string renderAndStore(const std::string& shortCode, const std::string& shortUrl) const;

    [[nodiscard]] std::string keyFor(const std::string& shortCode) const;

private:
    std::shared_ptr<storage::BlobStore> blobStore_;
    QRRenderer renderer_;
    std::string keyPrefix_;
};

}
