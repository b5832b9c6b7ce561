#include "qr/QRProducer.hpp"
#include "config/Config.hpp"
#include "link/Errors.hpp"
#include "logging/LogRegistry.hpp"
#include "storage/BlobStore.hpp"

using namespace ql::qr;
using namespace ql::logging;
using ql::link::ErrorCode;
using ql::link::LinkError;

QRProducer::QRProducer(std::shared_ptr<storage::BlobStore> blobStore, const config::QRConfig& cfg)
    : blobStore_(std::move(blobStore)), renderer_(cfg), keyPrefix_(cfg.key_prefix) {
    if (!blobStore_) throw std::invalid_argument("QRProducer requires a BlobStore");
}

std::string QRProducer::keyFor(const std::string& shortCode) const {
    return keyPrefix_ + shortCode + ".png";
}

std::string QRProducer::renderAndStore(const std::string& shortCode, const std::string& shortUrl) const {
    const auto png = renderer_.renderPng(shortUrl);
    LogRegistry::qr()->debug("[QRProducer] Rendered {} byte PNG for '{}'", png.size(), shortCode);

    try {
        return blobStore_->upload(keyFor(shortCode), png, CONTENT_TYPE);
    } catch (const LinkError&) {
        throw;
    } catch (const std::exception& e) {
        throw LinkError(ErrorCode::StorageUploadError, std::string("Blob upload failed: ") + e.what());
    }
}
