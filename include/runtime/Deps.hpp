#pragma once

#include <memory>

namespace ql::config { struct Config; }
namespace ql::link {
class LinkStore;
class CodeGenerator;
class RedirectResolver;
class ShortenService;
}
namespace ql::storage { class BlobStore; }
namespace ql::qr { class QRProducer; }

namespace ql::runtime {

// Everything the HTTP layer needs, built once by main (or a test) and passed down.
struct Deps {
    std::shared_ptr<link::LinkStore> linkStore;
    std::shared_ptr<storage::BlobStore> blobStore;        // null when QR is disabled
    std::shared_ptr<qr::QRProducer> qrProducer;           // null when QR is disabled
    std::shared_ptr<link::CodeGenerator> codeGenerator;
    std::shared_ptr<link::RedirectResolver> redirectResolver;
    std::shared_ptr<link::ShortenService> shortenService;

    // Wires the services around the given collaborators. `blobStore` is ignored when qr.enabled is false.
    static std::shared_ptr<Deps> build(const config::Config& cfg,
                                       std::shared_ptr<link::LinkStore> linkStore,
                                       std::shared_ptr<storage::BlobStore> blobStore);
};

}
