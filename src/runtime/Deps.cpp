#include "runtime/Deps.hpp"
#include "config/Config.hpp"
#include "link/CodeGenerator.hpp"
#include "link/LinkStore.hpp"
#include "link/RedirectResolver.hpp"
#include "link/ShortenService.hpp"
#include "qr/QRProducer.hpp"
#include "storage/BlobStore.hpp"
#include "logging/LogRegistry.hpp"

using namespace ql::runtime;
using namespace ql::logging;

std::shared_ptr<Deps> Deps::build(const config::Config& cfg,
                                  std::shared_ptr<link::LinkStore> linkStore,
                                  std::shared_ptr<storage::BlobStore> blobStore) {
    if (!linkStore) throw std::invalid_argument("Deps::build requires a LinkStore");

    auto deps = std::make_shared<Deps>();
    deps->linkStore = std::move(linkStore);

    if (cfg.qr.enabled) {
        if (!blobStore) throw std::invalid_argument("QR generation is enabled but no BlobStore was provided");
        deps->blobStore = std::move(blobStore);
        deps->qrProducer = std::make_shared<qr::QRProducer>(deps->blobStore, cfg.qr);
    } else {
        LogRegistry::quicklink()->info("[Deps] QR generation disabled");
    }

    deps->codeGenerator = std::make_shared<link::CodeGenerator>(deps->linkStore, cfg.shortener);
    deps->redirectResolver = std::make_shared<link::RedirectResolver>(deps->linkStore);
    deps->shortenService = std::make_shared<link::ShortenService>(
        deps->linkStore, deps->codeGenerator, deps->qrProducer, cfg.shortener);

    return deps;
}
