#include "link/ShortenService.hpp"
#include "link/CodeGenerator.hpp"
#include "link/Errors.hpp"
#include "link/LinkStore.hpp"
#include "link/UrlValidator.hpp"
#include "qr/QRProducer.hpp"
#include "config/Config.hpp"
#include "logging/LogRegistry.hpp"

using namespace ql::link;
using namespace ql::types;
using namespace ql::logging;

ShortenService::ShortenService(std::shared_ptr<LinkStore> store,
                               std::shared_ptr<CodeGenerator> generator,
                               std::shared_ptr<qr::QRProducer> qr,
                               const config::ShortenerConfig& cfg)
    : store_(std::move(store)),
      generator_(std::move(generator)),
      qr_(std::move(qr)),
      baseUrl_(cfg.base_url),
      assumeHttpsScheme_(cfg.assume_https_scheme) {
    if (!store_ || !generator_) throw std::invalid_argument("ShortenService requires a LinkStore and CodeGenerator");
    while (!baseUrl_.empty() && baseUrl_.back() == '/') baseUrl_.pop_back();
}

std::string ShortenService::shortUrlFor(const std::string& shortCode) const {
    return baseUrl_ + "/" + shortCode;
}

ShortenResult ShortenService::shorten(const ShortenRequest& req) const {
    const auto url = normalizeUrl(req.original_url, assumeHttpsScheme_);

    std::shared_ptr<Link> link;
    if (req.custom_short) link = store_->create(generator_->allocate(req.custom_short), url);
    else link = createWithGeneratedCode(url);

    LogRegistry::link()->info("[ShortenService] Created '{}' -> {}", link->short_code, link->original_url);
    LogRegistry::audit()->info("created code={} url={}", link->short_code, link->original_url);

    ShortenResult result{link->original_url, shortUrlFor(link->short_code), std::nullopt};
    if (qr_) result.qr_code_url = tryAttachQr(link->short_code);
    return result;
}

std::shared_ptr<Link> ShortenService::createWithGeneratedCode(const std::string& url) const {
    unsigned int attempts = 0;
    while (true) {
        const auto code = generator_->generate(attempts);
        try {
            return store_->create(code, url);
        } catch (const LinkError& e) {
            if (e.code() != ErrorCode::Conflict) throw;
            LogRegistry::link()->warn("[ShortenService] Lost insert race on '{}' (attempt {}/{})",
                                      code, attempts, generator_->maxAttempts());
        }
    }
}

std::optional<std::string> ShortenService::tryAttachQr(const std::string& shortCode) const {
    try {
        const auto qrUrl = qr_->renderAndStore(shortCode, shortUrlFor(shortCode));
        store_->attachQrUrl(shortCode, qrUrl);
        return qrUrl;
    } catch (const std::exception& e) {
        LogRegistry::qr()->warn("[ShortenService] QR generation for '{}' failed, continuing without it: {}",
                                shortCode, e.what());
        return std::nullopt;
    }
}

std::shared_ptr<Link> ShortenService::regenerateQr(const std::string& shortCode) const {
    if (!CodeGenerator::isValidCode(shortCode, config::MAX_SHORT_CODE_LENGTH)) return nullptr;

    auto link = store_->findByCode(shortCode);
    if (!link) return nullptr;

    if (!qr_) throw LinkError(ErrorCode::RenderError, "QR generation is disabled");

    const auto qrUrl = qr_->renderAndStore(shortCode, shortUrlFor(shortCode));
    store_->attachQrUrl(shortCode, qrUrl);
    link->qr_code_url = qrUrl;

    LogRegistry::qr()->info("[ShortenService] Regenerated QR for '{}'", shortCode);
    return link;
}
