#pragma once

#include "types/Link.hpp"
#include "types/ShortenRequest.hpp"

#include <memory>
#include <optional>
#include <string>

namespace ql::config {
struct ShortenerConfig;
}

namespace ql::qr {
class QRProducer;
}

namespace ql::link {

class LinkStore;
class CodeGenerator;

class ShortenService {
public:
    // `qr` may be null, which disables QR generation.
    ShortenService(std::shared_ptr<LinkStore> store,
                   std::shared_ptr<CodeGenerator> generator,
                   std::shared_ptr<qr::QRProducer> qr,
                   const config::ShortenerConfig& cfg);

    // Throws LinkError(InvalidUrl | InvalidCode | CodeTaken | Conflict | GenerationExhausted).
    // QR failures are logged and leave qr_code_url empty.
    types::ShortenResult shorten(const types::ShortenRequest& req) const;

    // nullptr for an unknown code; QR failures propagate as LinkError.
    std::shared_ptr<types::Link> regenerateQr(const std::string& shortCode) const;

    [[nodiscard]] std::string shortUrlFor(const std::string& shortCode) const;

private:
    std::shared_ptr<LinkStore> store_;
    std::shared_ptr<CodeGenerator> generator_;
    std::shared_ptr<qr::QRProducer> qr_;
    std::string baseUrl_;
    bool assumeHttpsScheme_;

    std::shared_ptr<types::Link> createWithGeneratedCode(const std::string& url) const;

    std::optional<std::string> tryAttachQr(const std::string& shortCode) const;
};

}
