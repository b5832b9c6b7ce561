#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <array>

namespace ql::config {
struct ShortenerConfig;
}

namespace ql::link {

class LinkStore;

// Produces a candidate code of the requested length.
using CodeSource = std::function<std::string(unsigned int length)>;

CodeSource randomCodeSource();

class CodeGenerator {
public:
    static constexpr std::string_view ALPHABET =
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

    // Single-segment routes served ahead of the redirect; a Link under one of these could never resolve.
    static constexpr std::array<std::string_view, 2> RESERVED_CODES = {"shorten", "healthz"};

    CodeGenerator(std::shared_ptr<LinkStore> store, const config::ShortenerConfig& cfg,
                  CodeSource source = randomCodeSource());

    // Validates a custom code (InvalidCode, CodeTaken) or generates an unused one (GenerationExhausted).
    [[nodiscard]] std::string allocate(const std::optional<std::string>& customCode) const;

    // Generates an unused code. `attemptsUsed` is shared across calls so that a caller who loses
    // an insert race can retry within the same budget.
    [[nodiscard]] std::string generate(unsigned int& attemptsUsed) const;

    [[nodiscard]] unsigned int maxAttempts() const { return maxAttempts_; }

    static bool isValidCode(std::string_view code, size_t maxLength);

    static bool isReservedCode(std::string_view code);

private:
    std::shared_ptr<LinkStore> store_;
    CodeSource source_;
    unsigned int codeLength_;
    unsigned int maxAttempts_;
    unsigned int customMaxLength_;
};

}
