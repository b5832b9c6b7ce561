#include "link/CodeGenerator.hpp"
#include "link/Errors.hpp"
#include "link/LinkStore.hpp"
#include "config/Config.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <random>

using namespace ql::link;
using namespace ql::logging;

CodeSource ql::link::randomCodeSource() {
    return [](const unsigned int length) {
        thread_local std::mt19937_64 rng{std::random_device{}()};
        std::uniform_int_distribution<size_t> dist(0, CodeGenerator::ALPHABET.size() - 1);

        std::string code;
        code.reserve(length);
        for (unsigned int i = 0; i < length; ++i) code.push_back(CodeGenerator::ALPHABET[dist(rng)]);
        return code;
    };
}

CodeGenerator::CodeGenerator(std::shared_ptr<LinkStore> store, const config::ShortenerConfig& cfg, CodeSource source)
    : store_(std::move(store)),
      source_(std::move(source)),
      codeLength_(cfg.code_length),
      maxAttempts_(cfg.max_attempts),
      customMaxLength_(cfg.custom_code_max_length) {
    if (!store_) throw std::invalid_argument("CodeGenerator requires a LinkStore");
    if (!source_) throw std::invalid_argument("CodeGenerator requires a CodeSource");
}

bool CodeGenerator::isValidCode(const std::string_view code, const size_t maxLength) {
    if (code.empty() || code.size() > maxLength) return false;
    for (const char c : code) {
        const bool alnum = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
        if (!alnum) return false;
    }
    return true;
}

bool CodeGenerator::isReservedCode(const std::string_view code) {
    return std::find(RESERVED_CODES.begin(), RESERVED_CODES.end(), code) != RESERVED_CODES.end();
}

std::string CodeGenerator::allocate(const std::optional<std::string>& customCode) const {
    if (customCode) {
        if (!isValidCode(*customCode, customMaxLength_))
            throw LinkError(ErrorCode::InvalidCode,
                            "Custom code must be 1-" + std::to_string(customMaxLength_) +
                            " characters from [A-Za-z0-9]");
        if (isReservedCode(*customCode))
            throw LinkError(ErrorCode::InvalidCode, "Short code is reserved: " + *customCode);
        if (store_->exists(*customCode))
            throw LinkError(ErrorCode::CodeTaken, "Short code already in use: " + *customCode);
        return *customCode;
    }

    unsigned int attempts = 0;
    return generate(attempts);
}

std::string CodeGenerator::generate(unsigned int& attemptsUsed) const {
    while (attemptsUsed < maxAttempts_) {
        ++attemptsUsed;
        auto candidate = source_(codeLength_);
        if (!isReservedCode(candidate) && !store_->exists(candidate)) return candidate;
        LogRegistry::link()->debug("[CodeGenerator] Collision on '{}' (attempt {}/{})", candidate, attemptsUsed, maxAttempts_);
    }

    LogRegistry::link()->error("[CodeGenerator] Exhausted {} attempts generating a short code", maxAttempts_);
    throw LinkError(ErrorCode::GenerationExhausted,
                    "Could not generate a unique short code after " + std::to_string(maxAttempts_) + " attempts");
}
