#include "link/RedirectResolver.hpp"
#include "link/CodeGenerator.hpp"
#include "link/LinkStore.hpp"
#include "config/Config.hpp"

using namespace ql::link;

RedirectResolver::RedirectResolver(std::shared_ptr<LinkStore> store) : store_(std::move(store)) {
    if (!store_) throw std::invalid_argument("RedirectResolver requires a LinkStore");
}

std::optional<std::string> RedirectResolver::resolve(const std::string& shortCode) const {
    if (!CodeGenerator::isValidCode(shortCode, config::MAX_SHORT_CODE_LENGTH)) return std::nullopt;
    const auto link = store_->findByCode(shortCode);
    if (!link) return std::nullopt;
    return link->original_url;
}
