#pragma once

#include <memory>
#include <optional>
#include <string>

namespace ql::link {

class LinkStore;

class RedirectResolver {
public:
    explicit RedirectResolver(std::shared_ptr<LinkStore> store);

    // Target URL for `shortCode`, or nullopt when unknown or malformed.
    [[nodiscard]] std::optional<std::string> resolve(const std::string& shortCode) const;

private:
    std::shared_ptr<LinkStore> store_;
};

}
