#pragma once

#include "types/Link.hpp"
#include "types/ListQueryParams.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ql::link {

// Persistence for Link records. Uniqueness of short_code is decided here, at insert time.
class LinkStore {
public:
    virtual ~LinkStore() = default;

    // Throws LinkError(Conflict) when the code is already taken.
    virtual std::shared_ptr<types::Link> create(const std::string& shortCode, const std::string& originalUrl) = 0;

    // nullptr when no Link has this code.
    virtual std::shared_ptr<types::Link> findByCode(const std::string& shortCode) = 0;

    virtual bool exists(const std::string& shortCode) = 0;

    // Throws LinkError(NotFound) for an unknown code. Overwrites any previous URL.
    virtual void attachQrUrl(const std::string& shortCode, const std::string& qrUrl) = 0;

    // Newest first.
    virtual std::vector<std::shared_ptr<types::Link>> list(const types::ListQueryParams& params) = 0;
};

}
