#pragma once

#include "database/Transactions.hpp"
#include "link/LinkStore.hpp"

namespace ql::database {

class PgLinkStore final : public link::LinkStore {
public:
    explicit PgLinkStore(std::shared_ptr<DBPool> pool);

    std::shared_ptr<types::Link> create(const std::string& shortCode, const std::string& originalUrl) override;
    std::shared_ptr<types::Link> findByCode(const std::string& shortCode) override;
    bool exists(const std::string& shortCode) override;
    void attachQrUrl(const std::string& shortCode, const std::string& qrUrl) override;
    std::vector<std::shared_ptr<types::Link>> list(const types::ListQueryParams& params) override;

private:
    Transactions txns_;
};

}
