#include "database/PgLinkStore.hpp"
#include "link/Errors.hpp"

using namespace ql::database;
using namespace ql::types;
using ql::link::ErrorCode;
using ql::link::LinkError;

PgLinkStore::PgLinkStore(std::shared_ptr<DBPool> pool) : txns_(std::move(pool)) {}

std::shared_ptr<Link> PgLinkStore::create(const std::string& shortCode, const std::string& originalUrl) {
    const auto link = txns_.exec("PgLinkStore::create", [&](pqxx::work& txn) -> std::shared_ptr<Link> {
        const auto res = txn.exec(pqxx::prepped{"insert_link"}, pqxx::params{shortCode, originalUrl});
        if (res.empty()) return nullptr; // ON CONFLICT DO NOTHING
        return std::make_shared<Link>(res.one_row());
    });

    if (!link) throw LinkError(ErrorCode::Conflict, "Short code already exists: " + shortCode);
    return link;
}

std::shared_ptr<Link> PgLinkStore::findByCode(const std::string& shortCode) {
    return txns_.exec("PgLinkStore::findByCode", [&](pqxx::work& txn) -> std::shared_ptr<Link> {
        const auto res = txn.exec(pqxx::prepped{"get_link_by_code"}, pqxx::params{shortCode});
        if (res.empty()) return nullptr;
        return std::make_shared<Link>(res.one_row());
    });
}

bool PgLinkStore::exists(const std::string& shortCode) {
    return txns_.exec("PgLinkStore::exists", [&](pqxx::work& txn) {
        return txn.exec(pqxx::prepped{"link_exists"}, pqxx::params{shortCode}).one_field().as<bool>();
    });
}

void PgLinkStore::attachQrUrl(const std::string& shortCode, const std::string& qrUrl) {
    const auto updated = txns_.exec("PgLinkStore::attachQrUrl", [&](pqxx::work& txn) {
        return !txn.exec(pqxx::prepped{"attach_link_qr_url"}, pqxx::params{shortCode, qrUrl}).empty();
    });

    if (!updated) throw LinkError(ErrorCode::NotFound, "Short code not found: " + shortCode);
}

std::vector<std::shared_ptr<Link>> PgLinkStore::list(const ListQueryParams& params) {
    return txns_.exec("PgLinkStore::list", [&](pqxx::work& txn) {
        return links_from_pq_res(txn.exec(pqxx::prepped{"list_links"},
                                          pqxx::params{params.effectiveLimit(), params.effectiveOffset()}));
    });
}
