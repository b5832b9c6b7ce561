#pragma once

#include "logging/LogRegistry.hpp"

#include <pqxx/pqxx>
#include <string>

namespace ql::database::seed {

// Runs on a dedicated connection before the pool prepares statements against `links`.
inline void init_tables_if_not_exists(const std::string& connStr) {
    pqxx::connection conn(connStr);
    pqxx::work txn(conn);

    txn.exec(R"(
CREATE TABLE IF NOT EXISTS links
(
    id           BIGSERIAL    PRIMARY KEY,
    short_code   VARCHAR(32)  NOT NULL UNIQUE,
    original_url TEXT         NOT NULL,
    qr_code_url  TEXT,
    created_at   TIMESTAMP    NOT NULL DEFAULT (NOW() AT TIME ZONE 'utc')
);
    )");

    txn.exec("CREATE INDEX IF NOT EXISTS links_created_at_idx ON links (created_at DESC, id DESC)");

    txn.commit();
    logging::LogRegistry::db()->info("[seed] links table ready");
}

}
