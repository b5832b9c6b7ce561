#include "database/DBConnection.hpp"

using namespace ql::database;

void DBConnection::initPreparedLinks() const {
    conn_->prepare("insert_link",
                   "INSERT INTO links (short_code, original_url) VALUES ($1, $2) "
                   "ON CONFLICT (short_code) DO NOTHING "
                   "RETURNING id, short_code, original_url, qr_code_url, created_at");

    conn_->prepare("get_link_by_code",
                   "SELECT id, short_code, original_url, qr_code_url, created_at "
                   "FROM links WHERE short_code = $1");

    conn_->prepare("link_exists", "SELECT EXISTS(SELECT 1 FROM links WHERE short_code = $1)");

    conn_->prepare("attach_link_qr_url",
                   "UPDATE links SET qr_code_url = $2 WHERE short_code = $1 RETURNING id");

    conn_->prepare("list_links",
                   "SELECT id, short_code, original_url, qr_code_url, created_at FROM links "
                   "ORDER BY created_at DESC, id DESC LIMIT $1 OFFSET $2");
}
