#include "database/DBConnection.hpp"
#include "logging/LogRegistry.hpp"

using namespace ql::logging;

namespace ql::database {

DBConnection::DBConnection(std::string connStr) : connStr_(std::move(connStr)) {
    reconnect();
}

DBConnection::~DBConnection() { if (conn_ && conn_->is_open()) conn_->close(); }

pqxx::connection& DBConnection::get() const { return *conn_; }

bool DBConnection::isOpen() const { return conn_ && conn_->is_open(); }

void DBConnection::reconnect() {
    if (conn_ && conn_->is_open()) conn_->close();
    conn_ = std::make_unique<pqxx::connection>(connStr_);
    initPrepared();
    LogRegistry::db()->debug("[DBConnection] Connected to {} (backend pid {})", conn_->dbname(), conn_->backendpid());
}

void DBConnection::initPrepared() const {
    if (!conn_ || !conn_->is_open()) throw std::runtime_error("Database connection is not open");
    initPreparedLinks();
}

}
