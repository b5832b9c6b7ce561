#include "database/DBPool.hpp"
#include "logging/LogRegistry.hpp"

using namespace ql::logging;

namespace ql::database {

DBPool::DBPool(const std::string& connStr, const size_t size) : size_(size) {
    if (size == 0) throw std::invalid_argument("DBPool size must be at least 1");
    for (size_t i = 0; i < size; ++i) pool_.push(std::make_unique<DBConnection>(connStr));
    LogRegistry::db()->info("[DBPool] Opened {} database connections", size);
}

std::unique_ptr<DBConnection> DBPool::acquire() {
    std::unique_ptr<DBConnection> conn;
    {
        std::unique_lock lock(mtx_);
        cv_.wait(lock, [&]() { return !pool_.empty(); });
        conn = std::move(pool_.front());
        pool_.pop();
    }

    if (!conn->isOpen()) {
        LogRegistry::db()->warn("[DBPool] Pooled connection was closed, reconnecting");
        try {
            conn->reconnect();
        } catch (...) {
            release(std::move(conn));
            throw;
        }
    }

    return conn;
}

void DBPool::release(std::unique_ptr<DBConnection> conn) {
    {
        std::lock_guard lock(mtx_);
        pool_.push(std::move(conn));
    }
    cv_.notify_one();
}

}
