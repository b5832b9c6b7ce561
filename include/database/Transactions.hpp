#pragma once

#include "database/DBPool.hpp"
#include "logging/LogRegistry.hpp"

#include <memory>
#include <pqxx/pqxx>
#include <string>
#include <type_traits>
#include <utility>

namespace ql::database {

class Transactions {
public:
    explicit Transactions(std::shared_ptr<DBPool> pool) : dbPool_(std::move(pool)) {
        if (!dbPool_) throw std::invalid_argument("Transactions requires a DBPool");
    }

    // Runs `func` inside a pqxx::work on a pooled connection; commits on return, rolls back on throw.
    template <typename Func>
    auto exec(const std::string& ctx, Func&& func) const -> decltype(func(std::declval<pqxx::work&>())) {
        logging::LogRegistry::db()->trace("[Transactions::exec] Starting transaction: {}", ctx);
        auto conn = dbPool_->acquire();

        try {
            if constexpr (std::is_void_v<decltype(func(std::declval<pqxx::work&>()))>) {
                {
                    pqxx::work txn(conn->get());
                    func(txn);
                    txn.commit();
                }
                logging::LogRegistry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                dbPool_->release(std::move(conn));
            } else {
                auto result = [&] {
                    pqxx::work txn(conn->get());
                    auto r = func(txn);
                    txn.commit();
                    return r;
                }();
                logging::LogRegistry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                dbPool_->release(std::move(conn));
                return result;
            }
        } catch (const std::exception& e) {
            logging::LogRegistry::db()->error("[Transactions::exec] Exception in transaction context '{}', rolling back: {}",
                                              ctx, e.what());
            if (conn) dbPool_->release(std::move(conn));
            throw;
        }
    }

private:
    std::shared_ptr<DBPool> dbPool_;
};

}
