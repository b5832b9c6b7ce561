#pragma once

#include "database/DBConnection.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace ql::database {

class DBPool {
public:
    DBPool(const std::string& connStr, size_t size = 4);

    // Blocks until a connection is free. Broken sessions are reopened before being handed out.
    std::unique_ptr<DBConnection> acquire();

    void release(std::unique_ptr<DBConnection> conn);

    [[nodiscard]] size_t size() const { return size_; }

private:
    std::queue<std::unique_ptr<DBConnection>> pool_;
    std::mutex mtx_;
    std::condition_variable cv_;
    size_t size_;
};

}
