#pragma once

#include <memory>
#include <string>
#include <pqxx/connection>

namespace ql::database {

class DBConnection {
public:
    explicit DBConnection(std::string connStr);
    ~DBConnection();

    [[nodiscard]] pqxx::connection& get() const;

    [[nodiscard]] bool isOpen() const;

    // Drops the current session (if any) and opens a fresh one with statements prepared.
    void reconnect();

    void initPrepared() const;

private:
    std::string connStr_;
    std::unique_ptr<pqxx::connection> conn_;

    void initPreparedLinks() const;
};

}
