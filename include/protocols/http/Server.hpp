#pragma once

#include "protocols/TcpServerBase.hpp"

#include <chrono>
#include <memory>

namespace ql::concurrency {
class ThreadPool;
}

namespace ql::protocols::http {

class Router;

class Server final : public TcpServerBase {
public:
    Server(asio::io_context& ioc, const tcp::endpoint& endpoint,
           std::shared_ptr<const Router> router,
           std::shared_ptr<concurrency::ThreadPool> workers,
           uint64_t bodyLimit,
           std::chrono::steady_clock::duration ioTimeout = std::chrono::seconds(30));

private:
    std::shared_ptr<const Router> router_;
    std::shared_ptr<concurrency::ThreadPool> workers_;
    uint64_t bodyLimit_;
    std::chrono::steady_clock::duration ioTimeout_;

    std::string_view serverName() const noexcept override { return "HttpServer"; }
    void onAccept(tcp::socket socket) override;
};

}
