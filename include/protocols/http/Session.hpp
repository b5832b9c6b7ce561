#pragma once

#include "protocols/http/Router.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <memory>
#include <optional>

namespace ql::concurrency {
class ThreadPool;
}

namespace ql::protocols::http {

namespace beast = boost::beast;
namespace bhttp = beast::http;
using tcp = boost::asio::ip::tcp;

// One keep-alive connection. Reads and writes run on the socket's strand; routing runs on the worker pool.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket socket, std::shared_ptr<const Router> router,
            std::shared_ptr<concurrency::ThreadPool> workers, uint64_t bodyLimit,
            std::chrono::steady_clock::duration ioTimeout);

    void run();

private:
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes);
    void send(string_response res);
    void on_write(bool close, beast::error_code ec, std::size_t bytes);
    void do_close();

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<bhttp::request_parser<bhttp::string_body>> parser_;
    std::shared_ptr<const Router> router_;
    std::shared_ptr<concurrency::ThreadPool> workers_;
    uint64_t bodyLimit_;
    std::chrono::steady_clock::duration ioTimeout_; // per read, and per write
};

}
