#include "protocols/http/Session.hpp"
#include "concurrency/ThreadPool.hpp"
#include "logging/LogRegistry.hpp"

using namespace ql::protocols::http;
using namespace ql::logging;

Session::Session(tcp::socket socket, std::shared_ptr<const Router> router,
                 std::shared_ptr<concurrency::ThreadPool> workers, const uint64_t bodyLimit,
                 const std::chrono::steady_clock::duration ioTimeout)
    : stream_(std::move(socket)), router_(std::move(router)), workers_(std::move(workers)),
      bodyLimit_(bodyLimit), ioTimeout_(ioTimeout) {
    buffer_.max_size(bodyLimit_ + 8192);
}

void Session::run() {
    boost::asio::dispatch(stream_.get_executor(), [self = shared_from_this()] { self->do_read(); });
}

void Session::do_read() {
    parser_.emplace();
    parser_->body_limit(bodyLimit_);
    stream_.expires_after(ioTimeout_);

    auto self = shared_from_this();
    bhttp::async_read(stream_, buffer_, *parser_,
                      [self](const beast::error_code ec, const std::size_t bytes) {
                          self->on_read(ec, bytes);
                      });
}

void Session::on_read(const beast::error_code ec, const std::size_t bytes) {
    if (ec == bhttp::error::end_of_stream || ec == beast::error::timeout) return do_close();

    if (ec == bhttp::error::body_limit) {
        LogRegistry::http()->warn("[Session] Request body over {} bytes rejected", bodyLimit_);
        request req;
        req.version(11);
        auto res = Router::makeErrorResponse(req, "payload_too_large", "Request body too large",
                                             status::payload_too_large);
        res.keep_alive(false);
        return send(std::move(res));
    }

    if (ec) {
        LogRegistry::http()->debug("[Session] Read error: {}", ec.message());
        return do_close();
    }

    auto req = std::make_shared<request>(parser_->release());
    LogRegistry::http()->debug("[Session] Read {} bytes: {}", bytes,
                               std::string(req->target().data(), req->target().size()));

    auto self = shared_from_this();
    auto task = std::make_shared<concurrency::FunctionTask>([self, req] {
        auto res = self->router_->route(*req);
        boost::asio::post(self->stream_.get_executor(), [self, res = std::move(res)]() mutable {
            self->send(std::move(res));
        });
    }, "http-route");

    if (!workers_->submit(task)) {
        LogRegistry::http()->warn("[Session] Worker pool stopped, dropping connection");
        do_close();
    }
}

void Session::send(string_response res) {
    const bool close = res.need_eof();
    auto msg = std::make_shared<string_response>(std::move(res));

    // The read deadline also covers the time spent routing; the write gets its own.
    stream_.expires_after(ioTimeout_);

    auto self = shared_from_this();
    bhttp::async_write(stream_, *msg,
                       [self, msg, close](const beast::error_code ec, const std::size_t bytes) {
                           self->on_write(close, ec, bytes);
                       });
}

void Session::on_write(const bool close, const beast::error_code ec, const std::size_t bytes) {
    (void)bytes;

    if (ec) {
        LogRegistry::http()->debug("[Session] Write error: {}", ec.message());
        return do_close();
    }

    if (close) return do_close();

    do_read();
}

void Session::do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    if (ec && ec != beast::errc::not_connected)
        LogRegistry::http()->debug("[Session] Shutdown: {}", ec.message());
}
