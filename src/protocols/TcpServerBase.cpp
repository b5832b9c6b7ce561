#include "protocols/TcpServerBase.hpp"
#include "logging/LogRegistry.hpp"

namespace ql::protocols {

TcpServerBase::TcpServerBase(asio::io_context& ioc,
                             const tcp::endpoint& endpoint,
                             const TcpServerOptions opts)
    : ioc_(ioc), acceptor_(ioc), opts_(opts) { init_acceptor(acceptor_, endpoint); }

void TcpServerBase::run() {
    logStart();

    const auto n = (opts_.acceptConcurrency == 0) ? 1u : opts_.acceptConcurrency;
    for (unsigned int i = 0; i < n; ++i) doAccept();
}

void TcpServerBase::stop() {
    if (stopped_.exchange(true)) return;
    auto self = shared_from_this();
    asio::post(acceptor_.get_executor(), [self] {
        beast::error_code ec;
        self->acceptor_.close(ec);
        if (ec) self->logger()->debug("[{}] acceptor close: {}", self->serverName(), ec.message());
    });
}

void TcpServerBase::onAcceptError(const beast::error_code& ec) {
    logger()->debug("[{}] accept error: {}", serverName(), ec.message());
}

std::shared_ptr<spdlog::logger> TcpServerBase::logger() const {
    using logging::LogRegistry;
    switch (opts_.channel) {
    case LogChannel::Http:      return LogRegistry::http();
    case LogChannel::General:
    default: return LogRegistry::quicklink();
    }
}

void TcpServerBase::logStart() const {
    logging::LogRegistry::quicklink()->info("[{}] Listening on {}", serverName(), endpointToString(acceptor_));
}

void TcpServerBase::doAccept() {
    auto self = shared_from_this();

    auto handler = [self](const beast::error_code& ec, tcp::socket socket) mutable {
        if (ec == asio::error::operation_aborted || self->stopped_.load()) return; // shutting down

        self->doAccept(); // re-arm ASAP

        if (ec) {
            self->onAcceptError(ec);
            return;
        }

        self->onAccept(std::move(socket));
    };

    if (opts_.useStrand) acceptor_.async_accept(asio::make_strand(ioc_), std::move(handler));
    else acceptor_.async_accept(std::move(handler));
}

}
