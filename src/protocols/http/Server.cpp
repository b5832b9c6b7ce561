#include "protocols/http/Server.hpp"
#include "protocols/http/Session.hpp"

using namespace ql::protocols::http;

Server::Server(asio::io_context& ioc, const tcp::endpoint& endpoint,
               std::shared_ptr<const Router> router,
               std::shared_ptr<concurrency::ThreadPool> workers,
               const uint64_t bodyLimit,
               const std::chrono::steady_clock::duration ioTimeout)
    : TcpServerBase(ioc, endpoint, protocols::TcpServerOptions{
          .acceptConcurrency = 1,
          .useStrand = true,
          .channel = protocols::LogChannel::Http
      }),
      router_(std::move(router)),
      workers_(std::move(workers)),
      bodyLimit_(bodyLimit),
      ioTimeout_(ioTimeout) {}

void Server::onAccept(tcp::socket socket) {
    std::make_shared<Session>(std::move(socket), router_, workers_, bodyLimit_, ioTimeout_)->run();
}
