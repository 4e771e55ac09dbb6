#include "protocols/http/Server.hpp"
#include "protocols/http/Session.hpp"

using namespace tl::protocols::http;

Server::Server(net::io_context& ioc, const tcp::endpoint& endpoint,
               std::shared_ptr<Dispatcher> dispatcher, const uint64_t maxBodyBytes)
    : TcpServerBase(ioc, endpoint, protocols::TcpServerOptions{
          .acceptConcurrency = 1,
          .useStrand = true
      }),
      dispatcher_(std::move(dispatcher)),
      maxBodyBytes_(maxBodyBytes) {}

void Server::onAccept(tcp::socket socket) {
    std::make_shared<Session>(std::move(socket), dispatcher_, maxBodyBytes_)->run();
}
