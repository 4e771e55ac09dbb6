#include "protocols/TcpServerBase.hpp"
#include "log/Registry.hpp"

#include <boost/system/system_error.hpp>
#include <fmt/format.h>
#include <utility>

namespace tl::protocols {

static std::string describe(const tcp::endpoint& ep) {
    return fmt::format("{}:{}", ep.address().to_string(), ep.port());
}

static void listenOn(tcp::acceptor& acceptor, const tcp::endpoint& endpoint) {
    const auto fail = [&](const boost::system::error_code& ec, const std::string_view step) {
        log::Registry::http()->error("[TcpServerBase] Cannot {} {}: {}", step, describe(endpoint), ec.message());
        throw boost::system::system_error(ec, fmt::format("Cannot {} {}", step, describe(endpoint)));
    };

    boost::system::error_code ec;
    if (acceptor.open(endpoint.protocol(), ec); ec) fail(ec, "open a socket for");
    if (acceptor.set_option(asio::socket_base::reuse_address(true), ec); ec) fail(ec, "set reuse_address on");
    if (acceptor.bind(endpoint, ec); ec) fail(ec, "bind");
    if (acceptor.listen(asio::socket_base::max_listen_connections, ec); ec) fail(ec, "listen on");
}

TcpServerBase::TcpServerBase(asio::io_context& ioc,
                             const tcp::endpoint& endpoint,
                             const TcpServerOptions opts)
    : ioc_(ioc), acceptor_(ioc), opts_(opts) { listenOn(acceptor_, endpoint); }

void TcpServerBase::run() {
    logStart();

    const auto n = (opts_.acceptConcurrency == 0) ? 1u : opts_.acceptConcurrency;
    for (unsigned int i = 0; i < n; ++i) doAccept();
}

void TcpServerBase::close() {
    beast::error_code ec;
    acceptor_.close(ec);
    if (ec) logger()->debug("[{}] acceptor close: {}", serverName(), ec.message());
}

void TcpServerBase::onAcceptError(const beast::error_code& ec) {
    logger()->debug("[{}] accept error: {}", serverName(), ec.message());
}

std::shared_ptr<spdlog::logger> TcpServerBase::logger() {
    return log::Registry::http();
}

void TcpServerBase::logStart() const {
    log::Registry::treeline()->info("[{}] Listening on {}", serverName(), describe(acceptor_.local_endpoint()));
}

void TcpServerBase::doAccept() {
    auto self = shared_from_this();

    auto handler = [self](const beast::error_code& ec, tcp::socket socket) mutable {
        if (ec == asio::error::operation_aborted) return; // shutting down
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
