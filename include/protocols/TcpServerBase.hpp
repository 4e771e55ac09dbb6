#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <memory>
#include <string_view>

namespace spdlog { class logger; }

namespace tl::protocols {

namespace asio  = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

struct TcpServerOptions {
    unsigned int acceptConcurrency{1};
    bool useStrand{true};
};

class TcpServerBase : public std::enable_shared_from_this<TcpServerBase> {
public:
    // Binds and listens immediately. Throws boost::system::system_error naming the endpoint on failure.
    TcpServerBase(asio::io_context& ioc, const tcp::endpoint& endpoint, TcpServerOptions opts);
    virtual ~TcpServerBase() = default;

    void run();

    // Closes the acceptor; pending accepts complete with operation_aborted.
    void close();

    [[nodiscard]] tcp::endpoint localEndpoint() const { return acceptor_.local_endpoint(); }

protected:
    virtual std::string_view serverName() const noexcept = 0;
    virtual void onAccept(tcp::socket socket) = 0;

    // Override if a server wants different accept error behavior
    virtual void onAcceptError(const beast::error_code& ec);

    asio::io_context& ioc() const noexcept { return ioc_; }
    tcp::acceptor& acceptor() noexcept { return acceptor_; }

    static std::shared_ptr<spdlog::logger> logger();

private:
    void logStart() const;
    void doAccept();

    asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    TcpServerOptions opts_;
};

}
