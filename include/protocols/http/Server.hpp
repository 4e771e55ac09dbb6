#pragma once

#include "protocols/TcpServerBase.hpp"

#include <memory>

namespace tl::protocols { class Dispatcher; }

namespace tl::protocols::http {

namespace net = boost::asio;
using tcp = net::ip::tcp;

class Server final : public TcpServerBase {
public:
    Server(net::io_context& ioc, const tcp::endpoint& endpoint,
           std::shared_ptr<Dispatcher> dispatcher, uint64_t maxBodyBytes);

private:
    std::shared_ptr<Dispatcher> dispatcher_;
    uint64_t maxBodyBytes_;

    std::string_view serverName() const noexcept override { return "HttpServer"; }
    void onAccept(tcp::socket socket) override;
};

}
