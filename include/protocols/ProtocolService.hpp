#pragma once

#include "concurrency/AsyncService.hpp"
#include "config/Config.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <boost/asio/io_context.hpp>

namespace tl::protocols {

class Dispatcher;
namespace http { class Server; }

// Runs the HTTP server's io_context on the service thread.
class ProtocolService final : public concurrency::AsyncService {
public:
    ProtocolService(config::ServerConfig cfg, std::shared_ptr<Dispatcher> dispatcher);
    ~ProtocolService() override;

    // Bound port, 0 until listening. Differs from the configured one when that is 0.
    [[nodiscard]] uint16_t port() const { return port_.load(); }

    bool waitUntilListening(std::chrono::milliseconds timeout);

protected:
    void runLoop() override;
    void onInterrupt() override;

private:
    config::ServerConfig cfg_;
    std::shared_ptr<Dispatcher> dispatcher_;

    std::mutex iocMutex_;
    std::shared_ptr<boost::asio::io_context> ioContext_;
    std::shared_ptr<http::Server> httpServer_;
    std::atomic<uint16_t> port_{0};
};

}
