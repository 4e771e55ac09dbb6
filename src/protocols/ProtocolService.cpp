#include "protocols/ProtocolService.hpp"
#include "protocols/http/Server.hpp"
#include "log/Registry.hpp"

#include <thread>

using namespace tl::protocols;

ProtocolService::ProtocolService(config::ServerConfig cfg, std::shared_ptr<Dispatcher> dispatcher)
    : AsyncService("ProtocolService"), cfg_(std::move(cfg)), dispatcher_(std::move(dispatcher)) {}

ProtocolService::~ProtocolService() { stop(); }

void ProtocolService::runLoop() {
    {
        std::scoped_lock lock(iocMutex_);
        if (shouldStop()) return;
        ioContext_ = std::make_shared<boost::asio::io_context>();

        const auto endpoint = tcp::endpoint(asio::ip::make_address(cfg_.host), cfg_.port);
        httpServer_ = std::make_shared<http::Server>(*ioContext_, endpoint, dispatcher_, cfg_.max_body_bytes);
        httpServer_->run();
        port_.store(httpServer_->localEndpoint().port());
    }

    while (!shouldStop()) {
        ioContext_->run();
        ioContext_->restart();
    }

    std::scoped_lock lock(iocMutex_);
    httpServer_.reset();
    port_.store(0);
    log::Registry::treeline()->info("[ProtocolService] HTTP server stopped");
}

void ProtocolService::onInterrupt() {
    std::scoped_lock lock(iocMutex_);
    if (httpServer_) httpServer_->close();
    if (ioContext_) ioContext_->stop();
}

bool ProtocolService::waitUntilListening(const std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (port() == 0) {
        if (!isRunning() || std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}
