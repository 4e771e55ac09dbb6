#pragma once

#include <atomic>
#include <string>
#include <thread>

namespace tl::concurrency {

class AsyncService {
public:
    explicit AsyncService(const std::string& serviceName);

    virtual ~AsyncService();

    AsyncService(const AsyncService&) = delete;
    AsyncService& operator=(const AsyncService&) = delete;

    virtual void start();

    virtual void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    [[nodiscard]] const std::string& name() const { return serviceName_; }

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    virtual void runLoop() = 0;

    // Called from stop() after the interrupt flag is raised, before join.
    virtual void onInterrupt() {}

    [[nodiscard]] bool shouldStop() const { return interruptFlag_.load(std::memory_order_acquire); }
};

}
