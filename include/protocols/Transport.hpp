#pragma once

#include <atomic>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace tl::protocols {

// Carries one wire operation and returns its JSON response.
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * body null => read-only op (GET over HTTP).
     * Throws TransientNetworkError on connection failure, timeout or a retryable
     * server status, CancelledError if the interrupt flag is raised mid-call,
     * and the typed error named by the server for rejected requests.
     */
    virtual nlohmann::json call(std::string_view op, const nlohmann::json& body) = 0;

    // Polled during calls; raising it aborts the in-flight request.
    void setInterruptFlag(const std::atomic<bool>* flag) { interrupt_ = flag; }

protected:
    const std::atomic<bool>* interrupt_ = nullptr;

    [[nodiscard]] bool interrupted() const { return interrupt_ && interrupt_->load(); }
};

// Rethrows the typed error named by kind, as reported by the remote side.
[[noreturn]] void rethrowRemoteError(std::string_view kind, const std::string& message, long status);

}
