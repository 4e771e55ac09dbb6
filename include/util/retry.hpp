#pragma once

#include "config/Config.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <string_view>
#include <thread>
#include <type_traits>
#include <spdlog/spdlog.h>

namespace tl::util {

// Sleeps for d. Returns false if the sleep was cut short by a stop request.
using SleepFn = std::function<bool(std::chrono::milliseconds)>;

inline bool blockingSleep(const std::chrono::milliseconds d) {
    std::this_thread::sleep_for(d);
    return true;
}

// Delay before retry number `attempt` (1-based): initial * 2^(attempt-1), capped.
inline std::chrono::milliseconds backoffDelay(const config::RetryConfig& cfg, const unsigned int attempt) {
    uint64_t d = cfg.initial_delay_ms;
    for (unsigned int i = 1; i < attempt && d < cfg.max_delay_ms; ++i) d *= 2;
    return std::chrono::milliseconds(std::min<uint64_t>(d, cfg.max_delay_ms));
}

/**
 * Runs fn, retrying on exceptions of type E with bounded exponential backoff.
 * The last E is rethrown once max_attempts is reached. onInterrupt() is thrown
 * instead if sleep reports a stop request.
 */
template <typename E, typename Fn, typename OnInterrupt>
auto withRetry(const config::RetryConfig& cfg,
               Fn&& fn,
               const SleepFn& sleep,
               OnInterrupt&& onInterrupt,
               const std::shared_ptr<spdlog::logger>& log,
               const std::string_view what) -> std::invoke_result_t<Fn> {
    const unsigned int maxAttempts = std::max(1u, cfg.max_attempts);
    for (unsigned int attempt = 1;; ++attempt) {
        try {
            return fn();
        } catch (const E& e) {
            if (attempt >= maxAttempts) {
                log->warn("[Retry] {} failed after {} attempts: {}", what, attempt, e.what());
                throw;
            }
            const auto delay = backoffDelay(cfg, attempt);
            log->debug("[Retry] {} failed (attempt {}/{}): {}. Retrying in {}ms",
                       what, attempt, maxAttempts, e.what(), delay.count());
            if (!sleep(delay)) onInterrupt();
        }
    }
}

}
