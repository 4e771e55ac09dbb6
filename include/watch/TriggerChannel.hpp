#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <cstdint>
#include <string_view>

namespace tl::watch {

enum class TriggerSource {
    Filesystem,
    Timer,
    Manual
};

std::string_view to_string(TriggerSource s);

/**
 * Single-slot channel. Posting into a full slot coalesces with the trigger
 * already waiting, so a burst of events costs one cycle.
 */
class TriggerChannel {
public:
    void post(TriggerSource source);

    // Waits up to d for a trigger and takes it. nullopt on timeout or once closed.
    std::optional<TriggerSource> waitFor(std::chrono::milliseconds d);

    // Takes the waiting trigger without blocking.
    std::optional<TriggerSource> take();

    [[nodiscard]] bool hasPending() const;

    // Wakes every waiter; posts after close are dropped.
    void close();
    void reopen();

    [[nodiscard]] uint64_t posted() const;
    [[nodiscard]] uint64_t coalesced() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<TriggerSource> slot_;
    bool closed_ = false;
    uint64_t posted_{0};
    uint64_t coalesced_{0};
};

}
