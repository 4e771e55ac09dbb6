#pragma once

#include "concurrency/AsyncService.hpp"
#include "watch/TriggerChannel.hpp"
#include "watch/ChangeSource.hpp"
#include "sync/CycleReport.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace tl::watch {

// Runs one sync cycle. The flag is raised when the watcher is stopping.
using CycleFn = std::function<sync::CycleReport(const std::atomic<bool>& interrupt)>;

enum class WatchState {
    Idle,
    Debouncing,
    CycleRunning
};

std::string_view to_string(WatchState s);

struct WatcherOptions {
    std::chrono::milliseconds debounce{500};
    std::chrono::milliseconds maxDebounce{5000};                    // longest a trigger waits for quiet
    std::chrono::milliseconds interval{std::chrono::minutes(5)};    // zero => no periodic trigger
    bool runOnStart = true;
};

/**
 * Drives sync cycles for one project.
 *
 * Idle until a trigger arrives, then waits for a quiet period of `debounce`
 * (each new trigger restarts it, up to `maxDebounce` in total) and runs the
 * cycle. Triggers that arrive while a cycle runs are kept in the channel and
 * start the next cycle as soon as the current one returns. Cycles never overlap.
 */
class Watcher : public concurrency::AsyncService {
public:
    Watcher(std::string projectId, WatcherOptions opts, CycleFn cycle, std::unique_ptr<ChangeSource> source = nullptr);
    ~Watcher() override;

    void start() override;
    void stop() override;

    void trigger(TriggerSource source = TriggerSource::Manual);

    [[nodiscard]] WatchState state() const { return state_.load(); }
    [[nodiscard]] bool pending() const { return state() == WatchState::CycleRunning && channel_.hasPending(); }

    [[nodiscard]] const std::string& projectId() const { return projectId_; }
    [[nodiscard]] uint64_t cyclesRun() const { return cyclesRun_.load(); }
    [[nodiscard]] std::optional<sync::CycleReport> lastReport() const;
    [[nodiscard]] const TriggerChannel& channel() const { return channel_; }

protected:
    void runLoop() override;
    void onInterrupt() override;

private:
    std::string projectId_;
    WatcherOptions opts_;
    CycleFn cycle_;
    std::unique_ptr<ChangeSource> source_;
    TriggerChannel channel_;

    std::atomic<WatchState> state_{WatchState::Idle};
    std::atomic<uint64_t> cyclesRun_{0};

    mutable std::mutex reportMutex_;
    std::optional<sync::CycleReport> lastReport_;

    bool debounce();
    void runCycle(TriggerSource why);
};

}
