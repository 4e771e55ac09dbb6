#include "watch/Watcher.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <stdexcept>

using namespace tl::watch;
using namespace std::chrono;

std::string_view tl::watch::to_string(const WatchState s) {
    switch (s) {
        case WatchState::Idle: return "idle";
        case WatchState::Debouncing: return "debouncing";
        case WatchState::CycleRunning: return "cycle-running";
    }
    return "unknown";
}

Watcher::Watcher(std::string projectId, WatcherOptions opts, CycleFn cycle, std::unique_ptr<ChangeSource> source)
    : AsyncService("Watcher:" + projectId),
      projectId_(std::move(projectId)),
      opts_(opts),
      cycle_(std::move(cycle)),
      source_(std::move(source)) {
    if (!cycle_) throw std::invalid_argument("Watcher requires a cycle function");
}

Watcher::~Watcher() {
    stop();
}

void Watcher::start() {
    if (isRunning()) return;

    channel_.reopen();
    if (opts_.runOnStart) channel_.post(TriggerSource::Manual);

    if (source_) {
        try {
            source_->start([this] { trigger(TriggerSource::Filesystem); });
        } catch (const std::exception& e) {
            log::Registry::watch()->warn("[Watcher] {}: filesystem events unavailable, relying on the timer: {}",
                                         projectId_, e.what());
        }
    }

    AsyncService::start();
}

void Watcher::stop() {
    if (source_) source_->stop();
    AsyncService::stop();
}

void Watcher::onInterrupt() {
    channel_.close();
}

void Watcher::trigger(const TriggerSource source) {
    log::Registry::watch()->trace("[Watcher] {}: {} trigger", projectId_, to_string(source));
    channel_.post(source);
}

std::optional<tl::sync::CycleReport> Watcher::lastReport() const {
    std::scoped_lock lock(reportMutex_);
    return lastReport_;
}

void Watcher::runLoop() {
    auto nextTimer = steady_clock::now() + opts_.interval;

    while (!shouldStop()) {
        auto wait = milliseconds(1000);
        if (opts_.interval.count() > 0)
            wait = std::max(milliseconds(0), duration_cast<milliseconds>(nextTimer - steady_clock::now()));

        auto why = channel_.waitFor(wait);
        if (shouldStop()) break;

        if (!why) {
            if (opts_.interval.count() == 0 || steady_clock::now() < nextTimer) continue;
            why = TriggerSource::Timer;
        }

        if (!debounce()) break;

        runCycle(*why);
        nextTimer = steady_clock::now() + opts_.interval;

        // triggers that landed during the cycle start the next one straight away
        while (!shouldStop()) {
            const auto rerun = channel_.take();
            if (!rerun) break;
            log::Registry::watch()->debug("[Watcher] {}: rerunning for trigger received mid-cycle", projectId_);
            runCycle(*rerun);
            nextTimer = steady_clock::now() + opts_.interval;
        }
    }

    state_.store(WatchState::Idle);
}

bool Watcher::debounce() {
    state_.store(WatchState::Debouncing);
    const auto deadline = steady_clock::now() + std::max(opts_.maxDebounce, opts_.debounce);

    while (true) {
        const auto left = duration_cast<milliseconds>(deadline - steady_clock::now());
        if (left <= milliseconds(0)) {
            log::Registry::watch()->debug("[Watcher] {}: triggers kept arriving, running after {}ms",
                                          projectId_, opts_.maxDebounce.count());
            break;
        }
        if (!channel_.waitFor(std::min(opts_.debounce, left))) break;
        if (shouldStop()) return false;
    }
    return !shouldStop();
}

void Watcher::runCycle(const TriggerSource why) {
    state_.store(WatchState::CycleRunning);
    log::Registry::watch()->debug("[Watcher] {}: cycle started ({})", projectId_, to_string(why));

    try {
        auto report = cycle_(interruptFlag_);
        std::scoped_lock lock(reportMutex_);
        lastReport_ = std::move(report);
    } catch (const std::exception& e) {
        log::Registry::watch()->error("[Watcher] {}: cycle failed: {}", projectId_, e.what());
    }

    ++cyclesRun_;
    state_.store(WatchState::Idle);
}
