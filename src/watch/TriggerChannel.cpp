#include "watch/TriggerChannel.hpp"

#include <utility>

using namespace tl::watch;

std::string_view tl::watch::to_string(const TriggerSource s) {
    switch (s) {
        case TriggerSource::Filesystem: return "filesystem";
        case TriggerSource::Timer: return "timer";
        case TriggerSource::Manual: return "manual";
    }
    return "unknown";
}

void TriggerChannel::post(const TriggerSource source) {
    {
        std::scoped_lock lock(mutex_);
        if (closed_) return;
        ++posted_;
        if (slot_) ++coalesced_;
        else slot_ = source;
    }
    cv_.notify_all();
}

std::optional<TriggerSource> TriggerChannel::waitFor(const std::chrono::milliseconds d) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, d, [this] { return slot_.has_value() || closed_; });
    if (closed_) return std::nullopt;
    return std::exchange(slot_, std::nullopt);
}

std::optional<TriggerSource> TriggerChannel::take() {
    std::scoped_lock lock(mutex_);
    return std::exchange(slot_, std::nullopt);
}

bool TriggerChannel::hasPending() const {
    std::scoped_lock lock(mutex_);
    return slot_.has_value();
}

void TriggerChannel::close() {
    {
        std::scoped_lock lock(mutex_);
        closed_ = true;
        slot_.reset();
    }
    cv_.notify_all();
}

void TriggerChannel::reopen() {
    std::scoped_lock lock(mutex_);
    closed_ = false;
}

uint64_t TriggerChannel::posted() const {
    std::scoped_lock lock(mutex_);
    return posted_;
}

uint64_t TriggerChannel::coalesced() const {
    std::scoped_lock lock(mutex_);
    return coalesced_;
}
