#pragma once

#include <future>
#include <functional>
#include <type_traits>

namespace tl::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

// Runs fn on a worker and reports its result, or its exception, through the future.
template <typename T>
struct PromisedTask : Task {
    std::promise<T> promise;
    std::function<T()> fn;

    explicit PromisedTask(std::function<T()> f) : fn(std::move(f)) {}

    std::future<T> getFuture() { return promise.get_future(); }

    void operator()() override {
        try {
            if constexpr (std::is_void_v<T>) {
                fn();
                promise.set_value();
            } else {
                promise.set_value(fn());
            }
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
    }
};

}
