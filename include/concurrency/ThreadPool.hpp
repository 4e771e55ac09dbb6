#pragma once

#include "concurrency/Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace tl::concurrency {

class ThreadPool {
public:
    // nThreads == 0 => hardware concurrency
    explicit ThreadPool(unsigned int nThreads = 0);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void stop();

    void submit(std::shared_ptr<Task> task);

    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<F>> {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<PromisedTask<R>>(std::forward<F>(fn));
        auto fut = task->getFuture();
        submit(std::static_pointer_cast<Task>(task));
        return fut;
    }

    [[nodiscard]] size_t queueDepth() const;

    [[nodiscard]] unsigned int workerCount() const;

private:
    void spawnWorker();

    std::vector<std::thread> threads_;

    std::condition_variable cv;
    mutable std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;

    std::atomic<bool> stopFlag{false};
};

} // namespace tl::concurrency
