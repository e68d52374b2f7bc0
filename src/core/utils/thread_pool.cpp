#include <eventrelay/core/utils/thread_pool.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace EventRelay {

ThreadPool::ThreadPool(size_t numThreads) : isRunning(true) {
    if (numThreads == 0) {
        throw std::invalid_argument("ThreadPool requires at least one thread");
    }
    workers.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        workers.emplace_back(&ThreadPool::workerLoop, this);
    }
    spdlog::debug("[ThreadPool] Started with {} threads", numThreads);
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        if (!isRunning.load(std::memory_order_acquire)) {
            throw std::runtime_error("ThreadPool is shut down");
        }
        tasks.push(std::move(task));
    }
    condition.notify_one();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        if (!isRunning.load(std::memory_order_acquire) && workers.empty()) {
            return;
        }
        isRunning.store(false, std::memory_order_release);
    }
    condition.notify_all();
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers.clear();
}

// Queued tasks are still run after shutdown() so no future is left unsatisfied.
void ThreadPool::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queueMutex);
            condition.wait(lock, [this] {
                return !isRunning.load(std::memory_order_acquire) || !tasks.empty();
            });
            if (tasks.empty()) {
                return;
            }
            task = std::move(tasks.front());
            tasks.pop();
        }
        task();
    }
}

} // namespace EventRelay
