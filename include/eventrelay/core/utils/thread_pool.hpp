#pragma once
#include <vector>
#include <thread>
#include <atomic>
#include <queue>
#include <functional>
#include <condition_variable>
#include <mutex>
#include <future>
#include <memory>
#include <type_traits>

namespace EventRelay {

/**
 * @brief Fixed-size pool running stream workers and their coordinating task.
 *
 * A client sizes its pool to numStreams + 1: one slot per worker plus one for
 * the task that distributes events and joins the workers.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t numThreads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> result = task->get_future();
        enqueue([task]() { (*task)(); });
        return result;
    }

    size_t size() const { return workers.size(); }
    void shutdown();

private:
    void enqueue(std::function<void()> task);
    void workerLoop();

    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    std::mutex queueMutex;
    std::condition_variable condition;
    std::atomic<bool> isRunning;
};

} // namespace EventRelay
