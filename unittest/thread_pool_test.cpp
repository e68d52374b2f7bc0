// ============================================================================
// THREAD POOL UNIT TESTS
// ============================================================================

#include <gtest/gtest.h>
#include <eventrelay/core/utils/thread_pool.hpp>
#include <atomic>
#include <stdexcept>
#include <vector>

using namespace EventRelay;

TEST(ThreadPool, RunsTasksAndReturnsResults) {
    ThreadPool pool(3);
    std::vector<std::future<int>> results;
    for (int i = 0; i < 10; ++i) {
        results.push_back(pool.submit([i] { return i * i; }));
    }
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(results[i].get(), i * i);
    }
}

TEST(ThreadPool, PropagatesTaskExceptionsThroughFuture) {
    ThreadPool pool(1);
    auto f = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(f.get(), std::runtime_error);
}

TEST(ThreadPool, ShutdownRunsQueuedTasks) {
    std::atomic<int> ran{0};
    {
        ThreadPool pool(1);
        for (int i = 0; i < 20; ++i) {
            pool.submit([&ran] { ran.fetch_add(1); });
        }
        pool.shutdown();
    }
    EXPECT_EQ(ran.load(), 20);
}

TEST(ThreadPool, SubmitAfterShutdownThrows) {
    ThreadPool pool(1);
    pool.shutdown();
    EXPECT_THROW(pool.submit([] {}), std::runtime_error);
}

TEST(ThreadPool, RejectsZeroThreads) {
    EXPECT_THROW(ThreadPool(0), std::invalid_argument);
}
