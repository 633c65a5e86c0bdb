/**
 * @file test_thread_pool.cpp
 * @brief Unit tests for ThreadPool.
 */

#include "executor/thread_pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <latch>
#include <stdexcept>

using namespace agent_dispatch;

TEST(ThreadPoolTest, BasicSubmit) {
    ThreadPool pool(2);
    auto future = pool.submit([] { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST(ThreadPoolTest, MultipleSubmissions) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;

    for (size_t i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([i] { return static_cast<int>(i * i); }));
    }

    for (size_t i = 0; i < 100; ++i) {
        EXPECT_EQ(futures[i].get(), static_cast<int>(i * i));
    }
}

TEST(ThreadPoolTest, ExceptionReachesFuture) {
    ThreadPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, PostRunsJob) {
    ThreadPool pool(2);
    std::latch done(3);
    for (int i = 0; i < 3; ++i) {
        pool.post([&done] { done.count_down(); });
    }
    done.wait();
    SUCCEED();
}

TEST(ThreadPoolTest, ThreadCount) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.thread_count(), 3u);
}

TEST(ThreadPoolTest, ShutdownStopsAccepting) {
    ThreadPool pool(2);
    pool.shutdown();
    EXPECT_FALSE(pool.accepting());
    EXPECT_EQ(pool.thread_count(), 0u);

    std::atomic<bool> ran{false};
    pool.post([&ran] { ran = true; });
    EXPECT_EQ(pool.queued_count(), 0u);
    EXPECT_FALSE(ran.load());
}
