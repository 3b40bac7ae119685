#include "core/WorkerPool.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <vector>

using namespace mcpd;
using namespace std::chrono_literals;

TEST(WorkerPoolTest, RunsTasksAndReturnsResults) {
    WorkerPool pool(4, "test");
    EXPECT_EQ(pool.size(), 4);

    std::vector<std::future<int>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(pool.submit([i]() { return i * i; }));
    }
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(futures[i].get(), i * i);
    }
}

TEST(WorkerPoolTest, ExceptionTravelsThroughFuture) {
    WorkerPool pool(1, "test");
    auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(WorkerPoolTest, DroppedFutureDoesNotBlock) {
    WorkerPool pool(1, "test");
    std::atomic<bool> ran{false};
    {
        auto future = pool.submit([&ran]() {
            std::this_thread::sleep_for(50ms);
            ran = true;
        });
        // future destroyed here without waiting
    }
    pool.shutdown();
    EXPECT_TRUE(ran.load());
}

TEST(WorkerPoolTest, SubmitAfterShutdownThrows) {
    WorkerPool pool(2, "test");
    pool.shutdown();
    pool.shutdown();  // idempotent
    EXPECT_THROW(pool.submit([]() { return 1; }), std::runtime_error);
}
