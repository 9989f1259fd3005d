#include "core/WorkerPool.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>

using namespace newsfeed::core;

TEST(WorkerPoolTest, ReturnsTaskResults) {
    WorkerPool pool(3);
    EXPECT_EQ(pool.size(), 3u);

    std::vector<std::future<int>> results;
    for (int i = 0; i < 20; ++i) {
        results.push_back(pool.submit([i]() { return i * i; }));
    }
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(results[i].get(), i * i);
    }
}

TEST(WorkerPoolTest, DeliversExceptionsThroughFuture) {
    WorkerPool pool(2);
    auto failing = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    auto fine = pool.submit([]() { return 7; });

    EXPECT_THROW(failing.get(), std::runtime_error);
    EXPECT_EQ(fine.get(), 7);
}

TEST(WorkerPoolTest, NeverRunsMoreTasksThanWorkers) {
    WorkerPool pool(2);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    std::vector<std::future<void>> jobs;
    for (int i = 0; i < 12; ++i) {
        jobs.push_back(pool.submit([&running, &peak]() {
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            --running;
        }));
    }
    for (auto& job : jobs) {
        job.get();
    }

    EXPECT_LE(peak.load(), 2);
    EXPECT_GE(peak.load(), 1);
}

TEST(WorkerPoolTest, DestructorFinishesQueuedTasks) {
    std::atomic<int> completed{0};
    {
        WorkerPool pool(1);
        for (int i = 0; i < 10; ++i) {
            pool.submit([&completed]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                ++completed;
            });
        }
    }
    EXPECT_EQ(completed.load(), 10);
}

TEST(WorkerPoolTest, ZeroWorkersStillRuns) {
    WorkerPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool.submit([]() { return 1; }).get(), 1);
}
