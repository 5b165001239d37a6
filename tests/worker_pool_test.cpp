#include <gtest/gtest.h>
#include "anomaly_scan/worker_pool.h"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace anomaly_scan;

TEST(WorkerPoolTest, ReturnsResultsThroughFutures)
{
    WorkerPool pool(4);
    EXPECT_EQ(pool.size(), 4u);

    std::vector<std::future<int>> futures;
    for (int i = 0; i < 50; ++i)
        futures.push_back(pool.submit([i]() { return i * i; }));

    for (int i = 0; i < 50; ++i)
        EXPECT_EQ(futures[i].get(), i * i);
}

TEST(WorkerPoolTest, ZeroThreadsStillRunsTasks)
{
    WorkerPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool.submit([]() { return 7; }).get(), 7);
}

TEST(WorkerPoolTest, ExceptionTravelsToFuture)
{
    WorkerPool pool(2);
    auto fut = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(fut.get(), std::runtime_error);

    // pool keeps working after a failed task
    EXPECT_EQ(pool.submit([]() { return 1; }).get(), 1);
}

TEST(WorkerPoolTest, DestructorDrainsQueuedTasks)
{
    std::atomic<int> done{0};
    {
        WorkerPool pool(2);
        for (int i = 0; i < 20; ++i)
        {
            pool.submit([&done]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                ++done;
            });
        }
    }
    EXPECT_EQ(done.load(), 20);
}

TEST(WorkerPoolTest, RunsTasksInParallel)
{
    WorkerPool pool(4);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 8; ++i)
    {
        futures.push_back(pool.submit([&]() {
            int now = ++running;
            int prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            --running;
        }));
    }
    for (auto &f : futures)
        f.get();

    EXPECT_GT(peak.load(), 1);
    EXPECT_LE(peak.load(), 4);
}
