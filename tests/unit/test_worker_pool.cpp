#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <gtest/gtest.h>
#include "runtime/worker_pool.hpp"

namespace {

using vidmcp::runtime::WorkerPool;

TEST(WorkerPoolTest, RunsEverySubmittedJob) {
    WorkerPool pool(4);
    std::atomic<int> counter{0};
    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(pool.submit([&counter]() { ++counter; }));
    }
    pool.wait_idle();
    EXPECT_EQ(counter.load(), 100);
    EXPECT_EQ(pool.pending(), 0u);
}

TEST(WorkerPoolTest, ZeroThreadsMeansOne) {
    WorkerPool pool(0);
    EXPECT_EQ(pool.thread_count(), 1u);
}

TEST(WorkerPoolTest, JobsRunConcurrently) {
    WorkerPool pool(2);
    std::mutex mutex;
    std::condition_variable cv;
    int arrived = 0;

    // Each job waits for the other; a single-threaded pool would deadlock.
    auto rendezvous = [&]() {
        std::unique_lock<std::mutex> lock(mutex);
        ++arrived;
        cv.notify_all();
        cv.wait_for(lock, std::chrono::seconds(5), [&] { return arrived == 2; });
    };
    ASSERT_TRUE(pool.submit(rendezvous));
    ASSERT_TRUE(pool.submit(rendezvous));
    pool.wait_idle();
    EXPECT_EQ(arrived, 2);
}

TEST(WorkerPoolTest, ThrowingJobDoesNotKillWorker) {
    WorkerPool pool(1);
    std::atomic<bool> ran{false};
    ASSERT_TRUE(pool.submit([]() { throw std::runtime_error("job failure"); }));
    ASSERT_TRUE(pool.submit([&ran]() { ran = true; }));
    pool.wait_idle();
    EXPECT_TRUE(ran.load());
}

TEST(WorkerPoolTest, ShutdownDrainsQueueAndRejectsNewJobs) {
    WorkerPool pool(1);
    std::atomic<int> counter{0};
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(pool.submit([&counter]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            ++counter;
        }));
    }
    pool.shutdown();
    EXPECT_EQ(counter.load(), 10);
    EXPECT_FALSE(pool.submit([]() {}));
    pool.shutdown();
}

}  // namespace
