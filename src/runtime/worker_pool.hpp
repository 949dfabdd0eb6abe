#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace vidmcp::runtime {

// Fixed set of worker threads draining a FIFO of jobs. Blocking work such as
// downloads runs here so the server loop keeps reading the channel.
class WorkerPool {
public:
    using Job = std::function<void()>;

    explicit WorkerPool(std::size_t thread_count);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // False once shutdown has started.
    bool submit(Job job);

    // Blocks until the queue is empty and no job is running.
    void wait_idle();

    // Runs every queued job, then joins the threads. Idempotent.
    void shutdown();

    std::size_t thread_count() const;
    std::size_t pending() const;

private:
    void worker_loop();

    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<Job> queue_;
    std::vector<std::thread> workers_;
    std::size_t active_ = 0;
    bool stop_requested_ = false;
};

}  // namespace vidmcp::runtime
