#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ncf {

struct PoolStats {
    size_t queued = 0;
    size_t active = 0;
    uint64_t completed = 0;
    uint64_t failed = 0;        // task threw
    uint64_t rejected = 0;      // try_post() refused
    std::chrono::milliseconds longest_wait{0};
};

/**
 * @brief Fixed worker pool with a bounded queue
 *
 * try_post() refuses work once max_pending jobs are waiting, so a burst of
 * connections cannot grow memory without limit. A job that throws is
 * logged under the pool's name and counted; the worker keeps running.
 */
class ThreadPool {
public:
    ThreadPool(size_t num_threads, size_t max_pending, std::string name = "pool");
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Enqueue task; false when the queue is full or the pool is stopping.
    bool try_post(std::function<void()> task);

    /// Wait until nothing is queued or running; false on timeout.
    bool wait_idle(std::chrono::milliseconds timeout);

    /// Run what is already queued, then join the workers. Idempotent.
    void shutdown();

    PoolStats stats() const;
    size_t total_threads() const noexcept { return workers_.size(); }
    bool is_running() const noexcept { return !stopping_.load(); }

private:
    struct Job {
        std::function<void()> run;
        std::chrono::steady_clock::time_point queued_at;
    };

    void worker_loop();

    const std::string name_;
    const size_t max_pending_;

    mutable std::mutex mtx_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<Job> jobs_;
    size_t active_ = 0;
    PoolStats counters_;
    std::atomic<bool> stopping_{false};

    std::vector<std::thread> workers_;
};

} // namespace ncf
