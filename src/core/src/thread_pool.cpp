#include "ncf_thread_pool.hpp"
#include "ncf_logger.hpp"

#include <algorithm>
#include <exception>

namespace ncf {

ThreadPool::ThreadPool(size_t num_threads, size_t max_pending, std::string name)
    : name_(std::move(name))
    , max_pending_(std::max<size_t>(1, max_pending))
{
    const size_t n = std::max<size_t>(1, num_threads);
    workers_.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        workers_.emplace_back(&ThreadPool::worker_loop, this);
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::worker_loop() {
    std::unique_lock<std::mutex> lock(mtx_);
    for (;;) {
        work_cv_.wait(lock, [this] { return stopping_.load() || !jobs_.empty(); });
        if (jobs_.empty()) return;  // stopping and drained

        Job job = std::move(jobs_.front());
        jobs_.pop_front();
        ++active_;

        auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - job.queued_at);
        counters_.longest_wait = std::max(counters_.longest_wait, waited);

        lock.unlock();
        bool ok = true;
        try {
            job.run();
        } catch (const std::exception& e) {
            ok = false;
            NCF_LOG_ERROR(name_, std::string("task failed: ") + e.what());
        }
        lock.lock();

        --active_;
        ++(ok ? counters_.completed : counters_.failed);
        if (jobs_.empty() && active_ == 0) idle_cv_.notify_all();
    }
}

bool ThreadPool::try_post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stopping_.load() || jobs_.size() >= max_pending_) {
            ++counters_.rejected;
            return false;
        }
        jobs_.push_back(Job{std::move(task), std::chrono::steady_clock::now()});
    }
    work_cv_.notify_one();
    return true;
}

bool ThreadPool::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx_);
    return idle_cv_.wait_for(lock, timeout, [this] { return jobs_.empty() && active_ == 0; });
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stopping_.exchange(true)) return;
    }
    work_cv_.notify_all();
    for (auto& w : workers_) {
        if (w.joinable()) w.join();
    }
}

PoolStats ThreadPool::stats() const {
    std::lock_guard<std::mutex> lock(mtx_);
    PoolStats s = counters_;
    s.queued = jobs_.size();
    s.active = active_;
    return s;
}

} // namespace ncf
