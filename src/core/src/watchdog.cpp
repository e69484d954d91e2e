#include "ncf_watchdog.hpp"
#include "ncf_logger.hpp"

#include <stdexcept>

namespace ncf {

namespace {
constexpr const char* kLog = "watchdog";
}

const char* to_string(WatchdogState state) {
    switch (state) {
        case WatchdogState::Healthy:   return "healthy";
        case WatchdogState::Degraded:  return "degraded";
        case WatchdogState::Escalated: return "escalated";
    }
    return "unknown";
}

Watchdog::Watchdog(WatchdogConfig config, Probe probe, Action restart, Action fallback,
                   Clock clock)
    : config_(config)
    , probe_(std::move(probe))
    , restart_(std::move(restart))
    , fallback_(std::move(fallback))
    , clock_(std::move(clock))
{
    if (!probe_ || !restart_) {
        throw std::invalid_argument("Watchdog: probe and restart are required");
    }
    if (config_.failure_threshold < 1) config_.failure_threshold = 1;
    if (config_.interval.count() < 1) config_.interval = std::chrono::seconds(1);
}

Watchdog::~Watchdog() {
    stop();
}

void Watchdog::prune_window(std::chrono::steady_clock::time_point now) {
    while (!restarts_.empty() && now - restarts_.front() > config_.restart_window) {
        restarts_.pop_front();
    }
}

void Watchdog::tick() {
    bool healthy = false;
    try {
        healthy = probe_();
    } catch (const std::exception& e) {
        NCF_LOG_WARN(kLog, std::string("probe threw: ") + e.what());
    }

    std::unique_lock<std::mutex> lock(mtx_);
    if (healthy) {
        if (consecutive_failures_ > 0) {
            NCF_LOG_INFO(kLog, "interception server healthy again");
        }
        consecutive_failures_ = 0;
        return;
    }

    ++consecutive_failures_;
    NCF_LOG_WARN(kLog, "health probe failed (" + std::to_string(consecutive_failures_) + "/" +
                       std::to_string(config_.failure_threshold) + ")");
    if (consecutive_failures_ < config_.failure_threshold || escalated_) return;

    auto now = clock_();
    prune_window(now);
    if (static_cast<int>(restarts_.size()) >= config_.max_restarts) {
        escalated_ = true;
        NCF_LOG_CRITICAL(kLog, "interception server failed " +
                               std::to_string(restarts_.size()) + " restarts within " +
                               std::to_string(config_.restart_window.count()) +
                               "s, giving up");
        if (config_.fallback_enabled && fallback_) {
            lock.unlock();
            try {
                fallback_();
                std::lock_guard<std::mutex> relock(mtx_);
                fallback_active_ = true;
            } catch (const std::exception& e) {
                NCF_LOG_CRITICAL(kLog, std::string("fallback responder failed: ") + e.what());
            }
        }
        return;
    }

    restarts_.push_back(now);
    ++total_restarts_;
    consecutive_failures_ = 0;
    lock.unlock();

    NCF_LOG_WARN(kLog, "restarting interception server");
    try {
        restart_();
    } catch (const std::exception& e) {
        NCF_LOG_ERROR(kLog, std::string("restart failed: ") + e.what());
    }
}

void Watchdog::start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread(&Watchdog::loop, this);
}

void Watchdog::loop() {
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(wake_mtx_);
            wake_cv_.wait_for(lock, config_.interval, [this] { return !running_.load(); });
        }
        if (!running_.load()) break;
        tick();
    }
}

void Watchdog::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mtx_);
        running_ = false;
    }
    wake_cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

WatchdogStatus Watchdog::status() const {
    std::lock_guard<std::mutex> lock(mtx_);
    WatchdogStatus st;
    st.consecutive_failures = consecutive_failures_;
    st.restarts_in_window = static_cast<int>(restarts_.size());
    st.total_restarts = total_restarts_;
    st.fallback_active = fallback_active_;
    if (escalated_) st.state = WatchdogState::Escalated;
    else if (consecutive_failures_ > 0) st.state = WatchdogState::Degraded;
    return st;
}

} // namespace ncf
