#ifndef NCF_WATCHDOG_HPP
#define NCF_WATCHDOG_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace ncf {

struct WatchdogConfig {
    std::chrono::seconds interval{10};
    int failure_threshold = 3;          // consecutive failed probes before a restart
    int max_restarts = 5;               // within restart_window
    std::chrono::seconds restart_window{600};
    bool fallback_enabled = true;
};

enum class WatchdogState {
    Healthy,
    Degraded,       // probes failing, below threshold
    Escalated       // restart budget exhausted
};

const char* to_string(WatchdogState state);

struct WatchdogStatus {
    WatchdogState state = WatchdogState::Healthy;
    int consecutive_failures = 0;
    int restarts_in_window = 0;
    uint64_t total_restarts = 0;
    bool fallback_active = false;
};

/**
 * @brief Supervises the interception server
 *
 * probe() answers "is it alive"; restart() recycles it; fallback() is
 * invoked once when the restart budget is exhausted. All three are
 * injected so tick() can be driven deterministically.
 */
class Watchdog {
public:
    using Probe = std::function<bool()>;
    using Action = std::function<void()>;
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    Watchdog(WatchdogConfig config, Probe probe, Action restart, Action fallback = nullptr,
             Clock clock = &std::chrono::steady_clock::now);
    ~Watchdog();

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    void start();
    void stop();
    bool is_running() const { return running_.load(); }

    /// One probe-and-react step.
    void tick();

    WatchdogStatus status() const;

private:
    void loop();
    void prune_window(std::chrono::steady_clock::time_point now);

    WatchdogConfig config_;
    Probe probe_;
    Action restart_;
    Action fallback_;
    Clock clock_;

    mutable std::mutex mtx_;
    int consecutive_failures_ = 0;
    std::deque<std::chrono::steady_clock::time_point> restarts_;
    uint64_t total_restarts_ = 0;
    bool escalated_ = false;
    bool fallback_active_ = false;

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex wake_mtx_;
    std::condition_variable wake_cv_;
};

} // namespace ncf

#endif // NCF_WATCHDOG_HPP
