#ifndef NCF_ENFORCEMENT_DAEMON_HPP
#define NCF_ENFORCEMENT_DAEMON_HPP

#include "ncf_network_enforcer.hpp"
#include "ncf_policy.hpp"
#include "ncf_schedule.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace ncf {

struct DaemonStatus {
    bool running = false;
    bool restricted = false;
    std::optional<AccessDecision> last_decision;
    ChainState chain;
    int consecutive_failures = 0;
};

/**
 * @brief Keeps the kill switch in line with the schedule verdict
 *
 * Every interval the daemon evaluates the schedules and compares the verdict
 * with the enforcer's observed chain state. It only calls enable_block() or
 * disable_block() when the two disagree. stop() always leaves the block
 * disabled.
 */
class EnforcementDaemon {
public:
    using ClockFn = std::function<WallClock()>;

    EnforcementDaemon(std::shared_ptr<AccessEnforcer> enforcer,
                      std::shared_ptr<PolicySource> policy,
                      std::chrono::seconds interval = std::chrono::seconds(60),
                      int alert_after_failures = 3,
                      ClockFn clock = &WallClock::now);
    ~EnforcementDaemon();

    EnforcementDaemon(const EnforcementDaemon&) = delete;
    EnforcementDaemon& operator=(const EnforcementDaemon&) = delete;

    /// Reconcile immediately, then every interval on a background thread.
    void start();

    /// Stop the loop and disable the block (fail-open).
    void stop();

    bool is_running() const { return running_.load(); }

    /**
     * @brief One evaluate-compare-apply pass
     * @return false when the pass failed (already logged)
     */
    bool reconcile_once();

    DaemonStatus status();

private:
    void loop();
    void fail_open();

    std::shared_ptr<AccessEnforcer> enforcer_;
    std::shared_ptr<PolicySource> policy_;
    std::chrono::seconds interval_;
    int alert_after_failures_;
    ClockFn clock_;

    std::atomic<bool> running_{false};
    std::thread worker_;
    std::mutex wake_mtx_;
    std::condition_variable wake_cv_;

    std::mutex state_mtx_;
    std::optional<AccessDecision> last_decision_;
    int consecutive_failures_ = 0;
};

} // namespace ncf

#endif // NCF_ENFORCEMENT_DAEMON_HPP
