#include "ncf_enforcement_daemon.hpp"
#include "ncf_logger.hpp"

#include <stdexcept>

namespace ncf {

namespace {
constexpr const char* kLog = "daemon";
}

EnforcementDaemon::EnforcementDaemon(std::shared_ptr<AccessEnforcer> enforcer,
                                     std::shared_ptr<PolicySource> policy,
                                     std::chrono::seconds interval,
                                     int alert_after_failures,
                                     ClockFn clock)
    : enforcer_(std::move(enforcer))
    , policy_(std::move(policy))
    , interval_(interval.count() > 0 ? interval : std::chrono::seconds(1))
    , alert_after_failures_(alert_after_failures > 0 ? alert_after_failures : 1)
    , clock_(std::move(clock))
{
    if (!enforcer_ || !policy_) {
        throw std::invalid_argument("EnforcementDaemon: enforcer and policy are required");
    }
}

EnforcementDaemon::~EnforcementDaemon() {
    if (worker_.joinable()) stop();
}

bool EnforcementDaemon::reconcile_once() {
    try {
        WallClock now = clock_();
        AccessDecision decision =
            ScheduleEvaluator::is_allowed(now, policy_->schedules(), policy_->usage(now));

        ChainState state = enforcer_->status();
        bool active = NetworkAccessEnforcer::is_active(state);

        if (!decision.allowed) {
            // A restricted chain with a missing or duplicated hook is rebuilt.
            if (!active || state.hook_references != 1) {
                NCF_LOG_INFO(kLog, "access disallowed (" + decision.reason + "), blocking");
                enforcer_->enable_block(decision.reason);
            }
        } else if (active || state.hook_references > 0) {
            NCF_LOG_INFO(kLog, "access allowed (" + decision.reason + "), unblocking");
            enforcer_->disable_block();
        }

        std::lock_guard<std::mutex> lock(state_mtx_);
        last_decision_ = decision;
        consecutive_failures_ = 0;
        return true;
    } catch (const std::exception& e) {
        int failures;
        {
            std::lock_guard<std::mutex> lock(state_mtx_);
            failures = ++consecutive_failures_;
        }
        if (failures >= alert_after_failures_) {
            NCF_LOG_CRITICAL(kLog, "reconciliation failed " + std::to_string(failures) +
                                   " times in a row: " + e.what());
        } else {
            NCF_LOG_ERROR(kLog, std::string("reconciliation failed: ") + e.what());
        }
        return false;
    }
}

void EnforcementDaemon::start() {
    if (running_.exchange(true)) return;
    worker_ = std::thread(&EnforcementDaemon::loop, this);
    NCF_LOG_INFO(kLog, "started, interval " + std::to_string(interval_.count()) + "s");
}

void EnforcementDaemon::loop() {
    while (running_.load()) {
        reconcile_once();

        std::unique_lock<std::mutex> lock(wake_mtx_);
        wake_cv_.wait_for(lock, interval_, [this] { return !running_.load(); });
    }
}

void EnforcementDaemon::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mtx_);
        running_ = false;
    }
    wake_cv_.notify_all();
    if (worker_.joinable()) worker_.join();
    fail_open();
}

void EnforcementDaemon::fail_open() {
    try {
        enforcer_->disable_block();
        NCF_LOG_INFO(kLog, "stopped, network left unrestricted");
    } catch (const std::exception& e) {
        NCF_LOG_CRITICAL(kLog, std::string("fail-open disable failed: ") + e.what());
    }
}

DaemonStatus EnforcementDaemon::status() {
    DaemonStatus st;
    st.running = running_.load();
    st.chain = enforcer_->status();
    st.restricted = NetworkAccessEnforcer::is_active(st.chain);
    std::lock_guard<std::mutex> lock(state_mtx_);
    st.last_decision = last_decision_;
    st.consecutive_failures = consecutive_failures_;
    return st;
}

} // namespace ncf
