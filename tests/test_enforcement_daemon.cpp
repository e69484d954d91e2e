/**
 * @file test_enforcement_daemon.cpp
 * @brief Tests for the schedule enforcement loop
 */

#include <gtest/gtest.h>
#include "fake_firewall.hpp"
#include "ncf_enforcement_daemon.hpp"
#include "ncf_errors.hpp"
#include "ncf_network_enforcer.hpp"
#include "ncf_policy.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace ncf;

namespace {

/// Records calls; state mirrors what a real chain would report.
class FakeEnforcer : public AccessEnforcer {
public:
    void enable_block(const std::string&) override {
        if (fail) throw ConfigurationError("iptables unavailable");
        ++enables;
        hooks = 1;
        blocked = true;
    }
    void disable_block() override {
        if (fail) throw ConfigurationError("iptables unavailable");
        ++disables;
        hooks = 0;
        blocked = false;
    }
    ChainState status() override {
        if (fail) throw ConfigurationError("iptables unavailable");
        ChainState st;
        st.table = "filter";
        st.chain = "NCF_ENFORCE";
        st.exists = true;
        st.hook_references = hooks;
        if (blocked) st.rules = NetworkAccessEnforcer::block_rules();
        return st;
    }

    std::atomic<int> enables{0};
    std::atomic<int> disables{0};
    std::atomic<int> hooks{0};
    std::atomic<bool> blocked{false};
    std::atomic<bool> fail{false};
};

WallClock monday(int hour, int minute) {
    WallClock wc;
    wc.instant = std::chrono::system_clock::time_point(std::chrono::hours(500000));
    wc.weekday = 0;
    wc.minute_of_day = hour * 60 + minute;
    return wc;
}

} // namespace

class EnforcementDaemonTest : public ::testing::Test {
protected:
    void SetUp() override {
        Schedule s;
        s.name = "homework";
        s.days = {0, 1, 2, 3, 4};
        s.start = TimeOfDay(15, 0);
        s.end = TimeOfDay(20, 0);
        policy_->set_schedules({s});
    }

    std::unique_ptr<EnforcementDaemon> make_daemon(int alert_after = 3) {
        return std::make_unique<EnforcementDaemon>(
            enforcer_, policy_, std::chrono::seconds(60), alert_after,
            [this] { return now_; });
    }

    std::shared_ptr<FakeEnforcer> enforcer_ = std::make_shared<FakeEnforcer>();
    std::shared_ptr<StaticPolicySource> policy_ = std::make_shared<StaticPolicySource>();
    WallClock now_ = monday(10, 0);
};

TEST_F(EnforcementDaemonTest, BlocksOnceAcrossRepeatedPolls) {
    auto daemon = make_daemon();
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(daemon->reconcile_once());
    }
    EXPECT_EQ(enforcer_->enables.load(), 1);
    EXPECT_EQ(enforcer_->disables.load(), 0);
    EXPECT_TRUE(daemon->status().restricted);
}

TEST_F(EnforcementDaemonTest, UnblocksOnceOnTransition) {
    auto daemon = make_daemon();
    daemon->reconcile_once();
    ASSERT_TRUE(enforcer_->blocked.load());

    now_ = monday(16, 0);
    daemon->reconcile_once();
    daemon->reconcile_once();
    EXPECT_EQ(enforcer_->disables.load(), 1);
    EXPECT_FALSE(enforcer_->blocked.load());

    DaemonStatus st = daemon->status();
    ASSERT_TRUE(st.last_decision);
    EXPECT_TRUE(st.last_decision->allowed);
}

TEST_F(EnforcementDaemonTest, AllowedAndUnblockedDoesNothing) {
    now_ = monday(16, 0);
    auto daemon = make_daemon();
    daemon->reconcile_once();
    EXPECT_EQ(enforcer_->enables.load(), 0);
    EXPECT_EQ(enforcer_->disables.load(), 0);
}

TEST_F(EnforcementDaemonTest, ReappliesWhenHookDisappears) {
    auto daemon = make_daemon();
    daemon->reconcile_once();
    enforcer_->hooks = 0;        // someone flushed OUTPUT
    daemon->reconcile_once();
    EXPECT_EQ(enforcer_->enables.load(), 2);
}

TEST_F(EnforcementDaemonTest, StrayHookRemovedWhenAllowed) {
    now_ = monday(16, 0);
    enforcer_->hooks = 1;         // hooked but empty chain
    auto daemon = make_daemon();
    daemon->reconcile_once();
    EXPECT_EQ(enforcer_->disables.load(), 1);
}

TEST_F(EnforcementDaemonTest, DailyLimitBlocksInsideSchedule) {
    now_ = monday(16, 0);
    UsageCounter usage;
    usage.daily_limit_minutes = 60;
    usage.accumulated_seconds = 61 * 60;
    policy_->set_usage(usage);

    auto daemon = make_daemon();
    daemon->reconcile_once();
    EXPECT_TRUE(enforcer_->blocked.load());
    EXPECT_EQ(daemon->status().last_decision->code, AccessReason::DailyLimitReached);
}

TEST_F(EnforcementDaemonTest, FailuresAreCountedAndReset) {
    auto daemon = make_daemon(2);
    enforcer_->fail = true;
    EXPECT_FALSE(daemon->reconcile_once());
    EXPECT_FALSE(daemon->reconcile_once());
    EXPECT_FALSE(daemon->reconcile_once());

    enforcer_->fail = false;
    EXPECT_EQ(daemon->status().consecutive_failures, 3);
    EXPECT_TRUE(daemon->reconcile_once());
    EXPECT_EQ(daemon->status().consecutive_failures, 0);
}

TEST_F(EnforcementDaemonTest, StopFailsOpen) {
    auto daemon = make_daemon();
    daemon->start();
    for (int i = 0; i < 200 && !enforcer_->blocked.load(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(enforcer_->blocked.load());
    EXPECT_TRUE(daemon->is_running());

    daemon->stop();
    EXPECT_FALSE(daemon->is_running());
    EXPECT_FALSE(enforcer_->blocked.load());
    EXPECT_EQ(enforcer_->hooks.load(), 0);
}

TEST_F(EnforcementDaemonTest, StopSurvivesEnforcerFailure) {
    auto daemon = make_daemon();
    daemon->reconcile_once();
    enforcer_->fail = true;
    EXPECT_NO_THROW(daemon->stop());
}

TEST_F(EnforcementDaemonTest, WorksAgainstManagedChain) {
    auto fw = std::make_shared<ncf::test::FakeFirewallBackend>();
    auto real = std::make_shared<NetworkAccessEnforcer>(fw);
    EnforcementDaemon daemon(real, policy_, std::chrono::seconds(60), 3,
                             [this] { return now_; });

    daemon.reconcile_once();
    daemon.reconcile_once();
    ChainState st = real->status();
    EXPECT_EQ(st.hook_references, 1);
    EXPECT_EQ(st.rules, NetworkAccessEnforcer::block_rules());

    int before = fw->mutations;
    daemon.reconcile_once();
    EXPECT_EQ(fw->mutations, before);

    daemon.stop();
    EXPECT_EQ(real->status().hook_references, 0);
}

TEST(EnforcementDaemonCtorTest, RequiresCollaborators) {
    auto policy = std::make_shared<StaticPolicySource>();
    EXPECT_THROW(EnforcementDaemon(nullptr, policy), std::invalid_argument);
}
