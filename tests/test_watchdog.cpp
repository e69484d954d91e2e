/**
 * @file test_watchdog.cpp
 * @brief Tests for the interception server watchdog
 */

#include <gtest/gtest.h>
#include "ncf_watchdog.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace ncf;
using namespace std::chrono;

class WatchdogTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.failure_threshold = 3;
        config_.max_restarts = 2;
        config_.restart_window = seconds(600);
    }

    std::unique_ptr<Watchdog> make() {
        return std::make_unique<Watchdog>(
            config_,
            [this] { return healthy_.load(); },
            [this] { ++restarts_; },
            [this] { ++fallbacks_; },
            [this] { return now_; });
    }

    WatchdogConfig config_;
    std::atomic<bool> healthy_{true};
    std::atomic<int> restarts_{0};
    std::atomic<int> fallbacks_{0};
    steady_clock::time_point now_{};
};

TEST_F(WatchdogTest, HealthyProbesDoNothing) {
    auto wd = make();
    for (int i = 0; i < 10; ++i) wd->tick();
    EXPECT_EQ(restarts_.load(), 0);
    EXPECT_EQ(wd->status().state, WatchdogState::Healthy);
}

TEST_F(WatchdogTest, RestartsAfterThreshold) {
    auto wd = make();
    healthy_ = false;
    wd->tick();
    wd->tick();
    EXPECT_EQ(restarts_.load(), 0);
    EXPECT_EQ(wd->status().state, WatchdogState::Degraded);
    EXPECT_EQ(wd->status().consecutive_failures, 2);

    wd->tick();
    EXPECT_EQ(restarts_.load(), 1);
    EXPECT_EQ(wd->status().consecutive_failures, 0);
    EXPECT_EQ(wd->status().total_restarts, 1u);
}

TEST_F(WatchdogTest, RecoveryResetsFailureCount) {
    auto wd = make();
    healthy_ = false;
    wd->tick();
    wd->tick();
    healthy_ = true;
    wd->tick();
    healthy_ = false;
    wd->tick();
    wd->tick();
    EXPECT_EQ(restarts_.load(), 0);
}

TEST_F(WatchdogTest, EscalatesOnceAfterRestartBudget) {
    auto wd = make();
    healthy_ = false;
    for (int i = 0; i < 3 * 2; ++i) wd->tick();
    EXPECT_EQ(restarts_.load(), 2);
    EXPECT_EQ(fallbacks_.load(), 0);

    for (int i = 0; i < 3; ++i) wd->tick();
    EXPECT_EQ(fallbacks_.load(), 1);

    WatchdogStatus st = wd->status();
    EXPECT_EQ(st.state, WatchdogState::Escalated);
    EXPECT_TRUE(st.fallback_active);

    // further failures neither restart nor re-run the fallback
    for (int i = 0; i < 9; ++i) wd->tick();
    EXPECT_EQ(restarts_.load(), 2);
    EXPECT_EQ(fallbacks_.load(), 1);
}

TEST_F(WatchdogTest, RestartWindowSlides) {
    auto wd = make();
    healthy_ = false;
    for (int i = 0; i < 6; ++i) wd->tick();
    ASSERT_EQ(restarts_.load(), 2);

    // both restarts age out of the window
    now_ += seconds(601);
    for (int i = 0; i < 3; ++i) wd->tick();
    EXPECT_EQ(restarts_.load(), 3);
    EXPECT_EQ(fallbacks_.load(), 0);
    EXPECT_EQ(wd->status().restarts_in_window, 1);
}

TEST_F(WatchdogTest, FallbackDisabled) {
    config_.fallback_enabled = false;
    auto wd = make();
    healthy_ = false;
    for (int i = 0; i < 12; ++i) wd->tick();
    EXPECT_EQ(fallbacks_.load(), 0);
    EXPECT_EQ(wd->status().state, WatchdogState::Escalated);
    EXPECT_FALSE(wd->status().fallback_active);
}

TEST_F(WatchdogTest, ThrowingProbeCountsAsFailure) {
    config_.failure_threshold = 1;
    Watchdog wd(config_, []() -> bool { throw std::runtime_error("probe"); },
                [this] { ++restarts_; });
    wd.tick();
    EXPECT_EQ(restarts_.load(), 1);
}

TEST_F(WatchdogTest, ThrowingRestartIsContained) {
    config_.failure_threshold = 1;
    Watchdog wd(config_, [] { return false; },
                [] { throw std::runtime_error("bind failed"); });
    EXPECT_NO_THROW(wd.tick());
    EXPECT_EQ(wd.status().total_restarts, 1u);
}

TEST_F(WatchdogTest, BackgroundLoopProbes) {
    config_.interval = seconds(1);
    config_.failure_threshold = 1;
    Watchdog wd(config_, [this] { return healthy_.load(); }, [this] { ++restarts_; });
    healthy_ = false;
    wd.start();
    EXPECT_TRUE(wd.is_running());
    for (int i = 0; i < 300 && restarts_.load() == 0; ++i) {
        std::this_thread::sleep_for(milliseconds(10));
    }
    wd.stop();
    EXPECT_FALSE(wd.is_running());
    EXPECT_GE(restarts_.load(), 1);
}

TEST(WatchdogCtorTest, RequiresProbeAndRestart) {
    EXPECT_THROW(Watchdog(WatchdogConfig{}, nullptr, [] {}), std::invalid_argument);
}

TEST(WatchdogStateTest, Names) {
    EXPECT_STREQ(to_string(WatchdogState::Healthy), "healthy");
    EXPECT_STREQ(to_string(WatchdogState::Escalated), "escalated");
}
