/**
 * @file test_settings.cpp
 * @brief Tests for Config loading and the components built from it
 */

#include <gtest/gtest.h>
#include "ncf_config.hpp"
#include "ncf_settings.hpp"
#include "test_helpers.hpp"

#include <cstdlib>
#include <map>
#include <string>
#include <vector>

using namespace ncf;
using ncf::test::TempDir;

class SettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_ = Config::instance().snapshot();
    }

    void TearDown() override {
        Config::instance().restore(saved_);
        unsetenv("NETCURFEW_CONFIG");
    }

    std::map<std::string, std::string> saved_;

    TempDir dir_;
};

TEST_F(SettingsTest, DefaultsPresent) {
    auto& cfg = Config::instance();
    EXPECT_EQ(cfg.get("hosts.path"), "/etc/hosts");
    EXPECT_EQ(cfg.getPort("server.http_port", 1), 8080);
    EXPECT_EQ(cfg.getSeconds("daemon.interval_seconds", 1).count(), 60);
    EXPECT_TRUE(cfg.getBool("watchdog.fallback"));
}

TEST_F(SettingsTest, LoadsKeyValueFile) {
    std::string path = dir_.file("netcurfew.conf");
    ncf::test::write_all(path,
        "# comment\n"
        "; another\n"
        "server.http_port = 9090\r\n"
        "  log.level=debug  \n"
        "no equals sign\n"
        "watchdog.fallback = off\n"
        "[certs]\n"
        "max_age_days = 14\n"
        "max_age_dayz = 15\n");

    auto& cfg = Config::instance();
    ASSERT_TRUE(cfg.loadFromFile(path));
    EXPECT_EQ(cfg.getPort("server.http_port", 1), 9090);
    EXPECT_EQ(cfg.get("log.level"), "debug");
    EXPECT_FALSE(cfg.getBool("watchdog.fallback", true));
    EXPECT_EQ(cfg.get("hosts.path"), "/etc/hosts");
    EXPECT_EQ(cfg.getInt("certs.max_age_days", 0), 14);
    EXPECT_EQ(cfg.unknownKeys(), std::vector<std::string>{"certs.max_age_dayz"});
    EXPECT_FALSE(cfg.loadFromFile(dir_.file("absent.conf")));
}

TEST_F(SettingsTest, BadValuesFallBack) {
    auto& cfg = Config::instance();
    cfg.set("server.http_port", "70000");
    cfg.set("server.workers", "many");
    cfg.set("server.max_pending", "12abc");
    cfg.set("watchdog.fallback", "maybe");
    EXPECT_EQ(cfg.getPort("server.http_port", 8080), 8080);
    EXPECT_EQ(cfg.getInt("server.workers", 16), 16);
    EXPECT_EQ(cfg.getInt("server.max_pending", 256), 256);
    EXPECT_TRUE(cfg.getBool("watchdog.fallback", true));
}

TEST_F(SettingsTest, ConfigPathPrecedence) {
    EXPECT_EQ(settings::config_path("/tmp/x.conf"), "/tmp/x.conf");
    setenv("NETCURFEW_CONFIG", "/tmp/env.conf", 1);
    EXPECT_EQ(settings::config_path(""), "/tmp/env.conf");
    unsetenv("NETCURFEW_CONFIG");
    EXPECT_EQ(settings::config_path(""), "/etc/netcurfew/netcurfew.conf");
}

TEST_F(SettingsTest, ComponentConfigsReadKeys) {
    auto& cfg = Config::instance();
    cfg.set("server.https_port", "9443");
    cfg.set("server.connection_timeout_ms", "250");
    cfg.set("server.workers", "0");
    cfg.set("watchdog.max_restarts", "2");
    cfg.set("watchdog.restart_window_seconds", "60");

    ServerConfig s = settings::server_config(cfg);
    EXPECT_EQ(s.https_port, 9443);
    EXPECT_EQ(s.connection_timeout.count(), 250);
    EXPECT_EQ(s.workers, 1u);

    cfg.set("certs.max_entries", "5");
    EXPECT_EQ(settings::cert_cache_config(cfg).max_entries, 5u);

    WatchdogConfig w = settings::watchdog_config(cfg);
    EXPECT_EQ(w.max_restarts, 2);
    EXPECT_EQ(w.restart_window.count(), 60);
}

TEST_F(SettingsTest, MissingPolicyDatabaseGivesEmptySource) {
    auto& cfg = Config::instance();
    cfg.set("policy.db", dir_.file("absent.json"));
    auto src = settings::policy_source(cfg);
    ASSERT_TRUE(src);
    EXPECT_TRUE(src->block_rules().empty());
    EXPECT_TRUE(src->schedules().empty());
}
