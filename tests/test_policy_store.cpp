/**
 * @file test_policy_store.cpp
 * @brief Tests for the read-only JSON policy store
 */

#include <gtest/gtest.h>
#include "ncf_errors.hpp"
#include "ncf_policy.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <string>

using namespace ncf;
using ncf::test::TempDir;
using nlohmann::json;

namespace {

std::string local_date(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm_buf);
    return buf;
}

/// TinyDB table: rows keyed "1", "2", ... in order.
json table(std::initializer_list<json> rows) {
    json t = json::object();
    int id = 1;
    for (const auto& r : rows) t[std::to_string(id++)] = r;
    return t;
}

} // namespace

class PolicyStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = dir_.file("control.json");
    }

    void save(const json& doc) {
        ncf::test::write_all(path_, doc.dump());
    }

    TempDir dir_;
    std::string path_;
};

TEST_F(PolicyStoreTest, ReadsBlockLists) {
    json doc;
    doc["blocked_sites"] = table({
        {{"domain", "Example.COM"}, {"category", nullptr}, {"date_added", "2024-01-01T10:00:00"}},
        {{"domain", "games.net"}, {"category", "GAMING"}},
    });
    doc["blacklist_categories"] = table({
        {{"name", "social_networks"}, {"is_active", true}},
        {{"name", "news"}, {"is_active", false}},
        {{"name", "porn"}, {"is_active", true}},
    });
    doc["blacklist_domains"] = table({
        {{"domain", "social.io"}, {"category", "social_networks"}},
        {{"domain", "paper.com"}, {"category", "news"}},
        {{"domain", "adult.org"}, {"category", "porn"}},
    });
    save(doc);

    JsonPolicyStore store(path_);
    BlockRules rules = store.block_rules();

    EXPECT_EQ(rules.manual.size(), 2u);
    EXPECT_EQ(rules.manual.at("example.com"), "");
    EXPECT_EQ(rules.manual.at("games.net"), "GAMING");
    ASSERT_EQ(rules.categories.size(), 1u);
    EXPECT_EQ(rules.categories.at("social.io"), "social_networks");
    EXPECT_EQ(rules.age_restricted, (std::set<std::string>{"adult.org"}));

    std::set<std::string> expected{"adult.org", "example.com", "games.net", "social.io"};
    EXPECT_EQ(store.blocked_domains(), expected);
}

TEST_F(PolicyStoreTest, ReadsSchedulesInIdOrder) {
    json doc;
    doc["time_schedules"] = {
        {"10", {{"name", "night"}, {"start_time", "22:00"}, {"end_time", "06:00"},
                {"days", {5, 6, 9}}, {"is_active", false}}},
        {"2", {{"name", "school"}, {"start_time", "15:00"}, {"end_time", "20:00"},
               {"days", {0, 1, 2, 3, 4}}, {"is_active", true}}},
        {"3", {{"name", "broken"}, {"start_time", "25:00"}, {"end_time", "06:00"},
               {"days", {1}}}},
    };
    save(doc);

    JsonPolicyStore store(path_);
    auto schedules = store.schedules();
    ASSERT_EQ(schedules.size(), 2u);

    EXPECT_EQ(schedules[0].name, "school");
    EXPECT_TRUE(schedules[0].enabled);
    EXPECT_EQ(schedules[0].start, TimeOfDay(15, 0));
    EXPECT_EQ(schedules[0].days, (std::set<int>{0, 1, 2, 3, 4}));

    EXPECT_EQ(schedules[1].name, "night");
    EXPECT_FALSE(schedules[1].enabled);
    EXPECT_EQ(schedules[1].days, (std::set<int>{5, 6}));
}

TEST_F(PolicyStoreTest, ReadsTodaysUsageAndActiveLimit) {
    WallClock now = WallClock::now();
    json doc;
    doc["daily_usage"] = table({
        {{"date", "1999-01-01"}, {"minutes_used", 9999}},
        {{"date", local_date(now.instant)}, {"minutes_used", 61}},
    });
    doc["settings"] = table({
        {{"id", 1}, {"protection_active", true}, {"time_limit_minutes", 60},
         {"reset_time", "00:00"}, {"is_active", true}},
    });
    save(doc);

    JsonPolicyStore store(path_);
    UsageCounter usage = store.usage(now);
    EXPECT_EQ(usage.accumulated_seconds, 61 * 60);
    ASSERT_TRUE(usage.daily_limit_minutes);
    EXPECT_EQ(*usage.daily_limit_minutes, 60);

    AccessDecision d = ScheduleEvaluator::is_allowed(now, store.schedules(), usage);
    EXPECT_FALSE(d.allowed);
    EXPECT_EQ(d.code, AccessReason::DailyLimitReached);
}

TEST_F(PolicyStoreTest, InactiveOrUnsetLimitImposesNothing) {
    json doc;
    doc["settings"] = table({{{"time_limit_minutes", 60}, {"is_active", false}}});
    save(doc);
    JsonPolicyStore store(path_);
    UsageCounter usage = store.usage(WallClock::now());
    EXPECT_EQ(usage.accumulated_seconds, 0);
    EXPECT_FALSE(usage.daily_limit_minutes);

    // fresh install: the key exists but holds null
    doc["settings"] = table({{{"daily_limit_minutes", nullptr}, {"default_language", "he"}}});
    save(doc);
    JsonPolicyStore fresh(path_);
    EXPECT_FALSE(fresh.usage(WallClock::now()).daily_limit_minutes);
}

TEST_F(PolicyStoreTest, MissingTablesReadAsEmpty) {
    save(json{{"_default", json::object()}});
    JsonPolicyStore store(path_);
    EXPECT_TRUE(store.block_rules().empty());
    EXPECT_TRUE(store.schedules().empty());
    EXPECT_FALSE(store.usage(WallClock::now()).daily_limit_minutes);
}

TEST_F(PolicyStoreTest, UnreadableFileThrows) {
    EXPECT_THROW(JsonPolicyStore(dir_.file("absent.json")), ConfigurationError);

    ncf::test::write_all(path_, "{\"blocked_sites\": {\"1\": ");
    EXPECT_THROW(JsonPolicyStore store(path_), ConfigurationError);

    ncf::test::write_all(path_, "[1, 2, 3]");
    EXPECT_THROW(JsonPolicyStore store(path_), ConfigurationError);
}

TEST_F(PolicyStoreTest, PicksUpRewritesAndKeepsLastGoodCopy) {
    json doc;
    doc["blocked_sites"] = table({{{"domain", "first.com"}}});
    save(doc);
    JsonPolicyStore store(path_);
    EXPECT_EQ(store.blocked_domains(), (std::set<std::string>{"first.com"}));

    doc["blocked_sites"] = table({{{"domain", "first.com"}}, {{"domain", "second.com"}}});
    save(doc);
    EXPECT_EQ(store.blocked_domains(), (std::set<std::string>{"first.com", "second.com"}));

    // caught mid-write by the administrative side
    ncf::test::write_all(path_, "{\"blocked_sit");
    EXPECT_EQ(store.blocked_domains(), (std::set<std::string>{"first.com", "second.com"}));

    // the store never writes back
    EXPECT_EQ(ncf::test::read_all(path_), "{\"blocked_sit");
}

TEST(PolicyHelpersTest, ParseDays) {
    EXPECT_EQ(JsonPolicyStore::parse_days(json{0, 6}), (std::set<int>{0, 6}));
    EXPECT_EQ(JsonPolicyStore::parse_days(json{1, "2", 7, -1, "x", nullptr}),
              (std::set<int>{1, 2}));
    EXPECT_EQ(JsonPolicyStore::parse_days(json(" 1, 2 ,7,-1")), (std::set<int>{1, 2}));
    EXPECT_TRUE(JsonPolicyStore::parse_days(json("")).empty());
    EXPECT_TRUE(JsonPolicyStore::parse_days(json(nullptr)).empty());
}

TEST(StaticPolicySourceTest, ReturnsWhatWasSet) {
    StaticPolicySource src;
    BlockRules rules;
    rules.manual["a.com"] = "MANUAL";
    src.set_block_rules(rules);
    UsageCounter usage;
    usage.accumulated_seconds = 42;
    src.set_usage(usage);

    EXPECT_EQ(src.blocked_domains(), (std::set<std::string>{"a.com"}));
    EXPECT_EQ(src.usage(WallClock::now()).accumulated_seconds, 42);
    EXPECT_TRUE(src.schedules().empty());
}
