/**
 * @file test_logger.cpp
 * @brief Tests for the process logger
 */

#include <gtest/gtest.h>
#include "ncf_logger.hpp"
#include "test_helpers.hpp"

#include <string>
#include <sys/stat.h>

using namespace ncf;
using ncf::test::TempDir;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& log = Logger::instance();
        log.setConsoleOutput(false);
        log.setLevel(LogLevel::INFO);
        ASSERT_TRUE(log.setFileOutput(dir_.file("ncf.log")));
    }

    void TearDown() override {
        auto& log = Logger::instance();
        log.setFileOutput("");
        log.setMaxFileBytes(0);
        log.setAlertHandler(nullptr);
        log.setLevel(LogLevel::INFO);
        log.setConsoleOutput(true);
    }

    std::string contents(const std::string& name = "ncf.log") {
        return ncf::test::read_all(dir_.file(name));
    }

    TempDir dir_;
};

TEST_F(LoggerTest, WritesFormattedLine) {
    NCF_LOG_WARN("hosts", "backup pruned");
    std::string out = contents();
    EXPECT_NE(out.find("[WARN ] [hosts] backup pruned\n"), std::string::npos) << out;
    // YYYY-mm-dd HH:MM:SS.mmm
    ASSERT_GE(out.size(), 24u);
    EXPECT_EQ(out[4], '-');
    EXPECT_EQ(out[19], '.');
}

TEST_F(LoggerTest, LevelFilters) {
    int evaluated = 0;
    auto msg = [&evaluated] { ++evaluated; return std::string("noisy"); };
    NCF_LOG_DEBUG("server", msg());
    EXPECT_EQ(evaluated, 0);
    EXPECT_TRUE(contents().empty());

    Logger::instance().setLevel(LogLevel::DEBUG);
    NCF_LOG_DEBUG("server", msg());
    EXPECT_EQ(evaluated, 1);
    EXPECT_NE(contents().find("noisy"), std::string::npos);
}

TEST_F(LoggerTest, CriticalInvokesAlertHandler) {
    std::string seen;
    Logger::instance().setAlertHandler([&seen](const std::string& c, const std::string& m) {
        seen = c + ":" + m;
    });
    NCF_LOG_ERROR("daemon", "not an alert");
    EXPECT_TRUE(seen.empty());
    NCF_LOG_CRITICAL("daemon", "3 consecutive failures");
    EXPECT_EQ(seen, "daemon:3 consecutive failures");
}

TEST_F(LoggerTest, RotatesPastMaxSize) {
    Logger::instance().setMaxFileBytes(300);
    for (int i = 0; i < 10; ++i) {
        NCF_LOG_INFO("test", "line " + std::to_string(i));
    }
    struct stat st{};
    ASSERT_EQ(::stat(dir_.file("ncf.log.1").c_str(), &st), 0);
    EXPECT_GE(st.st_size, 300);
    EXPECT_NE(contents().find("line 9"), std::string::npos);
    EXPECT_EQ(contents().find("line 0"), std::string::npos);
}

TEST_F(LoggerTest, ReopenFollowsRename) {
    NCF_LOG_INFO("test", "before");
    ASSERT_EQ(::rename(dir_.file("ncf.log").c_str(), dir_.file("moved.log").c_str()), 0);
    ASSERT_TRUE(Logger::instance().reopen());
    NCF_LOG_INFO("test", "after");

    EXPECT_NE(contents("moved.log").find("before"), std::string::npos);
    EXPECT_EQ(contents("moved.log").find("after"), std::string::npos);
    EXPECT_NE(contents().find("after"), std::string::npos);
}

TEST(LogLevelTest, ParseNames) {
    EXPECT_EQ(Logger::levelFromString("warning"), LogLevel::WARN);
    EXPECT_EQ(Logger::levelFromString("alert"), LogLevel::CRITICAL);
    EXPECT_EQ(Logger::levelFromString("bogus"), LogLevel::INFO);
    EXPECT_STREQ(Logger::levelToString(LogLevel::ERROR), "ERROR");
}
