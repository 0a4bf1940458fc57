#include <gtest/gtest.h>
#include "workpool/common/logging.hpp"

using namespace workpool;

class LoggingTests : public ::testing::Test
{
};

TEST_F(LoggingTests, Logger_IsNamedAndRegistered)
{
    auto log = logger();
    ASSERT_NE(log, nullptr);
    EXPECT_EQ(log->name(), k_logger_name);
    EXPECT_EQ(spdlog::get(k_logger_name), log);
}

TEST_F(LoggingTests, Logger_ReturnsSameInstance)
{
    EXPECT_EQ(logger(), logger());
}

TEST_F(LoggingTests, EnableVerbose_RaisesToDebug)
{
    enable_verbose_logging(true);
    EXPECT_TRUE(logger()->should_log(spdlog::level::debug));
}

TEST_F(LoggingTests, EnableVerboseFalse_NeverLowersLevel)
{
    enable_verbose_logging(true);
    enable_verbose_logging(false);
    EXPECT_TRUE(logger()->should_log(spdlog::level::debug));
}
