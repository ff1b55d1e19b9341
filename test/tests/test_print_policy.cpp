#include <gtest/gtest.h>
#include "print_log.hpp"
#include "utils/test_utils.hpp"
#include <cstdlib>
#include <stdexcept>
#include <string>

TEST(PrintPolicyTest, Defaults) {
    printlog::PrintPolicy policy = printlog::PrintPolicy::defaults();
    EXPECT_EQ(policy.logsDirectory(), "logs");
    EXPECT_EQ(policy.retentionDays(), 7);
    EXPECT_TRUE(policy.logToFile());
    EXPECT_TRUE(policy.logToConsole());
    EXPECT_TRUE(policy.useConsoleColors());
    EXPECT_TRUE(policy.captureStderr());
    EXPECT_EQ(policy.encodingErrors(), printlog::EncodingErrors::Replace);
    EXPECT_EQ(policy.fileBuffering(), printlog::BufferMode::Line);
    EXPECT_EQ(policy.filenameFormat(), "log_%Y-%m-%d.txt");
    EXPECT_EQ(policy.timestampFormat(), "%H:%M:%S");
    EXPECT_FALSE(policy.timeZone().isLocal());
}

TEST(PrintPolicyTest, DefaultTags) {
    printlog::PrintPolicy policy = printlog::PrintPolicy::defaults();
    EXPECT_EQ(policy.tagFor(printlog::Severity::Normal), "[INFO]");
    EXPECT_EQ(policy.tagFor(printlog::Severity::Info), "[INFO]");
    EXPECT_EQ(policy.tagFor(printlog::Severity::Error), "[ERROR]");
    EXPECT_EQ(policy.tagFor(printlog::Severity::Warning), "[WARN]");
    EXPECT_EQ(policy.tagFor(printlog::Severity::Success), "[SUCCESS]");
    EXPECT_EQ(policy.tagFor(printlog::Severity::Debug), "[DEBUG]");
    EXPECT_EQ(policy.tagFor(printlog::Severity::Critical), "[CRIT]");
}

TEST(PrintPolicyTest, InfoTagAlsoAppliesToNormal) {
    printlog::PrintPolicy policy = printlog::PrintPolicy::defaults()
        .tag(printlog::Severity::Info, "<i>");
    EXPECT_EQ(policy.tagFor(printlog::Severity::Normal), "<i>");
}

TEST(PrintPolicyTest, LogFilePathFromFormat) {
    printlog::PrintPolicy policy = printlog::PrintPolicy::defaults().logsDirectory("var/log");
    EXPECT_EQ(policy.logFilePath(printlog::CivilDate(2024, 1, 9)), "var/log/log_2024-01-09.txt");

    policy.logsDirectory("var/log/").filenameFormat("%Y%m%d.log");
    EXPECT_EQ(policy.logFilePath(printlog::CivilDate(2024, 1, 9)), "var/log/20240109.log");
}

TEST(PrintPolicyTest, FilenameFunctionOverridesFormat) {
    printlog::PrintPolicy policy = printlog::PrintPolicy::defaults()
        .filenameFunction([](const printlog::CivilDate& d) {
            return "custom-" + std::to_string(d.day) + ".log";
        });
    EXPECT_EQ(policy.logFilePath(printlog::CivilDate(2024, 1, 9)), "custom-9.log");

    policy.filenameFormat("x_%d.txt");
    EXPECT_EQ(policy.logFilePath(printlog::CivilDate(2024, 1, 9)), "logs/x_09.txt");
}

TEST(PrintPolicyTest, TodayFollowsClockAndZone) {
    ManualClock clock(TestUtils::utcTime(2024, 5, 1, 22, 0, 0));
    printlog::PrintPolicy policy = printlog::PrintPolicy::defaults()
        .clock(clock.fn())
        .timeZone(printlog::TimeZone::fixed(std::chrono::hours(3)));
    EXPECT_EQ(policy.today(), printlog::CivilDate(2024, 5, 2));
    EXPECT_EQ(policy.formatTimestamp(policy.now()), "01:00:00");
}

TEST(PrintPolicyTest, RejectsInvalidSettings) {
    printlog::PrintPolicy policy = printlog::PrintPolicy::defaults();
    EXPECT_THROW(policy.logsDirectory(""), std::invalid_argument);
    EXPECT_THROW(policy.retentionDays(-1), std::invalid_argument);
    EXPECT_THROW(policy.filenameFormat(""), std::invalid_argument);
    EXPECT_THROW(policy.filenameFunction(printlog::PrintPolicy::FilenameFn()), std::invalid_argument);
    EXPECT_THROW(policy.clock(printlog::PrintPolicy::ClockFn()), std::invalid_argument);
    // Failed setters leave the previous value in place.
    EXPECT_EQ(policy.logsDirectory(), "logs");
    EXPECT_EQ(policy.retentionDays(), 7);
}

#ifndef _WIN32
TEST(PrintPolicyTest, NoColorEnvironmentDisablesDetection) {
    setenv("NO_COLOR", "1", 1);
    EXPECT_FALSE(printlog::PrintPolicy::detectColorSupport());
    unsetenv("NO_COLOR");

    setenv("PRINT_LOG_NO_COLOR", "yes", 1);
    EXPECT_FALSE(printlog::PrintPolicy::detectColorSupport());
    unsetenv("PRINT_LOG_NO_COLOR");
}
#endif
