#include <gtest/gtest.h>
#include "print_log.hpp"
#include "utils/test_utils.hpp"
#include <ctime>
#include <fstream>
#include <string>

#ifndef _MSC_VER
#include <utime.h>
#endif

namespace {

void touch(const std::string& path, std::chrono::system_clock::time_point when) {
    { std::ofstream f(path); f << "x\n"; }
#ifndef _MSC_VER
    struct utimbuf times;
    times.actime = std::chrono::system_clock::to_time_t(when);
    times.modtime = times.actime;
    utime(path.c_str(), &times);
#endif
}

} // anonymous namespace

class LogDirectoryTest : public ::testing::Test {
protected:
    void SetUp() override { m_dir = TestUtils::makeScratchDir("log_directory"); }
    void TearDown() override { TestUtils::removeTree(m_dir); }

    std::string m_dir;
};

TEST_F(LogDirectoryTest, PrepareCreatesNestedDirectory) {
    ManualClock clock(TestUtils::utcTime(2024, 1, 10));
    std::string nested = m_dir + "/a/b/c";
    printlog::PrintPolicy policy = quietPolicy(nested, clock);

    EXPECT_TRUE(printlog::LogDirectory::prepare(policy));
    EXPECT_TRUE(TestUtils::fileExists(nested));
}

TEST_F(LogDirectoryTest, PrepareFailsWhenPathIsAFile) {
    ManualClock clock(TestUtils::utcTime(2024, 1, 10));
    std::string blocker = m_dir + "/blocker";
    { std::ofstream f(blocker); f << "not a directory"; }
    printlog::PrintPolicy policy = quietPolicy(blocker + "/logs", clock);

    EXPECT_FALSE(printlog::LogDirectory::prepare(policy));
}

TEST_F(LogDirectoryTest, PrepareSkippedWhenFileLoggingDisabled) {
    ManualClock clock(TestUtils::utcTime(2024, 1, 10));
    std::string never = m_dir + "/never";
    printlog::PrintPolicy policy = quietPolicy(never, clock).logToFile(false);

    EXPECT_TRUE(printlog::LogDirectory::prepare(policy));
    EXPECT_FALSE(TestUtils::fileExists(never));
}

#ifndef _MSC_VER
TEST_F(LogDirectoryTest, CleanupRemovesOnlyFilesOlderThanRetention) {
    ManualClock clock(TestUtils::utcTime(2024, 1, 10, 12, 0, 0));
    printlog::PrintPolicy policy = quietPolicy(m_dir, clock).retentionDays(7);

    touch(m_dir + "/old.txt", TestUtils::utcTime(2024, 1, 1, 9, 0, 0));
    touch(m_dir + "/edge.txt", TestUtils::utcTime(2024, 1, 3, 0, 0, 1));
    touch(m_dir + "/recent.txt", TestUtils::utcTime(2024, 1, 9, 18, 0, 0));

    std::size_t removed = printlog::LogDirectory::cleanupExpired(policy, clock.fn()());
    EXPECT_EQ(removed, 1u);
    EXPECT_FALSE(TestUtils::fileExists(m_dir + "/old.txt"));
    EXPECT_TRUE(TestUtils::fileExists(m_dir + "/edge.txt"));
    EXPECT_TRUE(TestUtils::fileExists(m_dir + "/recent.txt"));
}

TEST_F(LogDirectoryTest, CleanupLeavesSubdirectoriesAlone) {
    ManualClock clock(TestUtils::utcTime(2024, 1, 10, 12, 0, 0));
    printlog::PrintPolicy policy = quietPolicy(m_dir, clock).retentionDays(0);

    printlog::LogDirectory::mkdirRecursive(m_dir + "/archive");
    touch(m_dir + "/yesterday.txt", TestUtils::utcTime(2024, 1, 9, 23, 0, 0));

    EXPECT_EQ(printlog::LogDirectory::cleanupExpired(policy, clock.fn()()), 1u);
    EXPECT_TRUE(TestUtils::fileExists(m_dir + "/archive"));
}

TEST_F(LogDirectoryTest, PrinterStartupRunsCleanup) {
    ManualClock clock(TestUtils::utcTime(2024, 1, 10, 12, 0, 0));
    touch(m_dir + "/log_2023-12-01.txt", TestUtils::utcTime(2023, 12, 1, 12, 0, 0));

    printlog::Printer print(quietPolicy(m_dir, clock).retentionDays(7));
    EXPECT_FALSE(TestUtils::fileExists(m_dir + "/log_2023-12-01.txt"));
    EXPECT_TRUE(TestUtils::fileExists(m_dir + "/log_2024-01-10.txt"));
}
#endif

TEST_F(LogDirectoryTest, CleanupOfMissingDirectoryIsNoOp) {
    ManualClock clock(TestUtils::utcTime(2024, 1, 10));
    printlog::PrintPolicy policy = quietPolicy(m_dir + "/missing", clock);
    EXPECT_EQ(printlog::LogDirectory::cleanupExpired(policy, clock.fn()()), 0u);
}
