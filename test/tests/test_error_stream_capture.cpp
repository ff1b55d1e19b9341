#include <gtest/gtest.h>
#include "print_log.hpp"
#include "utils/test_utils.hpp"
#include <iostream>
#include <sstream>
#include <string>

class ErrorStreamCaptureTest : public ::testing::Test {
protected:
    ErrorStreamCaptureTest() : m_clock(TestUtils::utcTime(2024, 11, 20, 17, 45, 0)) {}

    void SetUp() override { m_dir = TestUtils::makeScratchDir("error_capture"); }
    void TearDown() override { TestUtils::removeTree(m_dir); }

    printlog::PrintPolicy capturePolicy() const {
        return quietPolicy(m_dir, m_clock).captureStderr(true);
    }

    std::string logFile() const { return m_dir + "/log_2024-11-20.txt"; }

    ManualClock m_clock;
    std::string m_dir;
    std::ostringstream m_errors;
};

static const std::string ERR = "[17:45:00] [ERROR] ";

TEST_F(ErrorStreamCaptureTest, InstallReplacesStreamBuffer) {
    printlog::Printer print(capturePolicy());
    std::streambuf* original = m_errors.rdbuf();
    {
        printlog::ErrorStreamCapture capture(print, m_errors);
        EXPECT_TRUE(capture.install());
        EXPECT_TRUE(capture.isInstalled());
        EXPECT_EQ(static_cast<std::ostream&>(m_errors).rdbuf(), &capture);
    }
    EXPECT_EQ(static_cast<std::ostream&>(m_errors).rdbuf(), original);
}

TEST_F(ErrorStreamCaptureTest, InstallIsNoOpWhenDisabled) {
    printlog::Printer print(quietPolicy(m_dir, m_clock));
    printlog::ErrorStreamCapture capture(print, m_errors);
    std::streambuf* original = static_cast<std::ostream&>(m_errors).rdbuf();

    EXPECT_FALSE(capture.install());
    EXPECT_FALSE(capture.isInstalled());
    EXPECT_EQ(static_cast<std::ostream&>(m_errors).rdbuf(), original);

    m_errors << "direct\n";
    EXPECT_EQ(TestUtils::readLogFile(logFile()), "");
}

TEST_F(ErrorStreamCaptureTest, OriginalStreamReceivesBytesUnchanged) {
    printlog::Printer print(capturePolicy());
    printlog::ErrorStreamCapture capture(print, m_errors);
    capture.install();

    m_errors << "Traceback:\n  line1\n" << 42 << '\n';
    EXPECT_EQ(m_errors.str(), "Traceback:\n  line1\n42\n");
}

TEST_F(ErrorStreamCaptureTest, CompleteLinesGoToFileUnderErrorTag) {
    printlog::Printer print(capturePolicy());
    printlog::ErrorStreamCapture capture(print, m_errors);
    capture.install();

    m_errors << "Traceback:\n  line1\n  line2";
    EXPECT_EQ(TestUtils::readLogFile(logFile()), ERR + "Traceback:\n" + ERR + "  line1\n");
    EXPECT_EQ(capture.pending(), "  line2");

    capture.flush();
    EXPECT_EQ(capture.pending(), "");
    EXPECT_EQ(TestUtils::readLogFile(logFile()),
              ERR + "Traceback:\n" + ERR + "  line1\n" + ERR + "  line2");
}

TEST_F(ErrorStreamCaptureTest, StreamFlushDoesNotForcePartialLine) {
    printlog::Printer print(capturePolicy());
    printlog::ErrorStreamCapture capture(print, m_errors);
    capture.install();

    m_errors << "partial" << std::flush;
    EXPECT_EQ(capture.pending(), "partial");
    EXPECT_EQ(TestUtils::readLogFile(logFile()), "");

    m_errors << " finished" << std::endl;
    EXPECT_EQ(TestUtils::readLogFile(logFile()), ERR + "partial finished\n");
}

TEST_F(ErrorStreamCaptureTest, RestoreFlushesPendingText) {
    printlog::Printer print(capturePolicy());
    printlog::ErrorStreamCapture capture(print, m_errors);
    capture.install();

    m_errors << "last words";
    capture.restore();
    EXPECT_FALSE(capture.isInstalled());
    EXPECT_EQ(TestUtils::readLogFile(logFile()), ERR + "last words");

    m_errors << "after restore\n";
    EXPECT_EQ(TestUtils::readLogFile(logFile()), ERR + "last words");
    EXPECT_NO_THROW(capture.restore());
}

TEST_F(ErrorStreamCaptureTest, RestoreLeavesForeignBufferInPlace) {
    printlog::Printer print(capturePolicy());
    std::ostringstream other;
    printlog::ErrorStreamCapture capture(print, m_errors);
    capture.install();

    static_cast<std::ostream&>(m_errors).rdbuf(other.rdbuf());
    capture.restore();
    EXPECT_EQ(static_cast<std::ostream&>(m_errors).rdbuf(), other.rdbuf());
}

TEST_F(ErrorStreamCaptureTest, FileLoggingDisabledOnlyForwards) {
    std::string dir = m_dir + "/none";
    printlog::Printer print(quietPolicy(dir, m_clock).captureStderr(true).logToFile(false));
    printlog::ErrorStreamCapture capture(print, m_errors);
    EXPECT_TRUE(capture.install());

    m_errors << "console only\n";
    capture.restore();
    EXPECT_EQ(m_errors.str(), "console only\n");
    EXPECT_FALSE(TestUtils::fileExists(dir));
}

TEST_F(ErrorStreamCaptureTest, CapturedLinesShareFileWithPrintedLines) {
    printlog::Printer print(capturePolicy());
    printlog::ErrorStreamCapture capture(print, m_errors);
    capture.install();

    print("Normal operation");
    m_errors << "ZeroDivisionError: division by zero\n";
    print.success("Recovered");

    EXPECT_EQ(TestUtils::readLogFile(logFile()),
              "[17:45:00] [INFO] Normal operation\n" +
              ERR + "ZeroDivisionError: division by zero\n" +
              "[17:45:00] [SUCCESS] Recovered\n");
}

TEST_F(ErrorStreamCaptureTest, OverrideStreamIntoCapturedStreamIsLoggedOnce) {
    printlog::Printer print(capturePolicy());
    printlog::ErrorStreamCapture capture(print, m_errors);
    capture.install();

    print.warning(printlog::PrintOptions().to(m_errors), "via override");
    EXPECT_EQ(m_errors.str(), "via override\n");
    EXPECT_EQ(TestUtils::readLogFile(logFile()), ERR + "via override\n");
}

TEST_F(ErrorStreamCaptureTest, CapturesStandardErrorStream) {
    printlog::Printer print(capturePolicy());
    std::streambuf* original = std::cerr.rdbuf();
    {
        printlog::ErrorStreamCapture capture(print, std::cerr);
        ASSERT_TRUE(capture.install());
        std::cerr << "captured from cerr\n";
    }
    EXPECT_EQ(std::cerr.rdbuf(), original);
    EXPECT_EQ(TestUtils::readLogFile(logFile()), ERR + "captured from cerr\n");
}

TEST_F(ErrorStreamCaptureTest, CustomErrorTag) {
    printlog::Printer print(capturePolicy().tag(printlog::Severity::Error, "!!"));
    printlog::ErrorStreamCapture capture(print, m_errors);
    capture.install();

    m_errors << "oops\n";
    EXPECT_EQ(TestUtils::readLogFile(logFile()), "[17:45:00] !! oops\n");
}
