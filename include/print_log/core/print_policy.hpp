#ifndef PRINT_LOG_PRINT_POLICY_HPP
#define PRINT_LOG_PRINT_POLICY_HPP

#include "log_common.hpp"
#include "severity.hpp"
#include "time_zone.hpp"
#include "color_table.hpp"
#include "encoding.hpp"
#include <array>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <stdexcept>
#include <string>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace printlog {

    enum class BufferMode {
        Unbuffered,
        Line,
        Full
    };

    /// Every formatting and behavior toggle the Printer reads.
    ///
    /// Built by chaining setters on `PrintPolicy::defaults()`:
    /// @code
    ///   auto policy = printlog::PrintPolicy::defaults()
    ///       .logsDirectory("logs")
    ///       .retentionDays(30)
    ///       .timeZone(printlog::TimeZone::fixed(std::chrono::hours(-5)))
    ///       .useConsoleColors(printlog::PrintPolicy::detectColorSupport());
    /// @endcode
    ///
    /// Setters validate their argument and throw std::invalid_argument.
    /// A Printer copies the policy on construction and never changes it.
    class PrintPolicy {
    public:
        using FilenameFn = std::function<std::string(const CivilDate&)>;
        using ClockFn = std::function<std::chrono::system_clock::time_point()>;

        static PrintPolicy defaults() {
            return PrintPolicy();
        }

        PrintPolicy& logsDirectory(const std::string& dir) {
            if (dir.empty()) {
                throw std::invalid_argument("PrintPolicy: logs directory must not be empty");
            }
            m_logsDir = dir;
            return *this;
        }

        PrintPolicy& timeZone(const TimeZone& zone) {
            m_timeZone = zone;
            return *this;
        }

        /// Files in the logs directory last modified before
        /// `today - days` are deleted when a Printer starts.
        PrintPolicy& retentionDays(int days) {
            if (days < 0) {
                throw std::invalid_argument("PrintPolicy: retention days must not be negative");
            }
            m_retentionDays = days;
            return *this;
        }

        PrintPolicy& logToFile(bool enable) { m_logToFile = enable; return *this; }
        PrintPolicy& logToConsole(bool enable) { m_logToConsole = enable; return *this; }
        PrintPolicy& useConsoleColors(bool enable) { m_useColors = enable; return *this; }
        PrintPolicy& captureStderr(bool enable) { m_captureStderr = enable; return *this; }
        PrintPolicy& encodingErrors(EncodingErrors mode) { m_encodingErrors = mode; return *this; }
        PrintPolicy& fileBuffering(BufferMode mode) { m_buffering = mode; return *this; }

        /// strftime pattern applied to the date, joined to the logs directory.
        /// Replaces any custom filename function.
        PrintPolicy& filenameFormat(const std::string& pattern) {
            if (pattern.empty()) {
                throw std::invalid_argument("PrintPolicy: filename format must not be empty");
            }
            m_filenameFmt = pattern;
            m_filenameFn = nullptr;
            return *this;
        }

        /// Full control over the per-day path. The function's result is used as-is.
        PrintPolicy& filenameFunction(FilenameFn fn) {
            if (!fn) {
                throw std::invalid_argument("PrintPolicy: filename function must not be empty");
            }
            m_filenameFn = std::move(fn);
            return *this;
        }

        PrintPolicy& timestampFormat(const std::string& pattern) {
            m_timestampFmt = pattern;
            return *this;
        }

        /// Severity::Normal and Severity::Info share one tag.
        PrintPolicy& tag(Severity severity, const std::string& text) {
            m_tags[tagSlot(severity)] = text;
            return *this;
        }

        PrintPolicy& colors(const ColorTable& table) {
            m_colors = table;
            return *this;
        }

        PrintPolicy& clock(ClockFn fn) {
            if (!fn) {
                throw std::invalid_argument("PrintPolicy: clock must not be empty");
            }
            m_clock = std::move(fn);
            return *this;
        }

        // --- Accessors ---
        const std::string& logsDirectory()   const { return m_logsDir; }
        const TimeZone&    timeZone()        const { return m_timeZone; }
        int                retentionDays()   const { return m_retentionDays; }
        bool               logToFile()       const { return m_logToFile; }
        bool               logToConsole()    const { return m_logToConsole; }
        bool               useConsoleColors() const { return m_useColors; }
        bool               captureStderr()   const { return m_captureStderr; }
        EncodingErrors     encodingErrors()  const { return m_encodingErrors; }
        BufferMode         fileBuffering()   const { return m_buffering; }
        const std::string& filenameFormat()  const { return m_filenameFmt; }
        const std::string& timestampFormat() const { return m_timestampFmt; }
        const ColorTable&  colors()          const { return m_colors; }

        const std::string& tagFor(Severity severity) const {
            return m_tags[tagSlot(severity)];
        }

        std::chrono::system_clock::time_point now() const {
            return m_clock();
        }

        CivilDate today() const {
            return m_timeZone.dateOf(m_clock());
        }

        std::string logFilePath(const CivilDate& date) const {
            if (m_filenameFn) return m_filenameFn(date);
            return detail::joinPath(m_logsDir, date.format(m_filenameFmt));
        }

        /// Timestamp for a line preamble, without the surrounding brackets.
        std::string formatTimestamp(std::chrono::system_clock::time_point time) const {
            return m_timeZone.format(time, m_timestampFmt);
        }

        /// False when NO_COLOR is set, PRINT_LOG_NO_COLOR is non-empty,
        /// or stdout is not a terminal.
        static bool detectColorSupport() {
            if (std::getenv("NO_COLOR") != nullptr) return false;
            const char* noColor = std::getenv("PRINT_LOG_NO_COLOR");
            if (noColor && noColor[0] != '\0') return false;
#ifdef _WIN32
            return _isatty(_fileno(stdout)) != 0;
#else
            return isatty(fileno(stdout)) != 0;
#endif
        }

    private:
        PrintPolicy()
            : m_logsDir("logs")
            , m_timeZone(TimeZone::utc())
            , m_retentionDays(7)
            , m_logToFile(true)
            , m_logToConsole(true)
            , m_useColors(true)
            , m_captureStderr(true)
            , m_encodingErrors(EncodingErrors::Replace)
            , m_buffering(BufferMode::Line)
            , m_filenameFmt("log_%Y-%m-%d.txt")
            , m_timestampFmt("%H:%M:%S")
            , m_colors(ColorTable::defaults())
            , m_clock([]() { return std::chrono::system_clock::now(); })
        {
            m_tags[tagSlot(Severity::Info)] = "[INFO]";
            m_tags[tagSlot(Severity::Success)] = "[SUCCESS]";
            m_tags[tagSlot(Severity::Warning)] = "[WARN]";
            m_tags[tagSlot(Severity::Error)] = "[ERROR]";
            m_tags[tagSlot(Severity::Debug)] = "[DEBUG]";
            m_tags[tagSlot(Severity::Critical)] = "[CRIT]";
        }

        std::string    m_logsDir;
        TimeZone       m_timeZone;
        int            m_retentionDays;
        bool           m_logToFile;
        bool           m_logToConsole;
        bool           m_useColors;
        bool           m_captureStderr;
        EncodingErrors m_encodingErrors;
        BufferMode     m_buffering;
        std::string    m_filenameFmt;
        FilenameFn     m_filenameFn;
        std::string    m_timestampFmt;
        std::array<std::string, kTagSlotCount> m_tags;
        ColorTable     m_colors;
        ClockFn        m_clock;
    };

} // namespace printlog

#endif // PRINT_LOG_PRINT_POLICY_HPP
