#ifndef PRINT_LOG_PRINTER_HPP
#define PRINT_LOG_PRINTER_HPP

#include "core/log_common.hpp"
#include "core/severity.hpp"
#include "core/print_policy.hpp"
#include "core/log_directory.hpp"
#include "channel/rotating_file_channel.hpp"
#include "print_options.hpp"
#include <cstdio>
#include <exception>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

namespace printlog {

    class ErrorStreamCapture;

    /// Drop-in replacement for a print function that also keeps a daily log.
    ///
    /// Usage:
    /// @code
    ///   printlog::Printer print(printlog::PrintPolicy::defaults().logsDirectory("logs"));
    ///   print("System initializing...");
    ///   print(printlog::PrintOptions().end("..."), "Loading modules");
    ///   print("Done!");                        // same file line as above
    ///   print.warning("High latency detected:", 450, "ms");
    ///   print.error("Connection dropped.");    // flushed immediately
    /// @endcode
    ///
    /// Every call takes one mutex for its whole duration, so console output
    /// and file content from concurrent callers never interleave within a
    /// call. No logging call throws: console failures are swallowed and
    /// file failures cost the affected line only.
    ///
    /// With std::cerr as the console and an ErrorStreamCapture installed on
    /// it, every console write is logged twice: once under its own tag and
    /// once under the error tag.
    ///
    /// The destructor closes the log file. Any ErrorStreamCapture bound to
    /// this Printer must be destroyed first.
    class Printer {
    public:
        explicit Printer(const PrintPolicy& policy, std::ostream& console = std::cout)
            : m_policy(policy)
            , m_console(&console)
            , m_channel(policy)
            , m_shutdown(false)
        {
            if (m_policy.logToFile()) {
                LogDirectory::prepare(m_policy);
                m_channel.ensureCurrent(true);
            }
        }

        ~Printer() {
            shutdown();
        }

        Printer(const Printer&) = delete;
        Printer& operator=(const Printer&) = delete;

        /// Join `parts` with the separator, add the terminator, then write to
        /// the console and the log file.
        void emit(Severity severity, const std::vector<std::string>& parts,
                  const PrintOptions& options = PrintOptions()) {
            std::string message = detail::joinParts(parts, options.separator());
            message += options.terminator();
            std::ostream* target = options.stream();
            bool flushNow = options.flushOr(flushesByDefault(severity));

            std::lock_guard<std::recursive_mutex> lock(m_mutex);
            if (target) {
                writeConsole(*target, message, flushNow);
                return;
            }
            if (m_policy.logToConsole()) {
                if (m_policy.useConsoleColors()) {
                    const ColorTable& colors = m_policy.colors();
                    writeConsole(*m_console, colorize(message, colors.get(severity), colors.reset()), flushNow);
                } else {
                    writeConsole(*m_console, message, flushNow);
                }
            }
            if (m_policy.logToFile()) {
                appendToFile(message, severity);
            }
        }

        template<typename... Args>
        void operator()(const Args&... args) {
            emit(Severity::Normal, stringify(args...));
        }

        template<typename... Args>
        void operator()(const PrintOptions& options, const Args&... args) {
            emit(Severity::Normal, stringify(args...), options);
        }

        template<typename... Args>
        void info(const Args&... args) {
            emit(Severity::Info, stringify(args...));
        }

        template<typename... Args>
        void info(const PrintOptions& options, const Args&... args) {
            emit(Severity::Info, stringify(args...), options);
        }

        template<typename... Args>
        void success(const Args&... args) {
            emit(Severity::Success, stringify(args...));
        }

        template<typename... Args>
        void success(const PrintOptions& options, const Args&... args) {
            emit(Severity::Success, stringify(args...), options);
        }

        template<typename... Args>
        void warning(const Args&... args) {
            emit(Severity::Warning, stringify(args...));
        }

        template<typename... Args>
        void warning(const PrintOptions& options, const Args&... args) {
            emit(Severity::Warning, stringify(args...), options);
        }

        template<typename... Args>
        void error(const Args&... args) {
            emit(Severity::Error, stringify(args...));
        }

        template<typename... Args>
        void error(const PrintOptions& options, const Args&... args) {
            emit(Severity::Error, stringify(args...), options);
        }

        template<typename... Args>
        void debug(const Args&... args) {
            emit(Severity::Debug, stringify(args...));
        }

        template<typename... Args>
        void debug(const PrintOptions& options, const Args&... args) {
            emit(Severity::Debug, stringify(args...), options);
        }

        template<typename... Args>
        void critical(const Args&... args) {
            emit(Severity::Critical, stringify(args...));
        }

        template<typename... Args>
        void critical(const PrintOptions& options, const Args&... args) {
            emit(Severity::Critical, stringify(args...), options);
        }

        /// Flush the console stream. The log file is flushed after every write.
        void flush() {
            std::lock_guard<std::recursive_mutex> lock(m_mutex);
            writeConsole(*m_console, std::string(), true);
        }

        /// Close the log file. Later calls still reach the console but no
        /// longer touch the filesystem. Idempotent.
        void shutdown() {
            std::lock_guard<std::recursive_mutex> lock(m_mutex);
            m_shutdown = true;
            m_channel.close();
        }

        const PrintPolicy& policy() const { return m_policy; }

        /// Path of the open log file, empty when none is open.
        std::string currentLogPath() const {
            std::lock_guard<std::recursive_mutex> lock(m_mutex);
            return m_channel.currentPath();
        }

        /// Wrap `message` in a color escape and reset. A leading '\r' stays in
        /// front of the escape so the terminal still returns the cursor.
        static std::string colorize(const std::string& message, const std::string& color,
                                    const std::string& reset) {
            std::string result;
            result.reserve(message.size() + color.size() + reset.size());
            if (!message.empty() && message[0] == '\r') {
                result += '\r';
                result += color;
                result.append(message, 1, std::string::npos);
            } else {
                result += color;
                result += message;
            }
            result += reset;
            return result;
        }

    private:
        friend class ErrorStreamCapture;

        template<typename... Args>
        static std::vector<std::string> stringify(const Args&... args) {
            return std::vector<std::string>{detail::toString(args)...};
        }

        static void writeConsole(std::ostream& stream, const std::string& text, bool flushNow) {
            try {
                if (!text.empty()) {
                    stream.write(text.data(), static_cast<std::streamsize>(text.size()));
                }
                if (flushNow) stream.flush();
                if (!stream) stream.clear();
            } catch (const std::exception&) {
                // Console output is best-effort; a later call tries again.
                stream.clear();
            }
        }

        /// Caller holds m_mutex.
        void appendToFile(const std::string& text, Severity severity) {
            if (m_shutdown) return;
            try {
                m_channel.append(text, m_policy.tagFor(severity));
            } catch (const std::exception& ex) {
                std::fprintf(stderr, "Printer: dropped %s log line: %s\n",
                             getSeverityString(severity), ex.what());
            }
        }

        PrintPolicy m_policy;
        std::ostream* m_console;
        RotatingFileChannel m_channel;
        bool m_shutdown;
        mutable std::recursive_mutex m_mutex;
    };

} // namespace printlog

#endif // PRINT_LOG_PRINTER_HPP
