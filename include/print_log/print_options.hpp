#ifndef PRINT_LOG_PRINT_OPTIONS_HPP
#define PRINT_LOG_PRINT_OPTIONS_HPP

#include <ostream>
#include <string>

namespace printlog {

    /// Per-call overrides, passed as the first argument of any print call:
    /// @code
    ///   print(printlog::PrintOptions().end("..."), "Loading modules");
    ///   print.info(printlog::PrintOptions().sep(", "), "a", "b", "c");
    ///   print(printlog::PrintOptions().to(report), "goes to report only");
    /// @endcode
    ///
    /// An explicit stream sends the message there instead of the console,
    /// uncolored, and skips the log file.
    class PrintOptions {
    public:
        PrintOptions()
            : m_separator(" ")
            , m_terminator("\n")
            , m_stream(nullptr)
            , m_flushSet(false)
            , m_flush(false) {}

        PrintOptions& sep(const std::string& separator) {
            m_separator = separator;
            return *this;
        }

        PrintOptions& end(const std::string& terminator) {
            m_terminator = terminator;
            return *this;
        }

        PrintOptions& to(std::ostream& stream) {
            m_stream = &stream;
            return *this;
        }

        PrintOptions& flush(bool enable = true) {
            m_flushSet = true;
            m_flush = enable;
            return *this;
        }

        const std::string& separator() const { return m_separator; }
        const std::string& terminator() const { return m_terminator; }
        std::ostream* stream() const { return m_stream; }

        /// The explicit flush flag, or `fallback` when none was given.
        bool flushOr(bool fallback) const { return m_flushSet ? m_flush : fallback; }

    private:
        std::string m_separator;
        std::string m_terminator;
        std::ostream* m_stream;
        bool m_flushSet;
        bool m_flush;
    };

} // namespace printlog

#endif // PRINT_LOG_PRINT_OPTIONS_HPP
