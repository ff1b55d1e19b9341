#ifndef PRINT_LOG_ERROR_STREAM_CAPTURE_HPP
#define PRINT_LOG_ERROR_STREAM_CAPTURE_HPP

#include "../printer.hpp"
#include <mutex>
#include <ostream>
#include <streambuf>
#include <string>

namespace printlog {

    /// Stream buffer that sits in front of an error stream (normally
    /// std::cerr). Every byte still reaches the original buffer unchanged;
    /// complete lines are also appended to the Printer's log file under the
    /// error tag.
    ///
    /// The host installs and removes it explicitly:
    /// @code
    ///   printlog::Printer print(policy);
    ///   printlog::ErrorStreamCapture capture(print, std::cerr);
    ///   capture.install();      // no-op unless policy.captureStderr()
    ///   ...
    ///   capture.restore();      // or let the destructor do it
    /// @endcode
    ///
    /// Partial lines are held back until a '\n' arrives or flush() is
    /// called. Stream-level flushes (std::flush, std::endl, the unitbuf flag
    /// of std::cerr) only flush the original buffer; they do not force a
    /// partial line into the file.
    ///
    /// Must be destroyed before the Printer it refers to.
    class ErrorStreamCapture : public std::streambuf {
    public:
        ErrorStreamCapture(Printer& printer, std::ostream& target)
            : m_printer(printer)
            , m_target(target)
            , m_original(target.rdbuf())
            , m_installed(false) {}

        ~ErrorStreamCapture() {
            restore();
        }

        ErrorStreamCapture(const ErrorStreamCapture&) = delete;
        ErrorStreamCapture& operator=(const ErrorStreamCapture&) = delete;

        /// Route the target stream through this buffer. Returns false, and
        /// changes nothing, when the policy disables error capture.
        bool install() {
            if (!m_printer.policy().captureStderr()) return false;
            if (m_installed) return true;
            m_original = m_target.rdbuf();
            m_target.rdbuf(this);
            m_installed = true;
            return true;
        }

        /// Flush any held-back text and give the target its original
        /// buffer back. Idempotent.
        void restore() {
            if (!m_installed) return;
            flush();
            if (m_target.rdbuf() == this) {
                m_target.rdbuf(m_original);
            }
            m_installed = false;
        }

        bool isInstalled() const { return m_installed; }

        void write(const std::string& message) {
            if (message.empty()) return;
            if (m_original) {
                m_original->sputn(message.data(), static_cast<std::streamsize>(message.size()));
            }

            std::lock_guard<std::recursive_mutex> lock(m_printer.m_mutex);
            m_pending += message;
            std::string::size_type nl;
            while ((nl = m_pending.find('\n')) != std::string::npos) {
                std::string line = m_pending.substr(0, nl + 1);
                m_pending.erase(0, nl + 1);
                forward(line);
            }
        }

        /// Flush the original buffer and push any partial line to the file.
        void flush() {
            if (m_original) m_original->pubsync();

            std::lock_guard<std::recursive_mutex> lock(m_printer.m_mutex);
            if (!m_pending.empty()) {
                std::string rest;
                rest.swap(m_pending);
                forward(rest);
            }
        }

        /// Text received but not yet written to the file.
        std::string pending() const {
            std::lock_guard<std::recursive_mutex> lock(m_printer.m_mutex);
            return m_pending;
        }

    protected:
        int_type overflow(int_type ch) override {
            if (traits_type::eq_int_type(ch, traits_type::eof())) {
                return traits_type::not_eof(ch);
            }
            write(std::string(1, traits_type::to_char_type(ch)));
            return ch;
        }

        std::streamsize xsputn(const char* s, std::streamsize n) override {
            if (n > 0) write(std::string(s, static_cast<std::string::size_type>(n)));
            return n;
        }

        int sync() override {
            if (m_original) return m_original->pubsync();
            return 0;
        }

    private:
        /// Caller holds the Printer's mutex.
        void forward(const std::string& text) {
            if (m_printer.m_policy.logToFile()) {
                m_printer.appendToFile(text, Severity::Error);
            }
        }

        Printer& m_printer;
        std::ostream& m_target;
        std::streambuf* m_original;
        std::string m_pending;
        bool m_installed;
    };

} // namespace printlog

#endif // PRINT_LOG_ERROR_STREAM_CAPTURE_HPP
