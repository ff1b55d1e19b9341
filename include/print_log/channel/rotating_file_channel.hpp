#ifndef PRINT_LOG_ROTATING_FILE_CHANNEL_HPP
#define PRINT_LOG_ROTATING_FILE_CHANNEL_HPP

#include "../core/print_policy.hpp"
#include "../core/encoding.hpp"
#include "../format/line_formatter.hpp"
#include <cstdint>
#include <cstdio>
#include <string>

#include <sys/types.h>
#include <sys/stat.h>
#ifdef _MSC_VER
#include <io.h>
#else
#include <unistd.h>
#endif

namespace printlog {
namespace detail {
    /// Size of the open file and whether it is a regular (seekable) file.
    inline bool statOpenFile(std::FILE* file, std::uint64_t& size, bool& regular) {
#ifdef _MSC_VER
        struct _stat64 st;
        if (_fstat64(_fileno(file), &st) != 0) return false;
#else
        struct stat st;
        if (fstat(fileno(file), &st) != 0) return false;
#endif
        size = static_cast<std::uint64_t>(st.st_size);
        regular = (st.st_mode & S_IFMT) == S_IFREG;
        return true;
    }

    /// Cut the file back to `size` bytes. The stream stays in append mode,
    /// so the next write lands at the new end.
    inline bool truncateOpenFile(std::FILE* file, std::uint64_t size) {
        if (std::fflush(file) != 0) return false;
#ifdef _MSC_VER
        if (_chsize_s(_fileno(file), static_cast<__int64>(size)) != 0) return false;
#else
        if (ftruncate(fileno(file), static_cast<off_t>(size)) != 0) return false;
#endif
        return std::fseek(file, 0, SEEK_END) == 0;
    }
} // namespace detail

    /// One log file per calendar day, always the file for "today" in the
    /// policy's zone.
    ///
    /// A message starting with '\r' truncates the file back to the last
    /// preamble written, so after a multi-line call only its final line is
    /// replaced, not the whole call. Targets that are not regular files
    /// cannot be truncated; there the '\r' is written through unchanged.
    ///
    /// Not synchronized: the owning Printer serializes every call.
    /// I/O failures never escape; a channel that cannot open its file
    /// drops appends until a later rotation attempt succeeds.
    class RotatingFileChannel {
    public:
        explicit RotatingFileChannel(const PrintPolicy& policy)
            : m_policy(policy)
        {
            m_state.file = nullptr;
            m_state.lastEntryOffset = 0;
            m_state.lineState = LineState::FreshLine;
            m_state.seekable = false;
        }

        ~RotatingFileChannel() {
            close();
        }

        RotatingFileChannel(const RotatingFileChannel&) = delete;
        RotatingFileChannel& operator=(const RotatingFileChannel&) = delete;

        /// Reopen when forced, when nothing is open, or when the date moved.
        /// Returns true if a file is open afterwards.
        bool ensureCurrent(bool force = false) {
            CivilDate today = m_policy.today();
            if (!force && m_state.file && today == m_state.date) return true;

            close();
            m_state.date = today;

            std::string path = m_policy.logFilePath(today);
            std::FILE* file = std::fopen(path.c_str(), "ab");
            if (!file) {
                if (path != m_failedPath) {
                    std::fprintf(stderr, "RotatingFileChannel: failed to open file: %s\n", path.c_str());
                    m_failedPath = path;
                }
                return false;
            }
            m_failedPath.clear();
            applyBuffering(file);

            std::uint64_t size = 0;
            bool regular = false;
            if (!detail::statOpenFile(file, size, regular)) {
                size = 0;
                regular = false;
            }

            m_state.file = file;
            m_state.path = path;
            m_state.lastEntryOffset = size;
            m_state.lineState = LineState::FreshLine;
            m_state.seekable = regular;
            return true;
        }

        /// Append `text` under `tag`. A single call is a single write.
        void append(const std::string& text, const std::string& tag) {
            if (text.empty()) return;
            if (!ensureCurrent()) return;

            std::string payload = text;
            if (!sanitizeUtf8(payload, m_policy.encodingErrors())) {
                std::fprintf(stderr, "RotatingFileChannel: dropped invalid UTF-8 text (errors=%s)\n",
                             getEncodingErrorsString(m_policy.encodingErrors()));
                return;
            }

            if (!payload.empty() && payload[0] == '\r' && m_state.seekable) {
                if (detail::truncateOpenFile(m_state.file, m_state.lastEntryOffset)) {
                    payload.erase(0, payload.find_first_not_of('\r'));
                    m_state.lineState = LineState::FreshLine;
                }
            }

            std::uint64_t endOffset = currentEndOffset();
            std::string stamp = m_policy.formatTimestamp(m_policy.now());
            FormattedBlock block = LineFormatter::format(
                payload, LineFormatter::preamble(stamp, tag), m_state.lineState);

            if (block.startsEntry) {
                m_state.lastEntryOffset = endOffset + block.entryOffset;
            }
            m_state.lineState = block.endState;

            if (block.bytes.empty()) return;
            std::size_t written = std::fwrite(block.bytes.data(), 1, block.bytes.size(), m_state.file);
            if (written != block.bytes.size() || std::fflush(m_state.file) != 0) {
                // The line is lost; let the next append try again.
                std::clearerr(m_state.file);
            }
        }

        /// Idempotent.
        void close() {
            if (m_state.file) {
                std::fclose(m_state.file);
                m_state.file = nullptr;
            }
            m_state.path.clear();
            m_state.lastEntryOffset = 0;
            m_state.lineState = LineState::FreshLine;
            m_state.seekable = false;
        }

        bool isOpen() const { return m_state.file != nullptr; }
        const std::string& currentPath() const { return m_state.path; }
        const CivilDate& currentDate() const { return m_state.date; }
        LineState lineState() const { return m_state.lineState; }
        /// False for pipes and devices, where overwrite falls back to append.
        bool isSeekable() const { return m_state.seekable; }
        std::uint64_t lastEntryOffset() const { return m_state.lastEntryOffset; }

    private:
        struct OpenFileState {
            CivilDate date;
            std::FILE* file;
            std::string path;
            std::uint64_t lastEntryOffset;
            LineState lineState;
            bool seekable;
        };

        void applyBuffering(std::FILE* file) {
            switch (m_policy.fileBuffering()) {
                case BufferMode::Unbuffered:
                    std::setvbuf(file, nullptr, _IONBF, 0);
                    break;
                case BufferMode::Line:
                    std::setvbuf(file, nullptr, _IOLBF, BUFSIZ);
                    break;
                case BufferMode::Full:
                    std::setvbuf(file, nullptr, _IOFBF, BUFSIZ);
                    break;
            }
        }

        // Every append ends with fflush, so the on-disk size is the end offset.
        std::uint64_t currentEndOffset() {
            std::uint64_t size = 0;
            bool regular = false;
            if (detail::statOpenFile(m_state.file, size, regular)) return size;
            return m_state.lastEntryOffset;
        }

        PrintPolicy m_policy;
        OpenFileState m_state;
        std::string m_failedPath;
    };

} // namespace printlog

#endif // PRINT_LOG_ROTATING_FILE_CHANNEL_HPP
