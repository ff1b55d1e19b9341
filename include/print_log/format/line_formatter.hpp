#ifndef PRINT_LOG_LINE_FORMATTER_HPP
#define PRINT_LOG_LINE_FORMATTER_HPP

#include <cstddef>
#include <string>

namespace printlog {

    /// Where the file stands between two appends.
    enum class LineState {
        FreshLine,  ///< next byte starts a new entry and needs a preamble
        MidLine     ///< next byte continues an unterminated line
    };

    /// Bytes produced for one append, plus the bookkeeping the channel needs.
    struct FormattedBlock {
        std::string bytes;
        bool startsEntry;          ///< at least one preamble was injected
        std::size_t entryOffset;   ///< position of the last preamble in `bytes`
        LineState endState;
    };

    /// Turns raw text into the exact bytes appended to a log file.
    ///
    /// Every logical line that begins in FreshLine state gets the preamble
    /// `[<timestamp>] <tag> `. Text that does not end in '\n' leaves the
    /// state MidLine, so the next call continues the same line untagged:
    /// @code
    ///   format("Loading", p, FreshLine)  -> "[12:00:00] [INFO] Loading", MidLine
    ///   format("...Done!\n", p, MidLine) -> "...Done!\n", FreshLine
    /// @endcode
    class LineFormatter {
    public:
        static std::string preamble(const std::string& timestamp, const std::string& tag) {
            std::string result;
            result.reserve(timestamp.size() + tag.size() + 4);
            result += '[';
            result += timestamp;
            result += "] ";
            result += tag;
            result += ' ';
            return result;
        }

        static FormattedBlock format(const std::string& text, const std::string& preambleText,
                                     LineState state) {
            FormattedBlock block;
            block.startsEntry = false;
            block.entryOffset = 0;
            block.bytes.reserve(text.size() + preambleText.size() + 1);

            std::size_t pos = 0;
            while (true) {
                std::size_t nl = text.find('\n', pos);
                bool terminated = nl != std::string::npos;
                std::size_t segEnd = terminated ? nl : text.size();

                // Nothing follows the final terminator.
                if (!terminated && pos == segEnd && pos > 0) break;

                if (state == LineState::FreshLine) {
                    block.startsEntry = true;
                    block.entryOffset = block.bytes.size();
                    block.bytes += preambleText;
                    state = LineState::MidLine;
                }
                block.bytes.append(text, pos, segEnd - pos);

                if (!terminated) break;
                block.bytes += '\n';
                state = LineState::FreshLine;
                pos = nl + 1;
            }

            block.endState = state;
            return block;
        }
    };

} // namespace printlog

#endif // PRINT_LOG_LINE_FORMATTER_HPP
