#ifndef PRINT_LOG_ENCODING_HPP
#define PRINT_LOG_ENCODING_HPP

#include <cstddef>
#include <string>

namespace printlog {

    /// What to do with bytes that are not valid UTF-8 when writing to the
    /// log file. Log files are always UTF-8.
    enum class EncodingErrors {
        Strict,   ///< drop the whole write
        Replace,  ///< substitute U+FFFD for each invalid byte
        Ignore    ///< drop the invalid bytes
    };

    inline const char* getEncodingErrorsString(EncodingErrors mode) {
        switch (mode) {
            case EncodingErrors::Strict:  return "strict";
            case EncodingErrors::Replace: return "replace";
            case EncodingErrors::Ignore:  return "ignore";
            default: return "unknown";
        }
    }

namespace detail {
    inline bool isContinuation(unsigned char c) {
        return (c & 0xC0) == 0x80;
    }

    /// Length of the well-formed UTF-8 sequence starting at text[pos],
    /// or 0 if the bytes there do not form one.
    inline std::size_t utf8SequenceLength(const std::string& text, std::size_t pos) {
        const unsigned char lead = static_cast<unsigned char>(text[pos]);
        const std::size_t remaining = text.size() - pos;
        if (lead < 0x80) return 1;

        std::size_t len = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            len = 2;
        } else if (lead == 0xE0) {
            len = 3; lo = 0xA0;
        } else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
            len = 3;
        } else if (lead == 0xED) {
            len = 3; hi = 0x9F;
        } else if (lead == 0xF0) {
            len = 4; lo = 0x90;
        } else if (lead >= 0xF1 && lead <= 0xF3) {
            len = 4;
        } else if (lead == 0xF4) {
            len = 4; hi = 0x8F;
        } else {
            return 0;
        }

        if (remaining < len) return 0;
        const unsigned char second = static_cast<unsigned char>(text[pos + 1]);
        if (second < lo || second > hi) return 0;
        for (std::size_t i = 2; i < len; ++i) {
            if (!isContinuation(static_cast<unsigned char>(text[pos + i]))) return 0;
        }
        return len;
    }
} // namespace detail

    inline bool isValidUtf8(const std::string& text) {
        std::size_t pos = 0;
        while (pos < text.size()) {
            std::size_t len = detail::utf8SequenceLength(text, pos);
            if (len == 0) return false;
            pos += len;
        }
        return true;
    }

    /// Apply the encoding-error strategy to `text` in place.
    /// Returns false when the text must not be written at all.
    inline bool sanitizeUtf8(std::string& text, EncodingErrors mode) {
        if (isValidUtf8(text)) return true;
        if (mode == EncodingErrors::Strict) return false;

        static const char kReplacement[] = "\xEF\xBF\xBD";
        std::string result;
        result.reserve(text.size() + 8);
        std::size_t pos = 0;
        while (pos < text.size()) {
            std::size_t len = detail::utf8SequenceLength(text, pos);
            if (len == 0) {
                if (mode == EncodingErrors::Replace) result += kReplacement;
                ++pos;
            } else {
                result.append(text, pos, len);
                pos += len;
            }
        }
        text.swap(result);
        return true;
    }

} // namespace printlog

#endif // PRINT_LOG_ENCODING_HPP
