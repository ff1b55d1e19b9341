#ifndef PRINT_LOG_COMMON_HPP
#define PRINT_LOG_COMMON_HPP

#include <string>
#include <sstream>
#include <vector>
#include <ctime>

namespace printlog {
namespace detail {
    /// strftime into a std::string. An empty pattern yields an empty string;
    /// patterns that expand past 4 KiB are truncated to an empty string.
    inline std::string formatCalendar(const std::tm& tmBuf, const std::string& pattern) {
        if (pattern.empty()) return std::string();
        std::vector<char> buf(64);
        while (buf.size() <= 4096) {
            std::size_t n = std::strftime(buf.data(), buf.size(), pattern.c_str(), &tmBuf);
            if (n > 0) return std::string(buf.data(), n);
            buf.resize(buf.size() * 2);
        }
        return std::string();
    }

    template<typename T>
    std::string toString(const T& value) {
        std::ostringstream oss;
        oss << std::boolalpha << value;
        return oss.str();
    }

    inline std::string toString(const std::string& value) {
        return value;
    }

    inline std::string toString(const char* value) {
        return value ? std::string(value) : std::string("(null)");
    }

    inline std::string joinParts(const std::vector<std::string>& parts, const std::string& separator) {
        std::string result;
        for (std::size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) result += separator;
            result += parts[i];
        }
        return result;
    }

    /// Join a directory and a file name with a single separator.
    inline std::string joinPath(const std::string& dir, const std::string& name) {
        if (dir.empty()) return name;
        char last = dir[dir.size() - 1];
        if (last == '/' || last == '\\') return dir + name;
        return dir + "/" + name;
    }
} // namespace detail
} // namespace printlog

#endif // PRINT_LOG_COMMON_HPP
