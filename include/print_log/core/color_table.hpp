#ifndef PRINT_LOG_COLOR_TABLE_HPP
#define PRINT_LOG_COLOR_TABLE_HPP

#include "severity.hpp"
#include <map>
#include <string>

namespace printlog {

    /// Named ANSI escape sequences keyed by color key ("info", "error", ...)
    /// plus "reset". Looking up a key that is not present yields an empty
    /// string, so a partial table simply leaves those severities uncolored.
    class ColorTable {
    public:
        ColorTable() {}

        static ColorTable defaults() {
            ColorTable table;
            table.set("normal", "\033[37m");
            table.set("info", "\033[34m");
            table.set("error", "\033[31m");
            table.set("warning", "\033[33m");
            table.set("success", "\033[32m");
            table.set("debug", "\033[36m");
            table.set("critical", "\033[41m\033[37m");
            table.set("reset", "\033[0m");
            return table;
        }

        ColorTable& set(const std::string& key, const std::string& code) {
            m_codes[key] = code;
            return *this;
        }

        const std::string& get(const std::string& key) const {
            std::map<std::string, std::string>::const_iterator it = m_codes.find(key);
            if (it == m_codes.end()) return emptyCode();
            return it->second;
        }

        const std::string& get(Severity severity) const { return get(colorKey(severity)); }
        const std::string& reset() const { return get("reset"); }

        bool contains(const std::string& key) const { return m_codes.count(key) != 0; }
        std::size_t size() const { return m_codes.size(); }

    private:
        static const std::string& emptyCode() {
            static const std::string s_empty;
            return s_empty;
        }

        std::map<std::string, std::string> m_codes;
    };

} // namespace printlog

#endif // PRINT_LOG_COLOR_TABLE_HPP
