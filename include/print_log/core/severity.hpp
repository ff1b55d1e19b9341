#ifndef PRINT_LOG_SEVERITY_HPP
#define PRINT_LOG_SEVERITY_HPP

#include <cstddef>

namespace printlog {
    enum class Severity {
        Normal,
        Info,
        Success,
        Warning,
        Error,
        Debug,
        Critical
    };

    /// Number of distinct tag slots. Normal shares the Info slot.
    static const std::size_t kTagSlotCount = 6;

    inline std::size_t tagSlot(Severity severity) {
        switch (severity) {
            case Severity::Normal:   return 0;
            case Severity::Info:     return 0;
            case Severity::Success:  return 1;
            case Severity::Warning:  return 2;
            case Severity::Error:    return 3;
            case Severity::Debug:    return 4;
            case Severity::Critical: return 5;
            default: return 0;
        }
    }

    /// Key used to look the severity up in a ColorTable.
    inline const char *colorKey(Severity severity) {
        switch (severity) {
            case Severity::Normal:   return "normal";
            case Severity::Info:     return "info";
            case Severity::Success:  return "success";
            case Severity::Warning:  return "warning";
            case Severity::Error:    return "error";
            case Severity::Debug:    return "debug";
            case Severity::Critical: return "critical";
            default: return "normal";
        }
    }

    inline const char *getSeverityString(Severity severity) {
        switch (severity) {
            case Severity::Normal:   return "NORMAL";
            case Severity::Info:     return "INFO";
            case Severity::Success:  return "SUCCESS";
            case Severity::Warning:  return "WARNING";
            case Severity::Error:    return "ERROR";
            case Severity::Debug:    return "DEBUG";
            case Severity::Critical: return "CRITICAL";
            default: return "UNKNOWN";
        }
    }

    /// Error and critical output reaches the console immediately by default.
    inline bool flushesByDefault(Severity severity) {
        return severity == Severity::Error || severity == Severity::Critical;
    }
} // namespace printlog

#endif // PRINT_LOG_SEVERITY_HPP
