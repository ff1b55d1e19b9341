#ifndef PRINT_LOG_TIME_ZONE_HPP
#define PRINT_LOG_TIME_ZONE_HPP

#include "log_common.hpp"
#include <chrono>
#include <ctime>
#include <string>

namespace printlog {

    /// A calendar date with no time-of-day or zone attached.
    struct CivilDate {
        int year;
        int month;  // 1..12
        int day;    // 1..31

        CivilDate() : year(1970), month(1), day(1) {}
        CivilDate(int y, int m, int d) : year(y), month(m), day(d) {}

        /// Days since 1970-01-01 in the proleptic Gregorian calendar.
        long daysSinceEpoch() const {
            long y = year - (month <= 2 ? 1 : 0);
            long era = (y >= 0 ? y : y - 399) / 400;
            long yoe = y - era * 400;
            long mp = (month + 9) % 12;
            long doy = (153 * mp + 2) / 5 + day - 1;
            long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + doe - 719468;
        }

        static CivilDate fromDaysSinceEpoch(long days) {
            days += 719468;
            long era = (days >= 0 ? days : days - 146096) / 146097;
            long doe = days - era * 146097;
            long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            long mp = (5 * doy + 2) / 153;
            int d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
            int m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
            int y = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
            return CivilDate(y, m, d);
        }

        CivilDate addDays(long days) const {
            return fromDaysSinceEpoch(daysSinceEpoch() + days);
        }

        /// Broken-down time at midnight of this date, suitable for strftime.
        std::tm toTm() const {
            std::tm tmBuf = std::tm();
            tmBuf.tm_year = year - 1900;
            tmBuf.tm_mon = month - 1;
            tmBuf.tm_mday = day;
            long days = daysSinceEpoch();
            // 1970-01-01 was a Thursday.
            tmBuf.tm_wday = static_cast<int>(((days % 7) + 11) % 7);
            tmBuf.tm_yday = static_cast<int>(days - CivilDate(year, 1, 1).daysSinceEpoch());
            tmBuf.tm_isdst = -1;
            return tmBuf;
        }

        std::string format(const std::string& pattern) const {
            return detail::formatCalendar(toTm(), pattern);
        }

        bool operator==(const CivilDate& other) const {
            return year == other.year && month == other.month && day == other.day;
        }
        bool operator!=(const CivilDate& other) const { return !(*this == other); }
        bool operator<(const CivilDate& other) const {
            if (year != other.year) return year < other.year;
            if (month != other.month) return month < other.month;
            return day < other.day;
        }
    };

    /// The zone in which "today" and line timestamps are computed.
    /// Either the process's local zone or a fixed offset from UTC.
    class TimeZone {
    public:
        static TimeZone utc() {
            return TimeZone(Kind::Fixed, std::chrono::minutes(0));
        }

        static TimeZone local() {
            return TimeZone(Kind::Local, std::chrono::minutes(0));
        }

        /// Fixed offset east of UTC, e.g. `fixed(std::chrono::hours(-5))`.
        static TimeZone fixed(std::chrono::minutes offset) {
            return TimeZone(Kind::Fixed, offset);
        }

        bool isLocal() const { return m_kind == Kind::Local; }
        std::chrono::minutes offset() const { return m_offset; }

        std::tm toCalendar(std::chrono::system_clock::time_point time) const {
            std::time_t t = std::chrono::system_clock::to_time_t(time);
            std::tm tmBuf = std::tm();
            if (m_kind == Kind::Local) {
#ifdef _MSC_VER
                localtime_s(&tmBuf, &t);
#else
                localtime_r(&t, &tmBuf);
#endif
            } else {
                t += static_cast<std::time_t>(m_offset.count()) * 60;
#ifdef _MSC_VER
                gmtime_s(&tmBuf, &t);
#else
                gmtime_r(&t, &tmBuf);
#endif
            }
            return tmBuf;
        }

        CivilDate dateOf(std::chrono::system_clock::time_point time) const {
            std::tm tmBuf = toCalendar(time);
            return CivilDate(tmBuf.tm_year + 1900, tmBuf.tm_mon + 1, tmBuf.tm_mday);
        }

        std::string format(std::chrono::system_clock::time_point time, const std::string& pattern) const {
            return detail::formatCalendar(toCalendar(time), pattern);
        }

    private:
        enum class Kind { Local, Fixed };

        TimeZone(Kind kind, std::chrono::minutes offset) : m_kind(kind), m_offset(offset) {}

        Kind m_kind;
        std::chrono::minutes m_offset;
    };

} // namespace printlog

#endif // PRINT_LOG_TIME_ZONE_HPP
