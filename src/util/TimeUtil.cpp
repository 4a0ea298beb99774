#include "util/TimeUtil.h"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace TimeUtil {

namespace {

time_t TimegmPortable(std::tm* tm) {
#ifdef _WIN32
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

bool ParseInt(const std::string& text, size_t start, size_t len, int* out) {
    if (start + len > text.size()) {
        return false;
    }
    int value = 0;
    for (size_t i = 0; i < len; ++i) {
        char c = text[start + i];
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    *out = value;
    return true;
}

std::string FormatIsoDate(int year, int month, int day) {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << year
        << "-" << std::setfill('0') << std::setw(2) << month
        << "-" << std::setfill('0') << std::setw(2) << day;
    return oss.str();
}

} // namespace

int64_t NowTs() {
    return std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
}

std::tm LocalTime(time_t ts) {
    std::tm out{};
#ifdef _WIN32
    localtime_s(&out, &ts);
#else
    localtime_r(&ts, &out);
#endif
    return out;
}

std::string FormatTimestamp(time_t ts) {
    std::tm tm = LocalTime(ts);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::string TodayDate() {
    std::tm tm = LocalTime(static_cast<time_t>(NowTs()));
    return FormatIsoDate(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
}

bool ParseDate(const std::string& text, int* year, int* month, int* day) {
    if (text.size() != 10) {
        return false;
    }
    int y = 0, m = 0, d = 0;
    if (!ParseInt(text, 0, 4, &y) || text[4] != '-' ||
        !ParseInt(text, 5, 2, &m) || text[7] != '-' ||
        !ParseInt(text, 8, 2, &d)) {
        return false;
    }
    if (m < 1 || m > 12 || d < 1 || d > DaysInMonth(y, m)) {
        return false;
    }
    *year = y;
    *month = m;
    *day = d;
    return true;
}

bool IsValidDate(const std::string& text) {
    int y = 0, m = 0, d = 0;
    return ParseDate(text, &y, &m, &d);
}

std::string FormatDisplayDate(const std::string& date_iso) {
    int y = 0, m = 0, d = 0;
    if (!ParseDate(date_iso, &y, &m, &d)) {
        return date_iso;
    }
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << d
        << "/" << std::setfill('0') << std::setw(2) << m
        << "/" << std::setfill('0') << std::setw(4) << y;
    return oss.str();
}

std::string AddDays(const std::string& date_iso, int days) {
    int y = 0, m = 0, d = 0;
    if (!ParseDate(date_iso, &y, &m, &d)) {
        return date_iso;
    }
    // Noon UTC keeps the arithmetic clear of any DST edge.
    std::tm tm{};
    tm.tm_year = y - 1900;
    tm.tm_mon = m - 1;
    tm.tm_mday = d;
    tm.tm_hour = 12;
    time_t ts = TimegmPortable(&tm);
    ts += static_cast<time_t>(days) * 24 * 60 * 60;
    std::tm out{};
#ifdef _WIN32
    gmtime_s(&out, &ts);
#else
    gmtime_r(&ts, &out);
#endif
    return FormatIsoDate(out.tm_year + 1900, out.tm_mon + 1, out.tm_mday);
}

uint32_t DateSeed(const std::string& date_iso) {
    int y = 0, m = 0, d = 0;
    if (!ParseDate(date_iso, &y, &m, &d)) {
        return 0;
    }
    return static_cast<uint32_t>(y * 10000 + m * 100 + d);
}

int DaysInMonth(int year, int month) {
    static const int kDays[] = { 31,28,31,30,31,30,31,31,30,31,30,31 };
    if (month < 1 || month > 12) {
        return 0;
    }
    int days = kDays[month - 1];
    bool leap = (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
    if (month == 2 && leap) {
        days = 29;
    }
    return days;
}

} // namespace TimeUtil
