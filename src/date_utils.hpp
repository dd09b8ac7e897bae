#pragma once

#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Calendar dates as YYYYMMDD ints, with day arithmetic via a day number
// counted from 1970-01-01 (proleptic Gregorian).
// ---------------------------------------------------------------------------
namespace date_utils {

inline bool is_leap_year(int y) {
    return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
}

inline int days_in_month(int y, int m) {
    static constexpr int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap_year(y)) return 29;
    return DAYS[m - 1];
}

inline bool is_valid_date(int yyyymmdd) {
    int y = yyyymmdd / 10000;
    int m = (yyyymmdd / 100) % 100;
    int d = yyyymmdd % 100;
    if (yyyymmdd <= 0 || y < 1 || m < 1 || m > 12) return false;
    return d >= 1 && d <= days_in_month(y, m);
}

// Days since 1970-01-01 for a YYYYMMDD date.
inline int64_t to_day_number(int yyyymmdd) {
    if (!is_valid_date(yyyymmdd)) {
        throw std::invalid_argument("Invalid calendar date: " + std::to_string(yyyymmdd));
    }
    int64_t y = yyyymmdd / 10000;
    int64_t m = (yyyymmdd / 100) % 100;
    int64_t d = yyyymmdd % 100;

    // Shift the year to start in March so the leap day is last.
    y -= (m <= 2) ? 1 : 0;
    int64_t era = (y >= 0 ? y : y - 399) / 400;
    int64_t yoe = y - era * 400;
    int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

inline int from_day_number(int64_t days) {
    days += 719468;
    int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    int64_t doe = days - era * 146097;
    int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    int64_t y = yoe + era * 400;
    int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    int64_t mp = (5 * doy + 2) / 153;
    int64_t d = doy - (153 * mp + 2) / 5 + 1;
    int64_t m = mp < 10 ? mp + 3 : mp - 9;
    y += (m <= 2) ? 1 : 0;
    return static_cast<int>(y * 10000 + m * 100 + d);
}

// Whole days from `earlier` to `later` (negative when `later` precedes `earlier`).
inline int64_t days_between(int earlier, int later) {
    return to_day_number(later) - to_day_number(earlier);
}

inline int add_days(int yyyymmdd, int64_t n) {
    return from_day_number(to_day_number(yyyymmdd) + n);
}

// Accepts "YYYY-MM-DD" or "YYYYMMDD".
inline int parse_date(const std::string& text) {
    std::string digits;
    if (text.size() == 10 && text[4] == '-' && text[7] == '-') {
        digits = text.substr(0, 4) + text.substr(5, 2) + text.substr(8, 2);
    } else if (text.size() == 8) {
        digits = text;
    } else {
        throw std::invalid_argument("Unrecognized date format: '" + text + "'");
    }
    for (char c : digits) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Unrecognized date format: '" + text + "'");
        }
    }
    int value = std::stoi(digits);
    if (!is_valid_date(value)) {
        throw std::invalid_argument("Invalid calendar date: '" + text + "'");
    }
    return value;
}

inline std::string format_date(int yyyymmdd) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d",
                  yyyymmdd / 10000, (yyyymmdd / 100) % 100, yyyymmdd % 100);
    return buf;
}

}  // namespace date_utils
