#pragma once
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <fmt/format.h>

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using NowFn     = std::function<TimePoint()>;

namespace TimeUtils {

inline NowFn systemNow() {
    return []{ return Clock::now(); };
}

inline int parseDigits(std::string_view s) {
    int value = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return -1;
        value = value * 10 + (c - '0');
    }
    return value;
}

// Days since 1970-01-01 for a proleptic Gregorian date (Howard Hinnant's algorithm)
inline int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

/**
 * Parse "YYYY-MM-DDTHH:MM:SS[.fraction][Z|+HH:MM|-HH:MM]".
 * Fractions beyond microseconds are truncated.
 * @return std::nullopt when the string is not a usable timestamp
 */
inline std::optional<TimePoint> parseIso8601(std::string_view str) {
    if (str.size() < 19 || str[4] != '-' || str[7] != '-' ||
        (str[10] != 'T' && str[10] != ' ') || str[13] != ':' || str[16] != ':') {
        return std::nullopt;
    }
    const int year   = parseDigits(str.substr(0, 4));
    const int month  = parseDigits(str.substr(5, 2));
    const int day    = parseDigits(str.substr(8, 2));
    const int hour   = parseDigits(str.substr(11, 2));
    const int minute = parseDigits(str.substr(14, 2));
    const int second = parseDigits(str.substr(17, 2));
    if (year < 0 || month < 1 || month > 12 || day < 1 || day > 31 ||
        hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 60) {
        return std::nullopt;
    }

    size_t pos = 19;
    int64_t micros = 0;
    if (pos < str.size() && str[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < str.size() && str[pos] >= '0' && str[pos] <= '9') {
            if (digits < 6) {
                micros = micros * 10 + (str[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        while (digits < 6) { micros *= 10; ++digits; }
    }

    int64_t offsetSeconds = 0;
    if (pos < str.size()) {
        const char tz = str[pos];
        if (tz == 'Z' || tz == 'z') {
            ++pos;
        } else if ((tz == '+' || tz == '-') && str.size() >= pos + 6 && str[pos + 3] == ':') {
            const int oh = parseDigits(str.substr(pos + 1, 2));
            const int om = parseDigits(str.substr(pos + 4, 2));
            if (oh < 0 || om < 0) return std::nullopt;
            offsetSeconds = (oh * 3600 + om * 60) * (tz == '+' ? 1 : -1);
            pos += 6;
        } else {
            return std::nullopt;
        }
    }
    if (pos != str.size()) return std::nullopt;

    const int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second - offsetSeconds;
    return TimePoint(std::chrono::duration_cast<Clock::duration>(
        std::chrono::seconds(secs) + std::chrono::microseconds(micros)));
}

/// UTC, millisecond precision: "2025-01-18T14:00:00.000Z"
inline std::string formatIso8601(TimePoint tp) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    int64_t secs = ms / 1000;
    int64_t millis = ms % 1000;
    if (millis < 0) { millis += 1000; --secs; }
    const std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
}

inline int64_t toEpochMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace TimeUtils
