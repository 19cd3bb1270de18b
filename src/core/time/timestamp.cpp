#include "core/time/timestamp.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <ctime>

namespace runvault::core::time {

using core::errors::ErrorCategory;
using core::errors::StoreError;

namespace {

std::tm to_utc_tm(const TimePoint point) {
    const std::time_t seconds = Clock::to_time_t(point);
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    return tm;
}

bool read_digits(const std::string& text, std::size_t& pos, const std::size_t count,
                 int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const char c = text[pos + i];
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expect_char(const std::string& text, std::size_t& pos, const char expected) {
    if (pos >= text.size() || text[pos] != expected) {
        return false;
    }
    ++pos;
    return true;
}

StoreError invalid_timestamp(const std::string& text) {
    return StoreError{ErrorCategory::Input, "Invalid RFC 3339 timestamp: " + text,
                      "invalid_timestamp"};
}

}  // namespace

std::string format_rfc3339(const TimePoint point) {
    const auto since_epoch = point.time_since_epoch();
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count() % 1000;
    if (millis < 0) {
        millis += 1000;
    }
    const std::tm tm = to_utc_tm(point);
    char buffer[40];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min,
                  tm.tm_sec, static_cast<int>(millis));
    return buffer;
}

core::errors::Result<TimePoint> parse_rfc3339(const std::string& text) {
    std::size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!read_digits(text, pos, 4, year) || !expect_char(text, pos, '-') ||
        !read_digits(text, pos, 2, month) || !expect_char(text, pos, '-') ||
        !read_digits(text, pos, 2, day)) {
        return invalid_timestamp(text);
    }
    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ')) {
        return invalid_timestamp(text);
    }
    ++pos;
    if (!read_digits(text, pos, 2, hour) || !expect_char(text, pos, ':') ||
        !read_digits(text, pos, 2, minute) || !expect_char(text, pos, ':') ||
        !read_digits(text, pos, 2, second)) {
        return invalid_timestamp(text);
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
        second > 60) {
        return invalid_timestamp(text);
    }

    std::int64_t nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        std::size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
            if (digits < 9) {
                nanos = nanos * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return invalid_timestamp(text);
        }
        for (std::size_t i = digits; i < 9; ++i) {
            nanos *= 10;
        }
    }

    int offset_seconds = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        const int sign = text[pos] == '-' ? -1 : 1;
        ++pos;
        int off_hours = 0, off_minutes = 0;
        if (!read_digits(text, pos, 2, off_hours) || !expect_char(text, pos, ':') ||
            !read_digits(text, pos, 2, off_minutes)) {
            return invalid_timestamp(text);
        }
        offset_seconds = sign * (off_hours * 3600 + off_minutes * 60);
    } else {
        return invalid_timestamp(text);
    }
    if (pos != text.size()) {
        return invalid_timestamp(text);
    }

    if (year < 1970) {
        return TimePoint{};
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    const std::time_t seconds = timegm(&tm) - offset_seconds;
    if (seconds < 0) {
        return TimePoint{};
    }

    return TimePoint{std::chrono::duration_cast<Clock::duration>(
        std::chrono::seconds(seconds) + std::chrono::nanoseconds(nanos))};
}

std::string utc_month(const TimePoint point) {
    const std::tm tm = to_utc_tm(point);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d", tm.tm_year + 1900, tm.tm_mon + 1);
    return buffer;
}

std::string utc_date(const TimePoint point) {
    const std::tm tm = to_utc_tm(point);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", tm.tm_year + 1900,
                  tm.tm_mon + 1, tm.tm_mday);
    return buffer;
}

std::string format_utc(const TimePoint point, const char* pattern) {
    const std::tm tm = to_utc_tm(point);
    char buffer[64];
    const std::size_t written = std::strftime(buffer, sizeof(buffer), pattern, &tm);
    return std::string(buffer, written);
}

}  // namespace runvault::core::time
