// Payload types for the non-native primitives of the query language
#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace dynq {

// Decimal values carry an extended-precision binary float; the distinct type
// keeps overload resolution faithful to the decimal catalog entries.
struct decimal_t {
    long double v{0};
};
inline bool operator==(decimal_t a, decimal_t b){ return a.v == b.v; }
inline bool operator!=(decimal_t a, decimal_t b){ return a.v != b.v; }
inline bool operator<(decimal_t a, decimal_t b){ return a.v < b.v; }

// Durations and instants use 100ns ticks; instants count from 0001-01-01T00:00:00.
struct time_span {
    int64_t ticks{0};
    static constexpr int64_t ticks_per_millisecond = 10000;
    static constexpr int64_t ticks_per_second = ticks_per_millisecond * 1000;
    static constexpr int64_t ticks_per_minute = ticks_per_second * 60;
    static constexpr int64_t ticks_per_hour = ticks_per_minute * 60;
    static constexpr int64_t ticks_per_day = ticks_per_hour * 24;

    static time_span from_parts(int64_t days, int64_t hours, int64_t minutes, int64_t seconds, int64_t milliseconds=0);
    int days() const { return (int)(ticks / ticks_per_day); }
    int hours() const { return (int)((ticks / ticks_per_hour) % 24); }
    int minutes() const { return (int)((ticks / ticks_per_minute) % 60); }
    int seconds() const { return (int)((ticks / ticks_per_second) % 60); }
    int milliseconds() const { return (int)((ticks / ticks_per_millisecond) % 1000); }
    double total_days() const { return (double)ticks / ticks_per_day; }
    double total_hours() const { return (double)ticks / ticks_per_hour; }
    double total_minutes() const { return (double)ticks / ticks_per_minute; }
    double total_seconds() const { return (double)ticks / ticks_per_second; }
    double total_milliseconds() const { return (double)ticks / ticks_per_millisecond; }
    std::string to_string() const;
};
inline bool operator==(time_span a, time_span b){ return a.ticks == b.ticks; }
inline bool operator!=(time_span a, time_span b){ return a.ticks != b.ticks; }
inline bool operator<(time_span a, time_span b){ return a.ticks < b.ticks; }

struct date_time {
    int64_t ticks{0};
    static constexpr int64_t max_ticks = 3155378975999999999LL; // 9999-12-31T23:59:59.9999999
    static constexpr int64_t unix_epoch_ticks = 621355968000000000LL;

    // Throws std::out_of_range for components outside the calendar.
    static date_time from_civil(int year, int month, int day, int hour=0, int minute=0, int second=0, int millisecond=0);
    static date_time now();
    static date_time utc_now();
    static date_time today();
    // Accepts "yyyy-MM-dd" with an optional "[T ]HH:mm[:ss[.fff]]" suffix.
    static std::optional<date_time> parse(std::string_view text);

    int year() const;
    int month() const;
    int day() const;
    int hour() const { return (int)((ticks / time_span::ticks_per_hour) % 24); }
    int minute() const { return (int)((ticks / time_span::ticks_per_minute) % 60); }
    int second() const { return (int)((ticks / time_span::ticks_per_second) % 60); }
    int millisecond() const { return (int)((ticks / time_span::ticks_per_millisecond) % 1000); }
    int day_of_year() const;
    int day_of_week() const; // 0 = Sunday
    date_time date() const { return date_time{ticks - ticks % time_span::ticks_per_day}; }
    date_time add_ticks(int64_t delta) const;
    date_time add_months(int months) const;
    std::string to_string() const;
};
inline bool operator==(date_time a, date_time b){ return a.ticks == b.ticks; }
inline bool operator!=(date_time a, date_time b){ return a.ticks != b.ticks; }
inline bool operator<(date_time a, date_time b){ return a.ticks < b.ticks; }

struct guid {
    std::array<uint8_t,16> bytes{};
    // Accepts the 8-4-4-4-12 hex form, optionally wrapped in braces.
    static std::optional<guid> parse(std::string_view text);
    std::string to_string() const;
};
inline bool operator==(const guid& a, const guid& b){ return a.bytes == b.bytes; }
inline bool operator!=(const guid& a, const guid& b){ return a.bytes != b.bytes; }
inline bool operator<(const guid& a, const guid& b){ return a.bytes < b.bytes; }

} // namespace dynq
