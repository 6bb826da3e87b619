#include "dynq/primitives.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace dynq {

namespace {

// Days since 0001-01-01 for a proleptic Gregorian date (shifted civil algorithm).
int64_t days_from_civil(int64_t y, unsigned m, unsigned d){
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    // 719162 = days from 0001-01-01 to 1970-01-01; 719468 = days from 0000-03-01 to 1970-01-01
    return era * 146097 + static_cast<int64_t>(doe) - 719468 + 719162;
}

void civil_from_days(int64_t days, int& y, unsigned& m, unsigned& d){
    int64_t z = days - 719162 + 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int>(static_cast<int64_t>(yoe) + era * 400 + (m <= 2));
}

bool is_leap(int y){ return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

int days_in_month(int y, int m){
    static const int table[] = {31,28,31,30,31,30,31,31,30,31,30,31};
    return (m == 2 && is_leap(y)) ? 29 : table[m - 1];
}

int hex_digit(char c){
    if(c >= '0' && c <= '9') return c - '0';
    if(c >= 'a' && c <= 'f') return c - 'a' + 10;
    if(c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool read_int(std::string_view s, size_t& i, size_t digits, int& out){
    if(i + digits > s.size()) return false;
    int v = 0;
    for(size_t k = 0; k < digits; ++k){
        char c = s[i + k];
        if(c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    i += digits;
    out = v;
    return true;
}

} // namespace

time_span time_span::from_parts(int64_t days, int64_t hours, int64_t minutes, int64_t seconds, int64_t milliseconds){
    return time_span{days * ticks_per_day + hours * ticks_per_hour + minutes * ticks_per_minute +
                     seconds * ticks_per_second + milliseconds * ticks_per_millisecond};
}

std::string time_span::to_string() const {
    int64_t t = ticks < 0 ? -ticks : ticks;
    time_span a{t};
    char buf[64];
    if(a.days() != 0)
        std::snprintf(buf, sizeof(buf), "%s%d.%02d:%02d:%02d", ticks < 0 ? "-" : "", a.days(), a.hours(), a.minutes(), a.seconds());
    else
        std::snprintf(buf, sizeof(buf), "%s%02d:%02d:%02d", ticks < 0 ? "-" : "", a.hours(), a.minutes(), a.seconds());
    std::string out = buf;
    if(int64_t frac = t % ticks_per_second){
        std::snprintf(buf, sizeof(buf), ".%07lld", (long long)frac);
        out += buf;
    }
    return out;
}

date_time date_time::from_civil(int year, int month, int day, int hour, int minute, int second, int millisecond){
    if(year < 1 || year > 9999 || month < 1 || month > 12 || day < 1 || day > days_in_month(year, month))
        throw std::out_of_range("date components out of range");
    if(hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59 || millisecond < 0 || millisecond > 999)
        throw std::out_of_range("time components out of range");
    int64_t days = days_from_civil(year, (unsigned)month, (unsigned)day);
    return date_time{days * time_span::ticks_per_day + hour * time_span::ticks_per_hour +
                     minute * time_span::ticks_per_minute + second * time_span::ticks_per_second +
                     millisecond * time_span::ticks_per_millisecond};
}

date_time date_time::utc_now(){
    auto since = std::chrono::system_clock::now().time_since_epoch();
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(since).count();
    return date_time{unix_epoch_ticks + us * 10};
}

date_time date_time::now(){
    date_time utc = utc_now();
    std::time_t t = std::time(nullptr);
    std::tm local{};
    std::tm gm{};
#if defined(_WIN32)
    localtime_s(&local, &t);
    gmtime_s(&gm, &t);
#else
    localtime_r(&t, &local);
    gmtime_r(&t, &gm);
#endif
    local.tm_isdst = 0;
    gm.tm_isdst = 0;
    int64_t offset = (int64_t)std::difftime(std::mktime(&local), std::mktime(&gm));
    return utc.add_ticks(offset * time_span::ticks_per_second);
}

date_time date_time::today(){ return now().date(); }

std::optional<date_time> date_time::parse(std::string_view s){
    size_t i = 0;
    int y, mo, d, h = 0, mi = 0, sec = 0, ms = 0;
    if(!read_int(s, i, 4, y) || i >= s.size() || s[i++] != '-') return std::nullopt;
    if(!read_int(s, i, 2, mo) || i >= s.size() || s[i++] != '-') return std::nullopt;
    if(!read_int(s, i, 2, d)) return std::nullopt;
    if(i < s.size()){
        if(s[i] != 'T' && s[i] != ' ') return std::nullopt;
        ++i;
        if(!read_int(s, i, 2, h) || i >= s.size() || s[i++] != ':') return std::nullopt;
        if(!read_int(s, i, 2, mi)) return std::nullopt;
        if(i < s.size()){
            if(s[i++] != ':' || !read_int(s, i, 2, sec)) return std::nullopt;
            if(i < s.size()){
                if(s[i++] != '.' || !read_int(s, i, 3, ms)) return std::nullopt;
            }
        }
    }
    if(i != s.size()) return std::nullopt;
    try {
        return from_civil(y, mo, d, h, mi, sec, ms);
    } catch(const std::out_of_range&){
        return std::nullopt;
    }
}

int date_time::year() const { int y; unsigned m, d; civil_from_days(ticks / time_span::ticks_per_day, y, m, d); return y; }
int date_time::month() const { int y; unsigned m, d; civil_from_days(ticks / time_span::ticks_per_day, y, m, d); return (int)m; }
int date_time::day() const { int y; unsigned m, d; civil_from_days(ticks / time_span::ticks_per_day, y, m, d); return (int)d; }

int date_time::day_of_year() const {
    int y; unsigned m, d;
    int64_t days = ticks / time_span::ticks_per_day;
    civil_from_days(days, y, m, d);
    return (int)(days - days_from_civil(y, 1, 1)) + 1;
}

// 0001-01-01 was a Monday.
int date_time::day_of_week() const { return (int)((ticks / time_span::ticks_per_day + 1) % 7); }

date_time date_time::add_ticks(int64_t delta) const {
    int64_t t = ticks + delta;
    if(t < 0 || t > max_ticks) throw std::out_of_range("date arithmetic out of range");
    return date_time{t};
}

date_time date_time::add_months(int months) const {
    int y; unsigned m, d;
    civil_from_days(ticks / time_span::ticks_per_day, y, m, d);
    int total = y * 12 + (int)(m - 1) + months;
    int ny = total / 12;
    int nm = total % 12 + 1;
    if(ny < 1 || ny > 9999) throw std::out_of_range("date arithmetic out of range");
    int nd = std::min((int)d, days_in_month(ny, nm));
    return date_time{days_from_civil(ny, (unsigned)nm, (unsigned)nd) * time_span::ticks_per_day + ticks % time_span::ticks_per_day};
}

std::string date_time::to_string() const {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d", year(), month(), day(), hour(), minute(), second());
    return buf;
}

std::optional<guid> guid::parse(std::string_view s){
    if(s.size() == 38 && s.front() == '{' && s.back() == '}') s = s.substr(1, 36);
    if(s.size() != 36) return std::nullopt;
    guid g;
    size_t b = 0;
    for(size_t i = 0; i < s.size();){
        if(i == 8 || i == 13 || i == 18 || i == 23){
            if(s[i] != '-') return std::nullopt;
            ++i;
            continue;
        }
        int hi = hex_digit(s[i]), lo = hex_digit(s[i + 1]);
        if(hi < 0 || lo < 0) return std::nullopt;
        g.bytes[b++] = (uint8_t)(hi * 16 + lo);
        i += 2;
    }
    return g;
}

std::string guid::to_string() const {
    static const char* hex = "0123456789abcdef";
    std::string out;
    for(size_t i = 0; i < bytes.size(); ++i){
        if(i == 4 || i == 6 || i == 8 || i == 10) out += '-';
        out += hex[bytes[i] >> 4];
        out += hex[bytes[i] & 0xF];
    }
    return out;
}

} // namespace dynq
