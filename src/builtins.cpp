#include "dynq/builtins.hpp"
#include "dynq/errors.hpp"
#include "dynq/evaluator.hpp"
#include <algorithm>
#include <cctype>
#include <cfenv>
#include <cmath>
#include <limits>
#include <memory>
#include <random>

namespace dynq {

namespace {

type_ref T(type_kind k){ return base_type(k); }

[[noreturn]] void bad_argument(const std::string& msg){ throw evaluation_error(codes::invalid_argument, msg); }
[[noreturn]] void bad_format(){ bad_argument("Input string was not in a correct format."); }

const std::string& str_arg(const value& v, const char* param){
    if(v.is_null()) bad_argument(std::string("Value cannot be null. (Parameter '") + param + "')");
    return v.as<std::string>();
}

bool iequals(std::string_view a, std::string_view b){
    if(a.size() != b.size()) return false;
    for(size_t i = 0; i < a.size(); ++i)
        if(std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
    return true;
}

int32_t index_or_minus_one(size_t p){ return p == std::string::npos ? -1 : (int32_t)p; }

std::string trim_chars(const std::string& s, bool front, bool back){
    size_t b = 0, e = s.size();
    if(front) while(b < e && std::isspace((unsigned char)s[b])) ++b;
    if(back) while(e > b && std::isspace((unsigned char)s[e - 1])) --e;
    return s.substr(b, e - b);
}

int32_t ordinal_compare(const value& a, const value& b){
    if(a.is_null() || b.is_null()) return a.is_null() == b.is_null() ? 0 : (a.is_null() ? -1 : 1);
    int c = a.as<std::string>().compare(b.as<std::string>());
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

double round_half_even(double v){
    const int saved = std::fegetround();
    std::fesetround(FE_TONEAREST);
    double r = std::nearbyint(v);
    std::fesetround(saved);
    return r;
}

long double round_half_even(long double v){
    const int saved = std::fegetround();
    std::fesetround(FE_TONEAREST);
    long double r = std::nearbyintl(v);
    std::fesetround(saved);
    return r;
}

// Scales a fractional amount of `unit_ms` milliseconds to ticks, rounding to the millisecond.
int64_t scaled_ticks(double amount, double unit_ms){
    if(std::isnan(amount)) bad_argument("TimeSpan does not accept floating point Not-a-Number values.");
    double millis = amount * unit_ms + (amount >= 0 ? 0.5 : -0.5);
    const double limit = (double)(std::numeric_limits<int64_t>::max() / time_span::ticks_per_millisecond);
    if(millis > limit || millis < -limit) throw evaluation_error(codes::overflow, "TimeSpan overflowed because the duration is too long.");
    return (int64_t)millis * time_span::ticks_per_millisecond;
}

value convert_object(const value& v, type_ref target){
    if(v.is_null()) return target->kind == type_kind::String ? value(std::string()) : default_value(target);
    if(target->kind == type_kind::String) return value(to_display(v));
    if(v.is<std::string>()){
        const std::string& s = v.as<std::string>();
        switch(target->kind){
            case type_kind::Boolean: {
                std::string t = trim_chars(s, true, true);
                if(iequals(t, "true")) return value(true);
                if(iequals(t, "false")) return value(false);
                bad_format();
            }
            case type_kind::Char:
                if(s.size() != 1) bad_argument("String must be exactly one character long.");
                return value(s[0]);
            case type_kind::DateTime:
                if(auto d = date_time::parse(trim_chars(s, true, true))) return value(*d);
                bad_format();
            default:
                if(is_numeric(target)){
                    if(auto n = parse_numeric(s, target)) return *n;
                    bad_format();
                }
                break;
        }
        bad_argument("Invalid cast from 'String' to '" + type_name(target) + "'.");
    }
    if(v.is<bool>()){
        bool b = v.as<bool>();
        if(target->kind == type_kind::Boolean) return v;
        if(is_numeric(target) && target->kind != type_kind::Char) return convert_value(value(int32_t(b ? 1 : 0)), target, true);
        bad_argument("Invalid cast from 'Boolean' to '" + type_name(target) + "'.");
    }
    if(target->kind == type_kind::Boolean){
        if(v.is<char>() || v.is<date_time>() || v.is<time_span>() || v.is<guid>() || v.is<record_ref>() || v.is<sequence_ref>())
            bad_argument("Invalid cast to 'Boolean'.");
        return value(to_long_double(v) != 0);
    }
    if(is_integral(target) && (v.is<float>() || v.is<double>() || v.is<decimal_t>())){
        long double r = round_half_even(to_long_double(v));
        return convert_value(value(decimal_t{r}), target, true);
    }
    if(target->kind == type_kind::DateTime && v.is<date_time>()) return v;
    if(is_numeric(target) && !(v.is<date_time>() || v.is<time_span>() || v.is<guid>() || v.is<record_ref>() || v.is<sequence_ref>()))
        return convert_value(v, target, true);
    bad_argument("Invalid cast to '" + type_name(target) + "'.");
}

class catalog {
public:
    static const catalog& instance(){
        static const catalog c;
        return c;
    }
    std::vector<std::unique_ptr<builtin>> entries;

private:
    catalog();

    void add(type_ref owner, std::string name, bool is_static, bool is_property, std::vector<type_ref> params, type_ref result, builtin_impl impl){
        auto b = std::make_unique<builtin>();
        b->name = std::move(name);
        b->owner = owner;
        b->is_static = is_static;
        b->is_property = is_property;
        b->params = std::move(params);
        b->result = result;
        b->impl = std::move(impl);
        entries.push_back(std::move(b));
    }
    void property(type_ref owner, std::string name, type_ref result, builtin_impl impl){
        add(owner, std::move(name), false, true, {}, result, std::move(impl));
    }
    void method(type_ref owner, std::string name, std::vector<type_ref> params, type_ref result, builtin_impl impl){
        add(owner, std::move(name), false, false, std::move(params), result, std::move(impl));
    }
    void static_property(type_ref owner, std::string name, type_ref result, builtin_impl impl){
        add(owner, std::move(name), true, true, {}, result, std::move(impl));
    }
    void static_method(type_ref owner, std::string name, std::vector<type_ref> params, type_ref result, builtin_impl impl){
        add(owner, std::move(name), true, false, std::move(params), result, std::move(impl));
    }
    void constructor(type_ref owner, std::vector<type_ref> params, builtin_impl impl){
        add(owner, ".ctor", true, false, std::move(params), owner, std::move(impl));
        entries.back()->is_constructor = true;
    }

    void add_string();
    void add_char();
    void add_date_time();
    void add_time_span();
    void add_guid();
    void add_numeric_statics();
    void add_math();
    void add_convert();
};

void catalog::add_string(){
    const type_ref S = T(type_kind::String), I = T(type_kind::Int32), B = T(type_kind::Boolean), C = T(type_kind::Char);
    property(S, "Length", I, [](const value& s, const std::vector<value>&){ return value((int32_t)s.as<std::string>().size()); });
    method(S, "Contains", {S}, B, [](const value& s, const std::vector<value>& a){
        return value(s.as<std::string>().find(str_arg(a[0], "value")) != std::string::npos);
    });
    method(S, "StartsWith", {S}, B, [](const value& s, const std::vector<value>& a){
        const auto& p = str_arg(a[0], "value");
        return value(s.as<std::string>().compare(0, p.size(), p) == 0);
    });
    method(S, "EndsWith", {S}, B, [](const value& s, const std::vector<value>& a){
        const auto& str = s.as<std::string>();
        const auto& p = str_arg(a[0], "value");
        return value(str.size() >= p.size() && str.compare(str.size() - p.size(), p.size(), p) == 0);
    });
    method(S, "IndexOf", {S}, I, [](const value& s, const std::vector<value>& a){
        return value(index_or_minus_one(s.as<std::string>().find(str_arg(a[0], "value"))));
    });
    method(S, "IndexOf", {C}, I, [](const value& s, const std::vector<value>& a){
        return value(index_or_minus_one(s.as<std::string>().find(a[0].as<char>())));
    });
    method(S, "LastIndexOf", {S}, I, [](const value& s, const std::vector<value>& a){
        return value(index_or_minus_one(s.as<std::string>().rfind(str_arg(a[0], "value"))));
    });
    method(S, "ToUpper", {}, S, [](const value& s, const std::vector<value>&){
        std::string out = s.as<std::string>();
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return (char)std::toupper(c); });
        return value(std::move(out));
    });
    method(S, "ToLower", {}, S, [](const value& s, const std::vector<value>&){
        std::string out = s.as<std::string>();
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return (char)std::tolower(c); });
        return value(std::move(out));
    });
    method(S, "Trim", {}, S, [](const value& s, const std::vector<value>&){ return value(trim_chars(s.as<std::string>(), true, true)); });
    method(S, "TrimStart", {}, S, [](const value& s, const std::vector<value>&){ return value(trim_chars(s.as<std::string>(), true, false)); });
    method(S, "TrimEnd", {}, S, [](const value& s, const std::vector<value>&){ return value(trim_chars(s.as<std::string>(), false, true)); });
    method(S, "Substring", {I}, S, [](const value& s, const std::vector<value>& a){
        const auto& str = s.as<std::string>();
        int32_t start = a[0].as<int32_t>();
        if(start < 0 || (size_t)start > str.size())
            throw evaluation_error(codes::index_out_of_range, "startIndex cannot be larger than length of string.");
        return value(str.substr((size_t)start));
    });
    method(S, "Substring", {I, I}, S, [](const value& s, const std::vector<value>& a){
        const auto& str = s.as<std::string>();
        int32_t start = a[0].as<int32_t>(), len = a[1].as<int32_t>();
        if(start < 0 || len < 0 || (size_t)start + (size_t)len > str.size())
            throw evaluation_error(codes::index_out_of_range, "Index and length must refer to a location within the string.");
        return value(str.substr((size_t)start, (size_t)len));
    });
    method(S, "Replace", {S, S}, S, [](const value& s, const std::vector<value>& a){
        const auto& from = str_arg(a[0], "oldValue");
        if(from.empty()) bad_argument("String cannot be of zero length. (Parameter 'oldValue')");
        const std::string to = a[1].is_null() ? std::string() : a[1].as<std::string>();
        std::string out;
        const auto& str = s.as<std::string>();
        size_t at = 0;
        for(size_t hit; (hit = str.find(from, at)) != std::string::npos; at = hit + from.size())
            out.append(str, at, hit - at).append(to);
        out.append(str, at, std::string::npos);
        return value(std::move(out));
    });
    method(S, "Replace", {C, C}, S, [](const value& s, const std::vector<value>& a){
        std::string out = s.as<std::string>();
        std::replace(out.begin(), out.end(), a[0].as<char>(), a[1].as<char>());
        return value(std::move(out));
    });
    method(S, "CompareTo", {S}, I, [](const value& s, const std::vector<value>& a){ return value(ordinal_compare(s, a[0])); });
    method(S, "Equals", {S}, B, [](const value& s, const std::vector<value>& a){ return value(values_equal(s, a[0])); });
    method(S, "PadLeft", {I}, S, [](const value& s, const std::vector<value>& a){
        const auto& str = s.as<std::string>();
        int32_t w = a[0].as<int32_t>();
        if(w < 0) bad_argument("Non-negative number required. (Parameter 'totalWidth')");
        return value((size_t)w > str.size() ? std::string((size_t)w - str.size(), ' ') + str : str);
    });
    method(S, "PadRight", {I}, S, [](const value& s, const std::vector<value>& a){
        const auto& str = s.as<std::string>();
        int32_t w = a[0].as<int32_t>();
        if(w < 0) bad_argument("Non-negative number required. (Parameter 'totalWidth')");
        return value((size_t)w > str.size() ? str + std::string((size_t)w - str.size(), ' ') : str);
    });
    method(S, "Insert", {I, S}, S, [](const value& s, const std::vector<value>& a){
        std::string out = s.as<std::string>();
        int32_t at = a[0].as<int32_t>();
        if(at < 0 || (size_t)at > out.size()) throw evaluation_error(codes::index_out_of_range, "Index was out of range.");
        out.insert((size_t)at, str_arg(a[1], "value"));
        return value(std::move(out));
    });
    method(S, "Remove", {I}, S, [](const value& s, const std::vector<value>& a){
        const auto& str = s.as<std::string>();
        int32_t at = a[0].as<int32_t>();
        if(at < 0 || (size_t)at > str.size()) throw evaluation_error(codes::index_out_of_range, "startIndex must be less than length of string.");
        return value(str.substr(0, (size_t)at));
    });
    method(S, "Remove", {I, I}, S, [](const value& s, const std::vector<value>& a){
        std::string out = s.as<std::string>();
        int32_t at = a[0].as<int32_t>(), n = a[1].as<int32_t>();
        if(at < 0 || n < 0 || (size_t)at + (size_t)n > out.size())
            throw evaluation_error(codes::index_out_of_range, "Index and count must refer to a location within the string.");
        out.erase((size_t)at, (size_t)n);
        return value(std::move(out));
    });

    static_property(S, "Empty", S, [](const value&, const std::vector<value>&){ return value(std::string()); });
    static_method(S, "IsNullOrEmpty", {S}, B, [](const value&, const std::vector<value>& a){
        return value(a[0].is_null() || a[0].as<std::string>().empty());
    });
    static_method(S, "IsNullOrWhiteSpace", {S}, B, [](const value&, const std::vector<value>& a){
        return value(a[0].is_null() || trim_chars(a[0].as<std::string>(), true, true).empty());
    });
    static_method(S, "Concat", {S, S}, S, [](const value&, const std::vector<value>& a){ return value(to_display(a[0]) + to_display(a[1])); });
    static_method(S, "Compare", {S, S}, I, [](const value&, const std::vector<value>& a){ return value(ordinal_compare(a[0], a[1])); });
    static_method(S, "Equals", {S, S}, B, [](const value&, const std::vector<value>& a){ return value(values_equal(a[0], a[1])); });
}

void catalog::add_char(){
    const type_ref C = T(type_kind::Char), B = T(type_kind::Boolean);
    auto pred = [&](const char* name, int (*fn)(int)){
        static_method(C, name, {C}, B, [fn](const value&, const std::vector<value>& a){ return value(fn((unsigned char)a[0].as<char>()) != 0); });
    };
    pred("IsDigit", [](int c){ return std::isdigit(c); });
    pred("IsLetter", [](int c){ return std::isalpha(c); });
    pred("IsLetterOrDigit", [](int c){ return std::isalnum(c); });
    pred("IsWhiteSpace", [](int c){ return std::isspace(c); });
    pred("IsUpper", [](int c){ return std::isupper(c); });
    pred("IsLower", [](int c){ return std::islower(c); });
    static_method(C, "ToUpper", {C}, C, [](const value&, const std::vector<value>& a){ return value((char)std::toupper((unsigned char)a[0].as<char>())); });
    static_method(C, "ToLower", {C}, C, [](const value&, const std::vector<value>& a){ return value((char)std::tolower((unsigned char)a[0].as<char>())); });
}

void catalog::add_date_time(){
    const type_ref D = T(type_kind::DateTime), TS = T(type_kind::TimeSpan), I = T(type_kind::Int32),
                   L = T(type_kind::Int64), F = T(type_kind::Double), S = T(type_kind::String), B = T(type_kind::Boolean);
    auto part = [&](const char* name, int (date_time::*fn)() const){
        property(D, name, I, [fn](const value& d, const std::vector<value>&){ return value((int32_t)(d.as<date_time>().*fn)()); });
    };
    part("Year", &date_time::year);
    part("Month", &date_time::month);
    part("Day", &date_time::day);
    part("Hour", &date_time::hour);
    part("Minute", &date_time::minute);
    part("Second", &date_time::second);
    part("Millisecond", &date_time::millisecond);
    part("DayOfYear", &date_time::day_of_year);
    part("DayOfWeek", &date_time::day_of_week);
    property(D, "Date", D, [](const value& d, const std::vector<value>&){ return value(d.as<date_time>().date()); });
    property(D, "Ticks", L, [](const value& d, const std::vector<value>&){ return value(d.as<date_time>().ticks); });
    property(D, "TimeOfDay", TS, [](const value& d, const std::vector<value>&){
        return value(time_span{d.as<date_time>().ticks % time_span::ticks_per_day});
    });

    auto adder = [&](const char* name, double unit_ms){
        method(D, name, {F}, D, [unit_ms](const value& d, const std::vector<value>& a){
            return value(d.as<date_time>().add_ticks(scaled_ticks(a[0].as<double>(), unit_ms)));
        });
    };
    adder("AddDays", 86400000.0);
    adder("AddHours", 3600000.0);
    adder("AddMinutes", 60000.0);
    adder("AddSeconds", 1000.0);
    adder("AddMilliseconds", 1.0);
    method(D, "AddTicks", {L}, D, [](const value& d, const std::vector<value>& a){ return value(d.as<date_time>().add_ticks(a[0].as<int64_t>())); });
    method(D, "AddMonths", {I}, D, [](const value& d, const std::vector<value>& a){ return value(d.as<date_time>().add_months(a[0].as<int32_t>())); });
    method(D, "AddYears", {I}, D, [](const value& d, const std::vector<value>& a){ return value(d.as<date_time>().add_months(a[0].as<int32_t>() * 12)); });
    method(D, "Add", {TS}, D, [](const value& d, const std::vector<value>& a){ return value(d.as<date_time>().add_ticks(a[0].as<time_span>().ticks)); });
    method(D, "Subtract", {TS}, D, [](const value& d, const std::vector<value>& a){ return value(d.as<date_time>().add_ticks(-a[0].as<time_span>().ticks)); });
    method(D, "Subtract", {D}, TS, [](const value& d, const std::vector<value>& a){
        return value(time_span{d.as<date_time>().ticks - a[0].as<date_time>().ticks});
    });

    static_property(D, "Now", D, [](const value&, const std::vector<value>&){ return value(date_time::now()); });
    static_property(D, "UtcNow", D, [](const value&, const std::vector<value>&){ return value(date_time::utc_now()); });
    static_property(D, "Today", D, [](const value&, const std::vector<value>&){ return value(date_time::today()); });
    static_property(D, "MinValue", D, [](const value&, const std::vector<value>&){ return value(date_time{0}); });
    static_property(D, "MaxValue", D, [](const value&, const std::vector<value>&){ return value(date_time{date_time::max_ticks}); });
    static_method(D, "Parse", {S}, D, [](const value&, const std::vector<value>& a){
        if(auto d = date_time::parse(trim_chars(str_arg(a[0], "s"), true, true))) return value(*d);
        bad_format();
    });
    static_method(D, "IsLeapYear", {I}, B, [](const value&, const std::vector<value>& a){
        int y = a[0].as<int32_t>();
        if(y < 1 || y > 9999) bad_argument("Year must be between 1 and 9999.");
        return value((y % 4 == 0 && y % 100 != 0) || y % 400 == 0);
    });
    static_method(D, "DaysInMonth", {I, I}, I, [](const value&, const std::vector<value>& a){
        int y = a[0].as<int32_t>(), m = a[1].as<int32_t>();
        if(m < 1 || m > 12) bad_argument("Month must be between one and twelve.");
        date_time first = date_time::from_civil(y, m, 1);
        return value((int32_t)((first.add_months(1).ticks - first.ticks) / time_span::ticks_per_day));
    });

    constructor(D, {I, I, I}, [](const value&, const std::vector<value>& a){
        return value(date_time::from_civil(a[0].as<int32_t>(), a[1].as<int32_t>(), a[2].as<int32_t>()));
    });
    constructor(D, {I, I, I, I, I, I}, [](const value&, const std::vector<value>& a){
        return value(date_time::from_civil(a[0].as<int32_t>(), a[1].as<int32_t>(), a[2].as<int32_t>(),
                                           a[3].as<int32_t>(), a[4].as<int32_t>(), a[5].as<int32_t>()));
    });
    constructor(D, {I, I, I, I, I, I, I}, [](const value&, const std::vector<value>& a){
        return value(date_time::from_civil(a[0].as<int32_t>(), a[1].as<int32_t>(), a[2].as<int32_t>(),
                                           a[3].as<int32_t>(), a[4].as<int32_t>(), a[5].as<int32_t>(), a[6].as<int32_t>()));
    });
    constructor(D, {L}, [](const value&, const std::vector<value>& a){
        int64_t t = a[0].as<int64_t>();
        if(t < 0 || t > date_time::max_ticks) bad_argument("Ticks must be between DateTime.MinValue.Ticks and DateTime.MaxValue.Ticks.");
        return value(date_time{t});
    });
}

void catalog::add_time_span(){
    const type_ref TS = T(type_kind::TimeSpan), I = T(type_kind::Int32), L = T(type_kind::Int64), F = T(type_kind::Double);
    auto part = [&](const char* name, int (time_span::*fn)() const){
        property(TS, name, I, [fn](const value& t, const std::vector<value>&){ return value((int32_t)(t.as<time_span>().*fn)()); });
    };
    part("Days", &time_span::days);
    part("Hours", &time_span::hours);
    part("Minutes", &time_span::minutes);
    part("Seconds", &time_span::seconds);
    part("Milliseconds", &time_span::milliseconds);
    auto total = [&](const char* name, double (time_span::*fn)() const){
        property(TS, name, F, [fn](const value& t, const std::vector<value>&){ return value((t.as<time_span>().*fn)()); });
    };
    total("TotalDays", &time_span::total_days);
    total("TotalHours", &time_span::total_hours);
    total("TotalMinutes", &time_span::total_minutes);
    total("TotalSeconds", &time_span::total_seconds);
    total("TotalMilliseconds", &time_span::total_milliseconds);
    property(TS, "Ticks", L, [](const value& t, const std::vector<value>&){ return value(t.as<time_span>().ticks); });
    method(TS, "Add", {TS}, TS, [](const value& t, const std::vector<value>& a){
        return value(time_span{(int64_t)((uint64_t)t.as<time_span>().ticks + (uint64_t)a[0].as<time_span>().ticks)});
    });
    method(TS, "Subtract", {TS}, TS, [](const value& t, const std::vector<value>& a){
        return value(time_span{(int64_t)((uint64_t)t.as<time_span>().ticks - (uint64_t)a[0].as<time_span>().ticks)});
    });
    method(TS, "Negate", {}, TS, [](const value& t, const std::vector<value>&){
        int64_t ticks = t.as<time_span>().ticks;
        if(ticks == std::numeric_limits<int64_t>::min()) throw evaluation_error(codes::overflow, "Negating the minimum value of a twos complement number is invalid.");
        return value(time_span{-ticks});
    });
    method(TS, "Duration", {}, TS, [](const value& t, const std::vector<value>&){
        int64_t ticks = t.as<time_span>().ticks;
        if(ticks == std::numeric_limits<int64_t>::min()) throw evaluation_error(codes::overflow, "The duration cannot be returned for TimeSpan.MinValue because the absolute value of TimeSpan.MinValue exceeds the value of TimeSpan.MaxValue.");
        return value(time_span{ticks < 0 ? -ticks : ticks});
    });

    auto from = [&](const char* name, double unit_ms){
        static_method(TS, name, {F}, TS, [unit_ms](const value&, const std::vector<value>& a){
            return value(time_span{scaled_ticks(a[0].as<double>(), unit_ms)});
        });
    };
    from("FromDays", 86400000.0);
    from("FromHours", 3600000.0);
    from("FromMinutes", 60000.0);
    from("FromSeconds", 1000.0);
    from("FromMilliseconds", 1.0);
    static_method(TS, "FromTicks", {L}, TS, [](const value&, const std::vector<value>& a){ return value(time_span{a[0].as<int64_t>()}); });
    static_property(TS, "Zero", TS, [](const value&, const std::vector<value>&){ return value(time_span{}); });
    static_property(TS, "MinValue", TS, [](const value&, const std::vector<value>&){ return value(time_span{std::numeric_limits<int64_t>::min()}); });
    static_property(TS, "MaxValue", TS, [](const value&, const std::vector<value>&){ return value(time_span{std::numeric_limits<int64_t>::max()}); });

    constructor(TS, {L}, [](const value&, const std::vector<value>& a){ return value(time_span{a[0].as<int64_t>()}); });
    constructor(TS, {I, I, I}, [](const value&, const std::vector<value>& a){
        return value(time_span::from_parts(0, a[0].as<int32_t>(), a[1].as<int32_t>(), a[2].as<int32_t>()));
    });
    constructor(TS, {I, I, I, I}, [](const value&, const std::vector<value>& a){
        return value(time_span::from_parts(a[0].as<int32_t>(), a[1].as<int32_t>(), a[2].as<int32_t>(), a[3].as<int32_t>()));
    });
    constructor(TS, {I, I, I, I, I}, [](const value&, const std::vector<value>& a){
        return value(time_span::from_parts(a[0].as<int32_t>(), a[1].as<int32_t>(), a[2].as<int32_t>(), a[3].as<int32_t>(), a[4].as<int32_t>()));
    });
}

void catalog::add_guid(){
    const type_ref G = T(type_kind::Guid), S = T(type_kind::String);
    static_property(G, "Empty", G, [](const value&, const std::vector<value>&){ return value(guid{}); });
    static_method(G, "NewGuid", {}, G, [](const value&, const std::vector<value>&){
        static thread_local std::mt19937_64 rng{std::random_device{}()};
        guid g;
        for(auto& b : g.bytes) b = (uint8_t)rng();
        g.bytes[6] = (uint8_t)((g.bytes[6] & 0x0F) | 0x40);
        g.bytes[8] = (uint8_t)((g.bytes[8] & 0x3F) | 0x80);
        return value(g);
    });
    auto parse = [](const value&, const std::vector<value>& a){
        if(auto g = guid::parse(trim_chars(str_arg(a[0], "input"), true, true))) return value(*g);
        bad_argument("Guid should contain 32 digits with 4 dashes (xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx).");
    };
    static_method(G, "Parse", {S}, G, parse);
    constructor(G, {S}, parse);
}

void catalog::add_numeric_statics(){
    const type_ref S = T(type_kind::String);
    auto limits = [&](type_kind k, value lo, value hi){
        type_ref t = T(k);
        static_property(t, "MinValue", t, [lo](const value&, const std::vector<value>&){ return lo; });
        static_property(t, "MaxValue", t, [hi](const value&, const std::vector<value>&){ return hi; });
        static_method(t, "Parse", {S}, t, [t](const value&, const std::vector<value>& a){
            if(auto n = parse_numeric(str_arg(a[0], "s"), t)) return *n;
            bad_format();
        });
    };
    limits(type_kind::SByte, value(std::numeric_limits<int8_t>::min()), value(std::numeric_limits<int8_t>::max()));
    limits(type_kind::Byte, value(std::numeric_limits<uint8_t>::min()), value(std::numeric_limits<uint8_t>::max()));
    limits(type_kind::Int16, value(std::numeric_limits<int16_t>::min()), value(std::numeric_limits<int16_t>::max()));
    limits(type_kind::UInt16, value(std::numeric_limits<uint16_t>::min()), value(std::numeric_limits<uint16_t>::max()));
    limits(type_kind::Int32, value(std::numeric_limits<int32_t>::min()), value(std::numeric_limits<int32_t>::max()));
    limits(type_kind::UInt32, value(std::numeric_limits<uint32_t>::min()), value(std::numeric_limits<uint32_t>::max()));
    limits(type_kind::Int64, value(std::numeric_limits<int64_t>::min()), value(std::numeric_limits<int64_t>::max()));
    limits(type_kind::UInt64, value(std::numeric_limits<uint64_t>::min()), value(std::numeric_limits<uint64_t>::max()));
    limits(type_kind::Single, value(std::numeric_limits<float>::lowest()), value(std::numeric_limits<float>::max()));
    limits(type_kind::Double, value(std::numeric_limits<double>::lowest()), value(std::numeric_limits<double>::max()));
    limits(type_kind::Decimal, value(decimal_t{-79228162514264337593543950335.0L}), value(decimal_t{79228162514264337593543950335.0L}));

    const type_ref B = T(type_kind::Boolean);
    static_method(B, "Parse", {S}, B, [](const value&, const std::vector<value>& a){
        std::string t = trim_chars(str_arg(a[0], "value"), true, true);
        if(iequals(t, "true")) return value(true);
        if(iequals(t, "false")) return value(false);
        bad_argument("String '" + t + "' was not recognized as a valid Boolean.");
    });
}

void catalog::add_math(){
    const type_ref M = type_context::instance().math();
    const type_ref I = T(type_kind::Int32), U = T(type_kind::UInt32), L = T(type_kind::Int64), UL = T(type_kind::UInt64),
                   F = T(type_kind::Single), D = T(type_kind::Double), DEC = T(type_kind::Decimal);

    static_property(M, "PI", D, [](const value&, const std::vector<value>&){ return value(3.14159265358979323846); });
    static_property(M, "E", D, [](const value&, const std::vector<value>&){ return value(2.7182818284590452354); });

    static_method(M, "Abs", {I}, I, [](const value&, const std::vector<value>& a){
        int32_t v = a[0].as<int32_t>();
        if(v == std::numeric_limits<int32_t>::min()) throw evaluation_error(codes::overflow, "Negating the minimum value of a twos complement number is invalid.");
        return value(v < 0 ? -v : v);
    });
    static_method(M, "Abs", {L}, L, [](const value&, const std::vector<value>& a){
        int64_t v = a[0].as<int64_t>();
        if(v == std::numeric_limits<int64_t>::min()) throw evaluation_error(codes::overflow, "Negating the minimum value of a twos complement number is invalid.");
        return value(v < 0 ? -v : v);
    });
    static_method(M, "Abs", {F}, F, [](const value&, const std::vector<value>& a){ return value(std::fabs(a[0].as<float>())); });
    static_method(M, "Abs", {D}, D, [](const value&, const std::vector<value>& a){ return value(std::fabs(a[0].as<double>())); });
    static_method(M, "Abs", {DEC}, DEC, [](const value&, const std::vector<value>& a){ return value(decimal_t{std::fabs(a[0].as<decimal_t>().v)}); });

    auto min_max = [&](type_ref t){
        static_method(M, "Min", {t, t}, t, [](const value&, const std::vector<value>& a){ return compare_values(a[0], a[1]) <= 0 ? a[0] : a[1]; });
        static_method(M, "Max", {t, t}, t, [](const value&, const std::vector<value>& a){ return compare_values(a[0], a[1]) >= 0 ? a[0] : a[1]; });
    };
    for(type_ref t : {I, U, L, UL, F, D, DEC}) min_max(t);

    static_method(M, "Floor", {D}, D, [](const value&, const std::vector<value>& a){ return value(std::floor(a[0].as<double>())); });
    static_method(M, "Floor", {DEC}, DEC, [](const value&, const std::vector<value>& a){ return value(decimal_t{std::floor(a[0].as<decimal_t>().v)}); });
    static_method(M, "Ceiling", {D}, D, [](const value&, const std::vector<value>& a){ return value(std::ceil(a[0].as<double>())); });
    static_method(M, "Ceiling", {DEC}, DEC, [](const value&, const std::vector<value>& a){ return value(decimal_t{std::ceil(a[0].as<decimal_t>().v)}); });
    static_method(M, "Truncate", {D}, D, [](const value&, const std::vector<value>& a){ return value(std::trunc(a[0].as<double>())); });
    static_method(M, "Truncate", {DEC}, DEC, [](const value&, const std::vector<value>& a){ return value(decimal_t{std::trunc(a[0].as<decimal_t>().v)}); });
    static_method(M, "Round", {D}, D, [](const value&, const std::vector<value>& a){ return value(round_half_even(a[0].as<double>())); });
    static_method(M, "Round", {DEC}, DEC, [](const value&, const std::vector<value>& a){ return value(decimal_t{round_half_even(a[0].as<decimal_t>().v)}); });
    static_method(M, "Round", {D, I}, D, [](const value&, const std::vector<value>& a){
        int32_t digits = a[1].as<int32_t>();
        if(digits < 0 || digits > 15) bad_argument("Rounding digits must be between 0 and 15, inclusive.");
        double p = std::pow(10.0, digits);
        return value(round_half_even(a[0].as<double>() * p) / p);
    });
    auto unary_real = [&](const char* name, double (*fn)(double)){
        static_method(M, name, {D}, D, [fn](const value&, const std::vector<value>& a){ return value(fn(a[0].as<double>())); });
    };
    unary_real("Sqrt", [](double x){ return std::sqrt(x); });
    unary_real("Exp", [](double x){ return std::exp(x); });
    unary_real("Log", [](double x){ return std::log(x); });
    unary_real("Log10", [](double x){ return std::log10(x); });
    unary_real("Sin", [](double x){ return std::sin(x); });
    unary_real("Cos", [](double x){ return std::cos(x); });
    unary_real("Tan", [](double x){ return std::tan(x); });
    static_method(M, "Pow", {D, D}, D, [](const value&, const std::vector<value>& a){ return value(std::pow(a[0].as<double>(), a[1].as<double>())); });

    auto sign = [&](type_ref t){
        static_method(M, "Sign", {t}, I, [](const value&, const std::vector<value>& a){
            long double v = to_long_double(a[0]);
            if(std::isnan(v)) throw evaluation_error(codes::invalid_argument, "Function does not accept floating point Not-a-Number values.");
            return value((int32_t)(v > 0 ? 1 : (v < 0 ? -1 : 0)));
        });
    };
    for(type_ref t : {I, L, D, DEC}) sign(t);
}

void catalog::add_convert(){
    const type_ref C = type_context::instance().convert();
    const type_ref O = T(type_kind::Object);
    static const std::pair<const char*, type_kind> targets[] = {
        {"ToBoolean", type_kind::Boolean}, {"ToChar", type_kind::Char}, {"ToSByte", type_kind::SByte},
        {"ToByte", type_kind::Byte}, {"ToInt16", type_kind::Int16}, {"ToUInt16", type_kind::UInt16},
        {"ToInt32", type_kind::Int32}, {"ToUInt32", type_kind::UInt32}, {"ToInt64", type_kind::Int64},
        {"ToUInt64", type_kind::UInt64}, {"ToSingle", type_kind::Single}, {"ToDouble", type_kind::Double},
        {"ToDecimal", type_kind::Decimal}, {"ToDateTime", type_kind::DateTime}, {"ToString", type_kind::String},
    };
    for(const auto& [name, kind] : targets){
        type_ref t = T(kind);
        static_method(C, name, {O}, t, [t](const value&, const std::vector<value>& a){ return convert_object(a[0], t); });
    }
}

catalog::catalog(){
    add_string();
    add_char();
    add_date_time();
    add_time_span();
    add_guid();
    add_numeric_statics();
    add_math();
    add_convert();
    // every instance type
    method(nullptr, "ToString", {}, T(type_kind::String), [](const value& self, const std::vector<value>&){ return value(to_display(self)); });
}

} // namespace

std::vector<const builtin*> find_builtins(type_ref owner, std::string_view name, bool static_access){
    std::vector<const builtin*> out;
    for(const auto& b : catalog::instance().entries){
        if(b->is_constructor || b->is_static != static_access) continue;
        if(b->owner != owner && !(b->owner == nullptr && !static_access)) continue;
        if(iequals(b->name, name)) out.push_back(b.get());
    }
    return out;
}

std::vector<const builtin*> find_constructors(type_ref owner){
    std::vector<const builtin*> out;
    for(const auto& b : catalog::instance().entries)
        if(b->is_constructor && b->owner == owner) out.push_back(b.get());
    return out;
}

std::vector<std::string> builtin_names(type_ref owner, bool static_access){
    std::vector<std::string> out;
    for(const auto& b : catalog::instance().entries){
        if(b->is_constructor || b->is_static != static_access) continue;
        if(b->owner != owner && !(b->owner == nullptr && !static_access)) continue;
        if(std::find(out.begin(), out.end(), b->name) == out.end()) out.push_back(b->name);
    }
    return out;
}

} // namespace dynq
