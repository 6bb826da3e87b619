#include "dynq/value.hpp"
#include "dynq/errors.hpp"
#include "dynq/record.hpp"
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <functional>
#include <sstream>
#include <type_traits>

namespace dynq {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

template<class T> int three_way(const T& a, const T& b){
    if constexpr(std::is_floating_point_v<T>){
        // NaN orders before every number and equal to itself
        if(std::isnan(a) || std::isnan(b)) return std::isnan(a) == std::isnan(b) ? 0 : (std::isnan(a) ? -1 : 1);
    }
    return a < b ? -1 : (b < a ? 1 : 0);
}
// char is an unsigned 8-bit code unit, as in ordinal string comparison
int three_way(char a, char b){ return three_way((unsigned char)a, (unsigned char)b); }

std::string format_real(double d, int precision){
    if(std::isnan(d)) return "NaN";
    if(std::isinf(d)) return d > 0 ? "Infinity" : "-Infinity";
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*g", precision, d);
    return buf;
}

} // namespace

value make_sequence(type_ref element, std::vector<value> items){
    auto seq = std::make_shared<value_sequence>();
    seq->element = element;
    seq->items = std::move(items);
    return value(sequence_ref(std::move(seq)));
}

bool values_equal(const value& a, const value& b){
    if(a.v.index() != b.v.index()) return false;
    return std::visit(overloaded{
        [&](const std::monostate&){ return true; },
        [&](const record_ref& ra){
            const auto& rb = std::get<record_ref>(b.v);
            if(ra.type != rb.type) return false;
            return ra.object == rb.object || ra.type->equals(ra.object, rb.object);
        },
        [&](const sequence_ref& sa){
            const auto& sb = std::get<sequence_ref>(b.v);
            if(sa == sb) return true;
            if(!sa || !sb || sa->items.size() != sb->items.size()) return false;
            for(size_t i = 0; i < sa->items.size(); ++i)
                if(!values_equal(sa->items[i], sb->items[i])) return false;
            return true;
        },
        [&](const auto& x){
            using T = std::decay_t<decltype(x)>;
            return x == std::get<T>(b.v);
        }}, a.v);
}

size_t hash_value(const value& v){
    return std::visit(overloaded{
        [](const std::monostate&) -> size_t { return 0; },
        [](const record_ref& r) -> size_t { return r.type->hash(r.object); },
        [](const sequence_ref& s) -> size_t {
            size_t h = 0;
            if(s) for(const auto& item : s->items) h = h * 31 + hash_value(item);
            return h;
        },
        [](const decimal_t& d) -> size_t { return std::hash<long double>{}(d.v); },
        [](const date_time& d) -> size_t { return std::hash<int64_t>{}(d.ticks); },
        [](const time_span& t) -> size_t { return std::hash<int64_t>{}(t.ticks); },
        [](const guid& g) -> size_t {
            size_t h = 0;
            for(uint8_t b : g.bytes) h = h * 131 + b;
            return h;
        },
        [](const auto& x) -> size_t { return std::hash<std::decay_t<decltype(x)>>{}(x); }}, v.v);
}

int compare_values(const value& a, const value& b){
    if(a.is_null() || b.is_null()) return a.is_null() == b.is_null() ? 0 : (a.is_null() ? -1 : 1);
    if(a.v.index() != b.v.index())
        throw evaluation_error(codes::invalid_argument, "Values of different types cannot be compared");
    return std::visit(overloaded{
        [&](const std::monostate&){ return 0; },
        [&](const std::string& s){ int c = s.compare(std::get<std::string>(b.v)); return c < 0 ? -1 : (c > 0 ? 1 : 0); },
        [&](const record_ref& r) -> int {
            throw evaluation_error(codes::invalid_argument, "Type '" + r.type->name() + "' is not comparable");
        },
        [&](const sequence_ref&) -> int {
            throw evaluation_error(codes::invalid_argument, "Sequences are not comparable");
        },
        [&](const auto& x){
            using T = std::decay_t<decltype(x)>;
            return three_way(x, std::get<T>(b.v));
        }}, a.v);
}

std::string to_display(const value& v){
    return std::visit(overloaded{
        [](const std::monostate&) -> std::string { return ""; },
        [](bool b) -> std::string { return b ? "True" : "False"; },
        [](char c) -> std::string { return std::string(1, c); },
        [](const std::string& s) -> std::string { return s; },
        [](int8_t x) -> std::string { return std::to_string((int)x); },
        [](uint8_t x) -> std::string { return std::to_string((unsigned)x); },
        [](float f) -> std::string { return format_real(f, 9); },
        [](double d) -> std::string { return format_real(d, 15); },
        [](const decimal_t& d) -> std::string {
            std::ostringstream os;
            os.precision(28);
            os << d.v;
            return os.str();
        },
        [](const date_time& d) -> std::string { return d.to_string(); },
        [](const time_span& t) -> std::string { return t.to_string(); },
        [](const guid& g) -> std::string { return g.to_string(); },
        [](const record_ref& r) -> std::string { return r.type->to_string(r.object); },
        [](const sequence_ref& s) -> std::string {
            std::string out = "[";
            if(s){
                for(size_t i = 0; i < s->items.size(); ++i){
                    if(i) out += ", ";
                    out += to_display(s->items[i]);
                }
            }
            return out + "]";
        },
        [](const auto& x) -> std::string { return std::to_string(x); }}, v.v);
}

namespace {

template<class T>
std::optional<value> fit_signed(int64_t v){
    if(v < (int64_t)std::numeric_limits<T>::min() || v > (int64_t)std::numeric_limits<T>::max()) return std::nullopt;
    return value(static_cast<T>(v));
}

template<class T>
std::optional<value> fit_unsigned(uint64_t v){
    if(v > (uint64_t)std::numeric_limits<T>::max()) return std::nullopt;
    return value(static_cast<T>(v));
}

bool real_chars_only(std::string_view s){
    for(char c : s)
        if(!((c >= '0' && c <= '9') || c == '.' || c == 'e' || c == 'E' || c == '+' || c == '-')) return false;
    return !s.empty();
}

} // namespace

std::optional<value> parse_numeric(std::string_view text, type_ref target){
    while(!text.empty() && std::isspace((unsigned char)text.front())) text.remove_prefix(1);
    while(!text.empty() && std::isspace((unsigned char)text.back())) text.remove_suffix(1);
    if(text.empty() || !target) return std::nullopt;
    type_ref t = non_nullable(target);
    if(is_integral(t)){
        bool negative = text.front() == '-';
        std::string_view digits = (text.front() == '-' || text.front() == '+') ? text.substr(1) : text;
        if(digits.empty()) return std::nullopt;
        uint64_t mag = 0;
        auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), mag);
        if(ec != std::errc() || end != digits.data() + digits.size()) return std::nullopt;
        if(is_unsigned_integral(t)){
            if(negative && mag != 0) return std::nullopt;
            switch(t->kind){
                case type_kind::Byte: return fit_unsigned<uint8_t>(mag);
                case type_kind::UInt16: return fit_unsigned<uint16_t>(mag);
                case type_kind::UInt32: return fit_unsigned<uint32_t>(mag);
                default: return fit_unsigned<uint64_t>(mag);
            }
        }
        const uint64_t limit = negative ? (uint64_t)std::numeric_limits<int64_t>::max() + 1 : (uint64_t)std::numeric_limits<int64_t>::max();
        if(mag > limit) return std::nullopt;
        int64_t v = negative ? (int64_t)(0 - mag) : (int64_t)mag;
        switch(t->kind){
            case type_kind::SByte: return fit_signed<int8_t>(v);
            case type_kind::Int16: return fit_signed<int16_t>(v);
            case type_kind::Int32: return fit_signed<int32_t>(v);
            default: return value(v);
        }
    }
    if(t->kind != type_kind::Single && t->kind != type_kind::Double && t->kind != type_kind::Decimal) return std::nullopt;
    if(!real_chars_only(text)) return std::nullopt;
    std::string buf(text);
    char* end = nullptr;
    errno = 0;
    long double d = std::strtold(buf.c_str(), &end);
    if(end != buf.c_str() + buf.size()) return std::nullopt;
    switch(t->kind){
        case type_kind::Single:
            if(std::fabs(d) > std::numeric_limits<float>::max()) return std::nullopt;
            return value(static_cast<float>(d));
        case type_kind::Double:
            if(errno == ERANGE && std::isinf((double)d)) return std::nullopt;
            if(std::fabs(d) > std::numeric_limits<double>::max()) return std::nullopt;
            return value(static_cast<double>(d));
        default:
            if(errno == ERANGE) return std::nullopt;
            return value(decimal_t{d});
    }
}

value default_value(type_ref t){
    if(!t) return value{};
    switch(t->kind){
        case type_kind::Boolean: return value(false);
        case type_kind::Char: return value('\0');
        case type_kind::SByte: return value(int8_t{0});
        case type_kind::Byte: return value(uint8_t{0});
        case type_kind::Int16: return value(int16_t{0});
        case type_kind::UInt16: return value(uint16_t{0});
        case type_kind::Int32: return value(int32_t{0});
        case type_kind::UInt32: return value(uint32_t{0});
        case type_kind::Int64: return value(int64_t{0});
        case type_kind::UInt64: return value(uint64_t{0});
        case type_kind::Single: return value(0.0f);
        case type_kind::Double: return value(0.0);
        case type_kind::Decimal: return value(decimal_t{});
        case type_kind::DateTime: return value(date_time{});
        case type_kind::TimeSpan: return value(time_span{});
        case type_kind::Guid: return value(guid{});
        default: return value{};
    }
}

} // namespace dynq
