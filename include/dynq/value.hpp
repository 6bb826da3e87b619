// Runtime values produced and consumed by compiled expressions.
#pragma once
#include "dynq/primitives.hpp"
#include "dynq/types.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace dynq {

class record_type;
struct value_sequence;

// Reference to a record instance. Entity rows are borrowed from their owner
// (owner empty); generated records keep their storage alive through owner.
struct record_ref {
    const record_type* type{nullptr};
    const void* object{nullptr};
    std::shared_ptr<const void> owner;
};

using sequence_ref = std::shared_ptr<const value_sequence>;

using value_storage = std::variant<
    std::monostate, bool, char, std::string,
    int8_t, uint8_t, int16_t, uint16_t, int32_t, uint32_t, int64_t, uint64_t,
    float, double, decimal_t, date_time, time_span, guid,
    record_ref, sequence_ref>;

struct value {
    value_storage v;

    value() = default;
    template<class T, class = std::enable_if_t<!std::is_same_v<std::decay_t<T>, value> &&
                                              std::is_constructible_v<value_storage, T>>>
    value(T&& x) : v(std::forward<T>(x)) {}
    value(const char* s) : v(std::string(s)) {}

    bool is_null() const { return std::holds_alternative<std::monostate>(v); }
    template<class T> bool is() const { return std::holds_alternative<T>(v); }
    template<class T> const T& as() const { return std::get<T>(v); }
};

struct value_sequence {
    type_ref element{nullptr};
    std::vector<value> items;
};

value make_sequence(type_ref element, std::vector<value> items);

// Structural equality: same alternative and equal payload; records compare
// through their record type.
bool values_equal(const value& a, const value& b);
size_t hash_value(const value& v);
// Total order used by sorting: null first, strings ordinal. Records and
// sequences are not comparable and raise evaluation_error.
int compare_values(const value& a, const value& b);
// Display text (ToString): True/False, invariant numbers, {A=1, B=x} for records, "" for null.
std::string to_display(const value& v);

// Parses invariant-culture numeric text (optional sign, surrounding blanks)
// into the non-nullable form of target. nullopt when the text is malformed or
// the value does not fit.
std::optional<value> parse_numeric(std::string_view text, type_ref target);

// Default value of a static type: zero for numerics, null for references and nullables.
value default_value(type_ref t);

} // namespace dynq
