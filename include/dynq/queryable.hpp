// Textual query operators over in-memory sequences.
#pragma once
#include "dynq/dynamic_expression.hpp"
#include "dynq/entity.hpp"
#include "dynq/value.hpp"
#include <algorithm>
#include <string_view>
#include <vector>

namespace dynq {

struct sort_key {
    compiled_lambda key;
    bool ascending{true};
};

// Compiles "a, b desc, ..." against element.
std::vector<sort_key> compile_ordering(type_ref element, std::string_view text,
                                       const std::vector<bound_value>& values = {}, compile_options opts = {});

// Positions of rows in stable multi-key order: keys[i][k] is key k of row i.
// Later keys only break ties of earlier ones; full ties keep input order.
std::vector<size_t> stable_order(const std::vector<std::vector<value>>& keys, const std::vector<bool>& ascending);
std::vector<size_t> stable_order(const std::vector<value>& items, const std::vector<sort_key>& keys);

// true only for a non-null true; predicates are bool-typed so null cannot occur.
inline bool is_true(const value& v){ return v.is<bool>() && v.as<bool>(); }

namespace dynamic_queryable {

value_sequence where(const value_sequence& source, std::string_view predicate,
                     const std::vector<bound_value>& values = {}, compile_options opts = {});
value_sequence order_by(const value_sequence& source, std::string_view ordering,
                        const std::vector<bound_value>& values = {});
// Element type of the result is the selector's type; new(...) selectors yield generated records.
value_sequence select(const value_sequence& source, std::string_view selector,
                      const std::vector<bound_value>& values = {});
// Groups in order of first appearance. Each group is a generated record
// { Key, Items } where Items holds the selected elements.
value_sequence group_by(const value_sequence& source, std::string_view key_selector, std::string_view element_selector,
                        const std::vector<bound_value>& values = {});
value_sequence take(const value_sequence& source, size_t count);
value_sequence skip(const value_sequence& source, size_t count);
bool any(const value_sequence& source);
bool any(const value_sequence& source, std::string_view predicate, const std::vector<bound_value>& values = {});
size_t count(const value_sequence& source);
size_t count(const value_sequence& source, std::string_view predicate, const std::vector<bound_value>& values = {});

// Borrowing view of entity rows; valid while rows is alive and unchanged.
template<class T>
value_sequence as_sequence(const std::vector<T>& rows){
    value_sequence out;
    out.element = entity_type_of<T>();
    out.items.reserve(rows.size());
    for(const auto& r : rows) out.items.push_back(entity_type<T>::instance().wrap(r));
    return out;
}

template<class T>
std::vector<T> where(const std::vector<T>& rows, std::string_view predicate, const std::vector<bound_value>& values = {}){
    compiled_lambda fn = compile_lambda(entity_type_of<T>(), bool_type(), predicate, values);
    std::vector<T> out;
    for(const auto& r : rows)
        if(is_true(fn(entity_type<T>::instance().wrap(r)))) out.push_back(r);
    return out;
}

template<class T>
std::vector<T> order_by(const std::vector<T>& rows, std::string_view ordering, const std::vector<bound_value>& values = {}){
    value_sequence seq = as_sequence(rows);
    std::vector<size_t> order = stable_order(seq.items, compile_ordering(seq.element, ordering, values));
    std::vector<T> out;
    out.reserve(rows.size());
    for(size_t i : order) out.push_back(rows[i]);
    return out;
}

// Projection results of entity rows may borrow from rows (e.g. "it" or a nested entity).
template<class T>
value_sequence select(const std::vector<T>& rows, std::string_view selector, const std::vector<bound_value>& values = {}){
    return select(as_sequence(rows), selector, values);
}

template<class T>
size_t count(const std::vector<T>& rows, std::string_view predicate, const std::vector<bound_value>& values = {}){
    return count(as_sequence(rows), predicate, values);
}

template<class T>
bool any(const std::vector<T>& rows, std::string_view predicate, const std::vector<bound_value>& values = {}){
    return any(as_sequence(rows), predicate, values);
}

} // namespace dynamic_queryable

} // namespace dynq
