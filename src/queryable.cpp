#include "dynq/queryable.hpp"
#include "dynq/record.hpp"

#include <numeric>
#include <stdexcept>
#include <unordered_map>

namespace dynq {

namespace {

void require_element(const value_sequence& source, const char* op){
    if(!source.element) throw std::invalid_argument(std::string(op) + ": sequence has no element type");
}

struct value_hash { size_t operator()(const value& v) const { return hash_value(v); } };
struct value_eq { bool operator()(const value& a, const value& b) const { return values_equal(a, b); } };

} // namespace

std::vector<sort_key> compile_ordering(type_ref element, std::string_view text,
                                       const std::vector<bound_value>& values, compile_options opts){
    std::vector<sort_key> keys;
    for(auto& o : parse_ordering(element, text, values))
        keys.push_back(sort_key{compiled_lambda(std::move(o.key), std::string(text), opts), o.ascending});
    return keys;
}

std::vector<size_t> stable_order(const std::vector<std::vector<value>>& keys, const std::vector<bool>& ascending){
    std::vector<size_t> order(keys.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b){
        for(size_t k = 0; k < ascending.size(); ++k){
            int c = compare_values(keys[a][k], keys[b][k]);
            if(c != 0) return ascending[k] ? c < 0 : c > 0;
        }
        return false;
    });
    return order;
}

std::vector<size_t> stable_order(const std::vector<value>& items, const std::vector<sort_key>& keys){
    std::vector<std::vector<value>> table(items.size());
    std::vector<bool> ascending;
    for(const auto& k : keys) ascending.push_back(k.ascending);
    for(size_t i = 0; i < items.size(); ++i){
        table[i].reserve(keys.size());
        for(const auto& k : keys) table[i].push_back(k.key(items[i]));
    }
    return stable_order(table, ascending);
}

namespace dynamic_queryable {

value_sequence where(const value_sequence& source, std::string_view predicate,
                     const std::vector<bound_value>& values, compile_options opts){
    require_element(source, "where");
    compiled_lambda fn = compile_lambda(source.element, bool_type(), predicate, values, opts);
    value_sequence out;
    out.element = source.element;
    for(const auto& item : source.items)
        if(is_true(fn(item))) out.items.push_back(item);
    return out;
}

value_sequence order_by(const value_sequence& source, std::string_view ordering, const std::vector<bound_value>& values){
    require_element(source, "order_by");
    std::vector<size_t> order = stable_order(source.items, compile_ordering(source.element, ordering, values));
    value_sequence out;
    out.element = source.element;
    out.items.reserve(order.size());
    for(size_t i : order) out.items.push_back(source.items[i]);
    return out;
}

value_sequence select(const value_sequence& source, std::string_view selector, const std::vector<bound_value>& values){
    require_element(source, "select");
    compiled_lambda fn = compile_lambda(source.element, nullptr, selector, values);
    value_sequence out;
    out.element = fn.result_type();
    out.items.reserve(source.items.size());
    for(const auto& item : source.items) out.items.push_back(fn(item));
    return out;
}

value_sequence group_by(const value_sequence& source, std::string_view key_selector, std::string_view element_selector,
                        const std::vector<bound_value>& values){
    require_element(source, "group_by");
    compiled_lambda key = compile_lambda(source.element, nullptr, key_selector, values);
    compiled_lambda elem = compile_lambda(source.element, nullptr, element_selector, values);

    std::vector<value> keys;
    std::vector<std::vector<value>> groups;
    std::unordered_map<value, size_t, value_hash, value_eq> index;
    for(const auto& item : source.items){
        value k = key(item);
        auto [it, fresh] = index.emplace(k, groups.size());
        if(fresh){
            keys.push_back(std::move(k));
            groups.emplace_back();
        }
        groups[it->second].push_back(elem(item));
    }

    const dynamic_record_type* grouping = compile_record_type({
        property{"Key", key.result_type()},
        property{"Items", sequence_of(elem.result_type())}});
    const size_t key_slot = *grouping->find_property("Key");
    const size_t items_slot = *grouping->find_property("Items");

    value_sequence out;
    out.element = grouping->as_type();
    for(size_t g = 0; g < groups.size(); ++g){
        std::vector<value> fields(grouping->properties().size());
        fields[key_slot] = keys[g];
        fields[items_slot] = make_sequence(elem.result_type(), std::move(groups[g]));
        out.items.push_back(grouping->make(std::move(fields)));
    }
    return out;
}

value_sequence take(const value_sequence& source, size_t count){
    value_sequence out;
    out.element = source.element;
    size_t n = std::min(count, source.items.size());
    out.items.assign(source.items.begin(), source.items.begin() + (std::ptrdiff_t)n);
    return out;
}

value_sequence skip(const value_sequence& source, size_t count){
    value_sequence out;
    out.element = source.element;
    size_t n = std::min(count, source.items.size());
    out.items.assign(source.items.begin() + (std::ptrdiff_t)n, source.items.end());
    return out;
}

bool any(const value_sequence& source){ return !source.items.empty(); }

bool any(const value_sequence& source, std::string_view predicate, const std::vector<bound_value>& values){
    require_element(source, "any");
    compiled_lambda fn = compile_lambda(source.element, bool_type(), predicate, values);
    return std::any_of(source.items.begin(), source.items.end(), [&](const value& v){ return is_true(fn(v)); });
}

size_t count(const value_sequence& source){ return source.items.size(); }

size_t count(const value_sequence& source, std::string_view predicate, const std::vector<bound_value>& values){
    require_element(source, "count");
    compiled_lambda fn = compile_lambda(source.element, bool_type(), predicate, values);
    return (size_t)std::count_if(source.items.begin(), source.items.end(), [&](const value& v){ return is_true(fn(v)); });
}

} // namespace dynamic_queryable

} // namespace dynq
