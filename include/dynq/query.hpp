// Typed query composition: predicates, filter builder, ordering clauses and
// the query specification consumed by repositories.
#pragma once
#include "dynq/dynamic_expression.hpp"
#include "dynq/entity.hpp"
#include "dynq/queryable.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace dynq {

inline const bound_value& bind(const bound_value& b){ return b; }

// Row predicate given as a callable or as query text over the entity. Text
// is compiled on first use and the compiled form is shared by copies.
// An empty predicate matches every row.
template<class T>
class predicate {
public:
    predicate() = default;

    template<class F, class = std::enable_if_t<!std::is_same_v<std::decay_t<F>, predicate> &&
                                              !std::is_convertible_v<F, std::string> &&
                                              std::is_invocable_r_v<bool, F, const T&>>>
    predicate(F fn) : fn_(std::move(fn)) {}

    predicate(std::string text, std::vector<bound_value> values = {})
        : text_(std::make_shared<textual>(std::move(text), std::move(values))) {}
    predicate(const char* text) : predicate(std::string(text)) {}

    bool empty() const { return !fn_ && !text_; }
    bool is_textual() const { return text_ != nullptr; }
    const std::string& text() const {
        static const std::string none;
        return text_ ? text_->text : none;
    }

    bool operator()(const T& row) const {
        if(fn_) return fn_(row);
        if(text_) return is_true(text_->compiled()(entity_type<T>::instance().wrap(row)));
        return true;
    }

    // Surfaces parse errors of textual predicates without running them.
    void prepare() const { if(text_) text_->compiled(); }

private:
    struct textual {
        textual(std::string t, std::vector<bound_value> v) : text(std::move(t)), values(std::move(v)) {}
        const compiled_lambda& compiled(){
            std::call_once(once, [this]{ fn = compile_lambda(entity_type_of<T>(), bool_type(), text, values); });
            return fn;
        }
        std::string text;
        std::vector<bound_value> values;
        std::once_flag once;
        compiled_lambda fn;
    };

    std::function<bool(const T&)> fn_;
    std::shared_ptr<textual> text_;
};

// Fluent predicate builder. start() replaces the expression, or clears it
// when condition is false; and_/or_ with a false condition change nothing.
template<class T>
class filter_expression {
public:
    filter_expression& start(predicate<T> p, bool condition = true){
        expr_ = condition ? std::move(p) : predicate<T>();
        return *this;
    }
    filter_expression& and_(predicate<T> p, bool condition = true){
        return combine(std::move(p), condition, true);
    }
    filter_expression& or_(predicate<T> p, bool condition = true){
        return combine(std::move(p), condition, false);
    }
    const predicate<T>& result() const { return expr_; }
    bool empty() const { return expr_.empty(); }

private:
    filter_expression& combine(predicate<T> p, bool condition, bool conjunction){
        if(!condition || p.empty()) return *this;
        if(expr_.empty()){
            expr_ = std::move(p);
            return *this;
        }
        predicate<T> left = std::move(expr_);
        if(conjunction) expr_ = predicate<T>([left, p](const T& row){ return left(row) && p(row); });
        else expr_ = predicate<T>([left, p](const T& row){ return left(row) || p(row); });
        return *this;
    }

    predicate<T> expr_;
};

// Typed multi-key ordering. The first key is primary; later keys break ties.
template<class T>
class order_by_clause {
public:
    using key_fn = std::function<value(const T&)>;
    struct selector {
        key_fn key;
        bool ascending{true};
    };

    template<class K> order_by_clause& order_by(K key){ return add(std::move(key), true); }
    template<class K> order_by_clause& order_by_descending(K key){ return add(std::move(key), false); }
    template<class K> order_by_clause& then_by(K key){ return add(std::move(key), true); }
    template<class K> order_by_clause& then_by_descending(K key){ return add(std::move(key), false); }

    const std::vector<selector>& selectors() const { return selectors_; }
    bool empty() const { return selectors_.empty(); }

    // Stable: rows equal on every key keep their relative order.
    void sort(std::vector<const T*>& rows) const {
        std::vector<std::vector<value>> keys(rows.size());
        std::vector<bool> ascending;
        for(const auto& s : selectors_) ascending.push_back(s.ascending);
        for(size_t i = 0; i < rows.size(); ++i)
            for(const auto& s : selectors_) keys[i].push_back(s.key(*rows[i]));
        std::vector<const T*> sorted;
        sorted.reserve(rows.size());
        for(size_t i : stable_order(keys, ascending)) sorted.push_back(rows[i]);
        rows.swap(sorted);
    }

private:
    template<class M>
    static key_fn to_key(M T::*member){
        return [member](const T& row){ return value_traits<M>::to_value(row.*member); };
    }
    template<class F>
    static key_fn to_key(F fn){
        using R = std::decay_t<std::invoke_result_t<F, const T&>>;
        return [fn](const T& row){ return value_traits<R>::to_value(fn(row)); };
    }
    template<class K>
    order_by_clause& add(K key, bool ascending){
        selectors_.push_back(selector{to_key(std::move(key)), ascending});
        return *this;
    }

    std::vector<selector> selectors_;
};

// Query specification: filter, then order, then limit or page.
template<class T>
class query {
public:
    query() = default;
    query(predicate<T> where){ where_.start(std::move(where)); }
    template<class... A>
    query(std::string text, const A&... values){ where(std::move(text), values...); }

    query& where(predicate<T> p){ where_.start(std::move(p)); return *this; }
    template<class... A>
    query& where(std::string text, const A&... values){
        return where(predicate<T>(std::move(text), std::vector<bound_value>{bind(values)...}));
    }
    query& where_and(predicate<T> p){ where_.and_(std::move(p)); return *this; }
    template<class... A>
    query& where_and(std::string text, const A&... values){
        return where_and(predicate<T>(std::move(text), std::vector<bound_value>{bind(values)...}));
    }
    query& where_or(predicate<T> p){ where_.or_(std::move(p)); return *this; }
    template<class... A>
    query& where_or(std::string text, const A&... values){
        return where_or(predicate<T>(std::move(text), std::vector<bound_value>{bind(values)...}));
    }

    // Typed ordering; continue with then_by on the returned clause.
    template<class K, class = std::enable_if_t<std::is_member_object_pointer_v<K> || std::is_invocable_v<K, const T&>>>
    order_by_clause<T>& order_by(K key){ return order_.order_by(std::move(key)); }
    template<class K>
    order_by_clause<T>& order_by_descending(K key){ return order_.order_by_descending(std::move(key)); }
    query& order_by(order_by_clause<T> clause){ order_ = std::move(clause); return *this; }
    // Textual ordering such as "Status, ConferenceId desc". Typed keys take precedence.
    template<class... A>
    query& order_by(const char* text, const A&... values){
        ordering_ = std::make_shared<textual_ordering>(text, std::vector<bound_value>{bind(values)...});
        return *this;
    }

    query& limit(size_t n){ limit_ = n; return *this; }
    // 1-based page index.
    query& page(size_t index, size_t size){
        if(index < 1 || size < 1) throw std::invalid_argument("query::page: index and size must be positive");
        page_ = std::make_pair(index, size);
        return *this;
    }

    const predicate<T>& where_clause() const { return where_.result(); }
    const order_by_clause<T>& order_clause() const { return order_; }
    const std::string& order_text() const {
        static const std::string none;
        return ordering_ ? ordering_->text : none;
    }
    std::optional<size_t> limit() const { return limit_; }
    std::optional<std::pair<size_t, size_t>> paging() const { return page_; }

    // Compiles every textual fragment now instead of on first execution.
    void prepare() const {
        where_clause().prepare();
        if(ordering_) ordering_->compiled();
    }

    void order(std::vector<const T*>& rows) const {
        if(!order_.empty()){
            order_.sort(rows);
            return;
        }
        if(!ordering_) return;
        std::vector<value> items;
        items.reserve(rows.size());
        for(const T* r : rows) items.push_back(entity_type<T>::instance().wrap(*r));
        std::vector<const T*> sorted;
        sorted.reserve(rows.size());
        for(size_t i : stable_order(items, ordering_->compiled())) sorted.push_back(rows[i]);
        rows.swap(sorted);
    }

private:
    struct textual_ordering {
        textual_ordering(std::string t, std::vector<bound_value> v) : text(std::move(t)), values(std::move(v)) {}
        const std::vector<sort_key>& compiled(){
            std::call_once(once, [this]{ keys = compile_ordering(entity_type_of<T>(), text, values); });
            return keys;
        }
        std::string text;
        std::vector<bound_value> values;
        std::once_flag once;
        std::vector<sort_key> keys;
    };

    filter_expression<T> where_;
    order_by_clause<T> order_;
    std::shared_ptr<textual_ordering> ordering_;
    std::optional<size_t> limit_;
    std::optional<std::pair<size_t, size_t>> page_;
};

} // namespace dynq
