// Tree-walking interpreter for parsed expressions.
#pragma once
#include "dynq/expression.hpp"
#include "dynq/value.hpp"
#include <utility>
#include <vector>

namespace dynq {

// Parameter bindings visible while evaluating; inner scopes (aggregate
// element parameters, invoked lambdas) push on top and pop on exit.
class frame {
public:
    void push(const parameter* p, value v){ slots_.emplace_back(p, std::move(v)); }
    void pop(){ slots_.pop_back(); }
    size_t depth() const { return slots_.size(); }
    void truncate(size_t depth){ slots_.resize(depth); }
    const value& lookup(const parameter* p) const;

private:
    std::vector<std::pair<const parameter*, value>> slots_;
};

value evaluate(const expr& e, frame& f);
// Binds args to the lambda's parameters positionally; throws std::invalid_argument on arity mismatch.
value invoke(const lambda& l, const std::vector<value>& args);

// Converts v to target. Widening conversions never fail; checked ones raise
// evaluation_error(overflow) when the value does not fit. null converts to
// null for nullable targets and faults otherwise.
value convert_value(const value& v, type_ref target, bool checked);

// Numeric views used by arithmetic and builtins.
long double to_long_double(const value& v);
int64_t to_int64(const value& v);
uint64_t to_uint64(const value& v);

} // namespace dynq
