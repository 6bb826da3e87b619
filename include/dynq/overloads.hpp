// Implicit conversions and overload resolution over fixed signature catalogs.
#pragma once
#include "dynq/expression.hpp"
#include "dynq/types.hpp"
#include <vector>

namespace dynq {

// Operator signature families. Each is an enumerated table of parameter lists.
enum class signature_family {
    Logical,      // && ||
    Arithmetic,   // * / %
    Relational,   // < <= > >=
    Equality,     // == !=
    Add,
    Subtract,
    Negation,     // unary -
    Not           // unary !
};

using signature = std::vector<type_ref>;
const std::vector<signature>& signatures(signature_family family);

// Implicit conversion: identity, numeric widening (char is not widened),
// T -> T?, anything -> Object, null -> reference or nullable. T? -> T never.
bool is_compatible_with(type_ref source, type_ref target);
// Reference assignability for non-value types.
bool is_assignable(type_ref target, type_ref source);

// Returns e converted to `target`, or nullptr when no implicit conversion
// exists. Numeric literals are re-typed from their source text; the null
// literal becomes a typed null. `exact` forces a conversion node even for
// reference targets. On failure e is handed back through `e` untouched.
expr_ptr promote_expression(expr_ptr& e, type_ref target, bool exact);
// Non-destructive probe of promote_expression.
bool can_promote(const expr& e, type_ref target);

// 1 if t1 is the better conversion target from s, -1 if t2, 0 if neither.
int compare_conversions(type_ref s, type_ref t1, type_ref t2);

struct overload_match {
    size_t index{0};                // into the candidate list
    std::vector<expr_ptr> args;     // promoted arguments (valid when count == 1)
};

// Applicable candidates are those whose every parameter accepts the matching
// argument; among several, those better than all others are kept. Returns
// the number of survivors; when it is 1 `match` holds the winner and the
// promoted arguments, and `args` has been consumed.
size_t find_best_overload(const std::vector<signature>& candidates, std::vector<expr_ptr>& args, overload_match& match);

} // namespace dynq
