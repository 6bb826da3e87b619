// Typed expression trees produced by the parser.
#pragma once
#include "dynq/types.hpp"
#include "dynq/value.hpp"
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace dynq {

class dynamic_record_type;
struct builtin;

struct parameter {
    std::string name;
    type_ref type{nullptr};
};
using parameter_ref = std::shared_ptr<const parameter>;

inline parameter_ref make_parameter(std::string name, type_ref t){
    return std::make_shared<const parameter>(parameter{std::move(name), t});
}

enum class unary_op { Negate, Not };

enum class binary_op {
    OrElse, AndAlso,
    Equal, NotEqual,
    Less, LessEqual, Greater, GreaterEqual,
    Add, Subtract, Multiply, Divide, Modulo,
    Concat
};

enum class aggregate_fn { Where, Any, All, Count, Min, Max, Sum, Average };

const char* binary_op_name(binary_op op);
const char* aggregate_fn_name(aggregate_fn fn);

struct expr;
using expr_ptr = std::unique_ptr<expr>;
struct lambda;
using lambda_ref = std::shared_ptr<const lambda>;

struct constant_node {
    value val;
    // Source text of a numeric literal; lets a literal be retyped when an
    // operator or argument demands a narrower or wider numeric type.
    std::string literal;
    bool is_null_literal{false};
};
struct param_node { parameter_ref param; };
struct member_node { expr_ptr instance; size_t index{0}; std::string name; };
struct index_node { expr_ptr target; expr_ptr index; };
struct unary_node { unary_op op; expr_ptr operand; };
struct binary_node { binary_op op; expr_ptr left; expr_ptr right; };
struct conditional_node { expr_ptr test; expr_ptr if_true; expr_ptr if_false; };
// checked conversions fault on out-of-range values; implicit ones are widening only
struct convert_node { expr_ptr operand; bool checked{false}; };
// value ?? fallback
struct coalesce_node { expr_ptr operand; expr_ptr fallback; };
struct call_node { const builtin* fn{nullptr}; expr_ptr instance; std::vector<expr_ptr> args; };
struct new_record_node { const dynamic_record_type* record{nullptr}; std::vector<size_t> slots; std::vector<expr_ptr> args; };
struct new_array_node { std::vector<expr_ptr> items; };
struct aggregate_node { aggregate_fn fn; expr_ptr source; parameter_ref element; expr_ptr body; };
struct invoke_node { lambda_ref target; std::vector<expr_ptr> args; };

using expr_node = std::variant<
    constant_node, param_node, member_node, index_node, unary_node, binary_node,
    conditional_node, convert_node, coalesce_node, call_node, new_record_node,
    new_array_node, aggregate_node, invoke_node>;

struct expr {
    type_ref type{nullptr};
    int pos{0};
    expr_node node;
};

template<class Node>
expr_ptr make_expr(type_ref t, int pos, Node n){
    auto e = std::make_unique<expr>();
    e->type = t;
    e->pos = pos;
    e->node = std::move(n);
    return e;
}

expr_ptr make_constant(value v, type_ref t, int pos=0);
expr_ptr make_convert(expr_ptr e, type_ref t, bool checked=false);
bool is_null_literal(const expr& e);

struct lambda {
    std::vector<parameter_ref> params;
    expr_ptr body;
    type_ref result_type() const { return body ? body->type : nullptr; }
};

lambda_ref make_lambda(std::vector<parameter_ref> params, expr_ptr body);

// Deterministic textual dump, e.g. (Less (Member it ConferenceId) (Const Int32 100)).
std::string to_string(const expr& e);
std::string to_string(const lambda& l);

} // namespace dynq
