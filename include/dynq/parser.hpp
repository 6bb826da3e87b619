// Recursive-descent parser from query text to typed expression trees.
#pragma once
#include "dynq/expression.hpp"
#include "dynq/lexer.hpp"
#include "dynq/overloads.hpp"
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace dynq {

// A value supplied from outside the text: a constant with its static type,
// or a pre-parsed lambda invoked from the text as name(args...).
struct bound_value {
    value val;
    type_ref type{nullptr};
    lambda_ref fn;
};
using named_values = std::vector<std::pair<std::string, bound_value>>;

struct ordering_expr {
    expr_ptr key;
    bool ascending{true};
};

// One parser per text. Names are resolved case-insensitively against, in
// order: keywords and type names, declared parameters, positional values
// (@0 or {0}), named externals, and finally members of the implicit `it`
// (a single unnamed parameter).
class expression_parser {
public:
    expression_parser(const std::vector<parameter_ref>& params, std::string_view text,
                      const std::vector<bound_value>& values = {}, const named_values& externals = {});
    expression_parser(const expression_parser&) = delete;
    expression_parser& operator=(const expression_parser&) = delete;

    // Whole text must be consumed. A non-null result_type requires the root
    // to be promotable to it.
    expr_ptr parse(type_ref result_type);
    // expr [asc|ascending|desc|descending] {, ...}
    std::vector<ordering_expr> parse_ordering();

private:
    struct symbol {
        parameter_ref param;
        bound_value bound;
    };

    void add_symbol(const std::string& name, symbol s);
    void next_token();
    bool token_identifier_is(const char* id) const;
    void validate(token_kind k, const char* code, const char* message) const;
    std::string get_identifier() const;

    expr_ptr parse_expression();
    expr_ptr parse_logical_or();
    expr_ptr parse_logical_and();
    expr_ptr parse_equality();
    expr_ptr parse_relational();
    expr_ptr parse_additive();
    expr_ptr parse_multiplicative();
    expr_ptr parse_unary();
    expr_ptr parse_primary();
    expr_ptr parse_primary_start();
    expr_ptr parse_string_literal();
    expr_ptr parse_integer_literal();
    expr_ptr parse_real_literal();
    expr_ptr parse_paren_expression();
    expr_ptr parse_placeholder();
    expr_ptr parse_identifier();
    expr_ptr parse_it();
    expr_ptr parse_iif();
    expr_ptr parse_new();
    expr_ptr parse_new_array(int pos);
    expr_ptr parse_lambda_invocation(const lambda_ref& fn, int error_pos);
    expr_ptr parse_type_access(type_ref t);
    expr_ptr parse_member_access(type_ref t, expr_ptr instance);
    expr_ptr parse_aggregate(expr_ptr instance, type_ref element, const std::string& name, int error_pos);
    expr_ptr parse_element_access(expr_ptr e);
    std::vector<expr_ptr> parse_argument_list();
    std::vector<expr_ptr> parse_arguments();

    expr_ptr use_bound(const bound_value& b, int pos);
    expr_ptr generate_conditional(expr_ptr test, expr_ptr e1, expr_ptr e2, int error_pos);
    expr_ptr generate_conversion(expr_ptr e, type_ref t, int error_pos);
    void check_and_promote_operands(signature_family family, const token& op, expr_ptr& left, expr_ptr& right);
    void check_and_promote_operand(signature_family family, const token& op, expr_ptr& operand);

    std::string text_;
    lexer lex_;
    token tok_;
    parameter_ref it_;
    std::unordered_map<std::string, symbol> symbols_;   // keyed by lower-case name
    std::vector<std::string> symbol_names_;             // as declared, for suggestions
    std::vector<bound_value> values_;
};

} // namespace dynq
