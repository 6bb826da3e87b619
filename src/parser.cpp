#include "dynq/parser.hpp"
#include "dynq/builtins.hpp"
#include "dynq/diagnostics.hpp"
#include "dynq/errors.hpp"
#include "dynq/record.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>
#include <limits>
#include <optional>
#include <stdexcept>

namespace dynq {

namespace {

std::string lower(std::string_view s){
    std::string out(s);
    for(char& c : out) c = (char)std::tolower((unsigned char)c);
    return out;
}

bool iequals(std::string_view a, std::string_view b){
    if(a.size() != b.size()) return false;
    for(size_t i = 0; i < a.size(); ++i)
        if(std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
    return true;
}

std::string quoted(const std::string& s){ return "'" + s + "'"; }

const char* const keyword_names[] = {"true", "false", "null", "it", "iif", "new"};

// Name a projection member takes when no `as` clause is given.
std::optional<std::string> member_name_of(const expr& e){
    if(auto m = std::get_if<member_node>(&e.node)) return m->name;
    if(auto c = std::get_if<call_node>(&e.node))
        if(c->fn->is_property) return c->fn->name;
    return std::nullopt;
}

// Typed null for a reference or nullable target, otherwise a conversion.
expr_ptr convert_reference(expr_ptr e, type_ref t){
    if(is_null_literal(*e)) return make_constant(value{}, t, e->pos);
    return make_convert(std::move(e), t);
}

type_ref arithmetic_result(binary_op op, type_ref left, type_ref right){
    if(op == binary_op::Subtract &&
       non_nullable(left)->kind == type_kind::DateTime && non_nullable(right)->kind == type_kind::DateTime){
        type_ref span = base_type(type_kind::TimeSpan);
        return is_nullable(left) ? nullable_of(span) : span;
    }
    return left;
}

std::optional<aggregate_fn> aggregate_by_name(const std::string& name){
    static const std::pair<const char*, aggregate_fn> table[] = {
        {"Where", aggregate_fn::Where}, {"Any", aggregate_fn::Any}, {"All", aggregate_fn::All},
        {"Count", aggregate_fn::Count}, {"Min", aggregate_fn::Min}, {"Max", aggregate_fn::Max},
        {"Sum", aggregate_fn::Sum}, {"Average", aggregate_fn::Average},
    };
    for(const auto& [n, fn] : table)
        if(iequals(n, name)) return fn;
    return std::nullopt;
}

std::vector<std::string> aggregate_names(){
    return {"Where", "Any", "All", "Count", "Min", "Max", "Sum", "Average"};
}

const std::vector<signature>& aggregate_signatures(aggregate_fn fn){
    static const std::vector<signature> predicate = {{bool_type()}};
    static const std::vector<signature> optional_predicate = {{}, {bool_type()}};
    static const std::vector<signature> selector = {{object_type()}};
    static const std::vector<signature> numeric = [](){
        std::vector<signature> out;
        for(type_kind k : {type_kind::Int32, type_kind::Int64, type_kind::Single, type_kind::Double, type_kind::Decimal}){
            out.push_back({base_type(k)});
            out.push_back({nullable_of(base_type(k))});
        }
        return out;
    }();
    switch(fn){
        case aggregate_fn::Where: case aggregate_fn::All: return predicate;
        case aggregate_fn::Any: case aggregate_fn::Count: return optional_predicate;
        case aggregate_fn::Min: case aggregate_fn::Max: return selector;
        case aggregate_fn::Sum: case aggregate_fn::Average: return numeric;
    }
    return predicate;
}

type_ref aggregate_result(aggregate_fn fn, type_ref element, type_ref body){
    switch(fn){
        case aggregate_fn::Where: return sequence_of(element);
        case aggregate_fn::Any: case aggregate_fn::All: return bool_type();
        case aggregate_fn::Count: return int_type();
        case aggregate_fn::Min: case aggregate_fn::Max: case aggregate_fn::Sum: return body;
        case aggregate_fn::Average: {
            type_ref t = non_nullable(body);
            if(t->kind == type_kind::Int32 || t->kind == type_kind::Int64) t = base_type(type_kind::Double);
            return is_nullable(body) ? nullable_of(t) : t;
        }
    }
    return body;
}

std::vector<signature> indexer_signatures(type_ref t){
    if(t == string_type()) return {{int_type()}};
    return {};
}

// Restores the implicit `it` when an aggregate argument list is left.
struct it_scope {
    parameter_ref& slot;
    parameter_ref saved;
    it_scope(parameter_ref& s, parameter_ref inner) : slot(s), saved(s) { slot = std::move(inner); }
    ~it_scope(){ slot = std::move(saved); }
};

} // namespace

expression_parser::expression_parser(const std::vector<parameter_ref>& params, std::string_view text,
                                     const std::vector<bound_value>& values, const named_values& externals)
    : text_(text), lex_(text_), values_(values)
{
    tok_ = lex_.current();
    for(const auto& p : params){
        if(!p) throw std::invalid_argument("lambda parameter must not be null");
        if(!p->name.empty()) add_symbol(p->name, symbol{p, {}});
    }
    if(params.size() == 1 && params[0]->name.empty()) it_ = params[0];
    for(size_t i = 0; i < values_.size(); ++i){
        if(!values_[i].fn && !values_[i].type) throw std::invalid_argument("value @" + std::to_string(i) + " has no static type");
        add_symbol("@" + std::to_string(i), symbol{nullptr, values_[i]});
    }
    for(const auto& [name, b] : externals){
        if(!b.fn && !b.type) throw std::invalid_argument("external '" + name + "' has no static type");
        add_symbol(name, symbol{nullptr, b});
    }
}

void expression_parser::add_symbol(const std::string& name, symbol s){
    std::string key = lower(name);
    if(symbols_.count(key))
        throw parse_error(codes::duplicate_identifier, "The identifier " + quoted(name) + " was defined more than once", 0);
    symbols_.emplace(std::move(key), std::move(s));
    symbol_names_.push_back(name);
}

void expression_parser::next_token(){
    lex_.next();
    tok_ = lex_.current();
}

bool expression_parser::token_identifier_is(const char* id) const {
    return tok_.kind == token_kind::Identifier && iequals(tok_.text, id);
}

void expression_parser::validate(token_kind k, const char* code, const char* message) const {
    if(tok_.kind != k) throw parse_error(code, message, tok_.pos);
}

std::string expression_parser::get_identifier() const {
    validate(token_kind::Identifier, codes::token_expected, "Identifier expected");
    std::string id = tok_.text;
    if(id.size() > 1 && id[0] == '@') id.erase(0, 1);
    return id;
}

expr_ptr expression_parser::parse(type_ref result_type){
    int expr_pos = tok_.pos;
    expr_ptr e = parse_expression();
    if(result_type){
        expr_ptr promoted = promote_expression(e, result_type, true);
        if(!promoted)
            throw parse_error(codes::type_mismatch, "Expression of type " + quoted(type_name(result_type)) + " expected", expr_pos);
        e = std::move(promoted);
    }
    validate(token_kind::End, codes::syntax_error, "Syntax error");
    return e;
}

std::vector<ordering_expr> expression_parser::parse_ordering(){
    std::vector<ordering_expr> out;
    for(;;){
        expr_ptr e = parse_expression();
        bool ascending = true;
        if(token_identifier_is("asc") || token_identifier_is("ascending")){
            next_token();
        } else if(token_identifier_is("desc") || token_identifier_is("descending")){
            next_token();
            ascending = false;
        }
        out.push_back(ordering_expr{std::move(e), ascending});
        if(tok_.kind != token_kind::Comma) break;
        next_token();
    }
    validate(token_kind::End, codes::syntax_error, "Syntax error");
    return out;
}

// ?: operator
expr_ptr expression_parser::parse_expression(){
    int error_pos = tok_.pos;
    expr_ptr e = parse_logical_or();
    if(tok_.kind == token_kind::Question){
        next_token();
        expr_ptr e1 = parse_expression();
        validate(token_kind::Colon, codes::token_expected, "':' expected");
        next_token();
        expr_ptr e2 = parse_expression();
        e = generate_conditional(std::move(e), std::move(e1), std::move(e2), error_pos);
    }
    return e;
}

// ||, or
expr_ptr expression_parser::parse_logical_or(){
    expr_ptr left = parse_logical_and();
    while(tok_.kind == token_kind::DoubleBar || token_identifier_is("or")){
        token op = tok_;
        next_token();
        expr_ptr right = parse_logical_and();
        check_and_promote_operands(signature_family::Logical, op, left, right);
        type_ref t = left->type;
        left = make_expr(t, op.pos, binary_node{binary_op::OrElse, std::move(left), std::move(right)});
    }
    return left;
}

// &&, and
expr_ptr expression_parser::parse_logical_and(){
    expr_ptr left = parse_equality();
    while(tok_.kind == token_kind::DoubleAmpersand || token_identifier_is("and")){
        token op = tok_;
        next_token();
        expr_ptr right = parse_equality();
        check_and_promote_operands(signature_family::Logical, op, left, right);
        type_ref t = left->type;
        left = make_expr(t, op.pos, binary_node{binary_op::AndAlso, std::move(left), std::move(right)});
    }
    return left;
}

// =, ==, !=, <>
expr_ptr expression_parser::parse_equality(){
    expr_ptr left = parse_relational();
    while(tok_.kind == token_kind::Equal || tok_.kind == token_kind::DoubleEqual ||
          tok_.kind == token_kind::ExclamationEqual || tok_.kind == token_kind::LessGreater){
        token op = tok_;
        next_token();
        expr_ptr right = parse_relational();
        if(!is_value_type(left->type) && !is_value_type(right->type)){
            if(left->type != right->type){
                if(is_assignable(left->type, right->type)){
                    right = convert_reference(std::move(right), left->type);
                } else if(is_assignable(right->type, left->type)){
                    left = convert_reference(std::move(left), right->type);
                } else {
                    throw incompatible_operands_error(codes::incompatible_operands,
                        "Operator " + quoted(op.text) + " incompatible with operand types " +
                        quoted(type_name(left->type)) + " and " + quoted(type_name(right->type)), op.pos);
                }
            }
        } else {
            check_and_promote_operands(signature_family::Equality, op, left, right);
        }
        binary_op bop = (op.kind == token_kind::Equal || op.kind == token_kind::DoubleEqual) ? binary_op::Equal : binary_op::NotEqual;
        left = make_expr(bool_type(), op.pos, binary_node{bop, std::move(left), std::move(right)});
    }
    return left;
}

// <, <=, >, >=
expr_ptr expression_parser::parse_relational(){
    expr_ptr left = parse_additive();
    while(tok_.kind == token_kind::LessThan || tok_.kind == token_kind::LessThanEqual ||
          tok_.kind == token_kind::GreaterThan || tok_.kind == token_kind::GreaterThanEqual){
        token op = tok_;
        next_token();
        expr_ptr right = parse_additive();
        check_and_promote_operands(signature_family::Relational, op, left, right);
        binary_op bop = binary_op::Less;
        switch(op.kind){
            case token_kind::LessThanEqual: bop = binary_op::LessEqual; break;
            case token_kind::GreaterThan: bop = binary_op::Greater; break;
            case token_kind::GreaterThanEqual: bop = binary_op::GreaterEqual; break;
            default: break;
        }
        left = make_expr(bool_type(), op.pos, binary_node{bop, std::move(left), std::move(right)});
    }
    return left;
}

// +, -, &
expr_ptr expression_parser::parse_additive(){
    expr_ptr left = parse_multiplicative();
    while(tok_.kind == token_kind::Plus || tok_.kind == token_kind::Minus || tok_.kind == token_kind::Ampersand){
        token op = tok_;
        next_token();
        expr_ptr right = parse_multiplicative();
        bool concat = op.kind == token_kind::Ampersand ||
                      (op.kind == token_kind::Plus && (left->type == string_type() || right->type == string_type()));
        if(concat){
            left = make_expr(string_type(), op.pos, binary_node{binary_op::Concat, std::move(left), std::move(right)});
            continue;
        }
        binary_op bop = op.kind == token_kind::Plus ? binary_op::Add : binary_op::Subtract;
        check_and_promote_operands(bop == binary_op::Add ? signature_family::Add : signature_family::Subtract, op, left, right);
        type_ref t = arithmetic_result(bop, left->type, right->type);
        left = make_expr(t, op.pos, binary_node{bop, std::move(left), std::move(right)});
    }
    return left;
}

// *, /, %, mod
expr_ptr expression_parser::parse_multiplicative(){
    expr_ptr left = parse_unary();
    while(tok_.kind == token_kind::Asterisk || tok_.kind == token_kind::Slash ||
          tok_.kind == token_kind::Percent || token_identifier_is("mod")){
        token op = tok_;
        next_token();
        expr_ptr right = parse_unary();
        check_and_promote_operands(signature_family::Arithmetic, op, left, right);
        binary_op bop = binary_op::Modulo;
        if(op.kind == token_kind::Asterisk) bop = binary_op::Multiply;
        else if(op.kind == token_kind::Slash) bop = binary_op::Divide;
        type_ref t = left->type;
        left = make_expr(t, op.pos, binary_node{bop, std::move(left), std::move(right)});
    }
    return left;
}

// -, !, not
expr_ptr expression_parser::parse_unary(){
    if(tok_.kind == token_kind::Minus || tok_.kind == token_kind::Exclamation || token_identifier_is("not")){
        token op = tok_;
        next_token();
        if(op.kind == token_kind::Minus && (tok_.kind == token_kind::IntegerLiteral || tok_.kind == token_kind::RealLiteral)){
            tok_.text = "-" + tok_.text;
            tok_.pos = op.pos;
            return parse_primary();
        }
        expr_ptr e = parse_unary();
        if(op.kind == token_kind::Minus){
            check_and_promote_operand(signature_family::Negation, op, e);
            type_ref t = e->type;
            return make_expr(t, op.pos, unary_node{unary_op::Negate, std::move(e)});
        }
        check_and_promote_operand(signature_family::Not, op, e);
        type_ref t = e->type;
        return make_expr(t, op.pos, unary_node{unary_op::Not, std::move(e)});
    }
    return parse_primary();
}

expr_ptr expression_parser::parse_primary(){
    expr_ptr e = parse_primary_start();
    for(;;){
        if(tok_.kind == token_kind::Dot){
            next_token();
            e = parse_member_access(nullptr, std::move(e));
        } else if(tok_.kind == token_kind::OpenBracket){
            e = parse_element_access(std::move(e));
        } else {
            break;
        }
    }
    return e;
}

expr_ptr expression_parser::parse_primary_start(){
    switch(tok_.kind){
        case token_kind::Identifier: return parse_identifier();
        case token_kind::StringLiteral: return parse_string_literal();
        case token_kind::IntegerLiteral: return parse_integer_literal();
        case token_kind::RealLiteral: return parse_real_literal();
        case token_kind::OpenParen: return parse_paren_expression();
        case token_kind::OpenBrace: return parse_placeholder();
        default:
            throw parse_error(codes::expression_expected, "Expression expected", tok_.pos);
    }
}

expr_ptr expression_parser::parse_string_literal(){
    validate(token_kind::StringLiteral, codes::token_expected, "Expression expected");
    int pos = tok_.pos;
    const char quote = tok_.text[0];
    std::string s;
    // strip the quotes; a doubled quote stands for one
    for(size_t i = 1; i + 1 < tok_.text.size(); ++i){
        s += tok_.text[i];
        if(tok_.text[i] == quote && i + 2 < tok_.text.size() && tok_.text[i + 1] == quote) ++i;
    }
    if(quote == '\''){
        if(s.size() != 1)
            throw lex_error(codes::invalid_character_literal, "Character literal must contain exactly one character", pos);
        next_token();
        return make_constant(value(s[0]), base_type(type_kind::Char), pos);
    }
    next_token();
    return make_constant(value(std::move(s)), string_type(), pos);
}

expr_ptr expression_parser::parse_integer_literal(){
    validate(token_kind::IntegerLiteral, codes::token_expected, "Expression expected");
    const int pos = tok_.pos;
    const std::string text = tok_.text;
    auto invalid = [&](){ return lex_error(codes::invalid_integer_literal, "Invalid integer literal " + quoted(text), pos); };

    bool negative = text[0] == '-';
    std::string body = negative ? text.substr(1) : text;
    bool hex = body.size() > 2 && body[0] == '0' && (body[1] == 'x' || body[1] == 'X');
    bool has_u = false, has_l = false;
    while(!body.empty() && std::strchr("uUlL", body.back())){
        if(body.back() == 'u' || body.back() == 'U') has_u = true; else has_l = true;
        body.pop_back();
    }
    const char* first = body.data() + (hex ? 2 : 0);
    const char* last = body.data() + body.size();
    uint64_t mag = 0;
    auto [end, ec] = std::from_chars(first, last, mag, hex ? 16 : 10);
    if(ec != std::errc() || end != last || first == last) throw invalid();

    constexpr uint64_t i32_max = (uint64_t)std::numeric_limits<int32_t>::max();
    constexpr uint64_t u32_max = (uint64_t)std::numeric_limits<uint32_t>::max();
    constexpr uint64_t i64_max = (uint64_t)std::numeric_limits<int64_t>::max();
    value v;
    type_kind k;
    if(!negative){
        if(has_u && has_l){ v = mag; k = type_kind::UInt64; }
        else if(has_u){
            if(mag <= u32_max){ v = (uint32_t)mag; k = type_kind::UInt32; }
            else { v = mag; k = type_kind::UInt64; }
        } else if(has_l){
            if(mag <= i64_max){ v = (int64_t)mag; k = type_kind::Int64; }
            else { v = mag; k = type_kind::UInt64; }
        } else if(mag <= i32_max){ v = (int32_t)mag; k = type_kind::Int32; }
        else if(mag <= u32_max){ v = (uint32_t)mag; k = type_kind::UInt32; }
        else if(mag <= i64_max){ v = (int64_t)mag; k = type_kind::Int64; }
        else { v = mag; k = type_kind::UInt64; }
    } else {
        if(has_u || mag > i64_max + 1) throw invalid();
        int64_t sv = mag == i64_max + 1 ? std::numeric_limits<int64_t>::min() : -(int64_t)mag;
        if(!has_l && sv >= std::numeric_limits<int32_t>::min()){ v = (int32_t)sv; k = type_kind::Int32; }
        else { v = sv; k = type_kind::Int64; }
    }
    next_token();
    constant_node c;
    c.val = std::move(v);
    // suffixed literals keep the type they spell out
    if(!has_u && !has_l) c.literal = (negative ? "-" : "") + std::to_string(mag);
    return make_expr(base_type(k), pos, std::move(c));
}

expr_ptr expression_parser::parse_real_literal(){
    validate(token_kind::RealLiteral, codes::token_expected, "Expression expected");
    const int pos = tok_.pos;
    const std::string text = tok_.text;
    std::string body = text;
    type_kind k = type_kind::Double;
    bool suffixed = true;
    switch(body.back()){
        case 'f': case 'F': k = type_kind::Single; break;
        case 'm': case 'M': k = type_kind::Decimal; break;
        case 'd': case 'D': break;
        default: suffixed = false; break;
    }
    if(suffixed) body.pop_back();
    auto v = parse_numeric(body, base_type(k));
    if(!v) throw lex_error(codes::invalid_real_literal, "Invalid real literal " + quoted(text), pos);
    next_token();
    constant_node c;
    c.val = std::move(*v);
    if(!suffixed) c.literal = body;
    return make_expr(base_type(k), pos, std::move(c));
}

expr_ptr expression_parser::parse_paren_expression(){
    validate(token_kind::OpenParen, codes::token_expected, "'(' expected");
    next_token();
    expr_ptr e = parse_expression();
    validate(token_kind::CloseParen, codes::token_expected, "')' or operator expected");
    next_token();
    return e;
}

// {n} stands for the n-th positional value
expr_ptr expression_parser::parse_placeholder(){
    const int pos = tok_.pos;
    next_token();
    validate(token_kind::IntegerLiteral, codes::token_expected, "Placeholder index expected");
    size_t index = 0;
    const std::string& digits = tok_.text;
    auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
    if(ec != std::errc() || end != digits.data() + digits.size())
        throw parse_error(codes::token_expected, "Placeholder index expected", tok_.pos);
    next_token();
    validate(token_kind::CloseBrace, codes::token_expected, "'}' expected");
    next_token();
    if(index >= values_.size())
        throw parse_error(codes::placeholder_range, "No value supplied for placeholder '{" + std::to_string(index) + "}'", pos);
    return use_bound(values_[index], pos);
}

expr_ptr expression_parser::use_bound(const bound_value& b, int pos){
    if(b.fn) return parse_lambda_invocation(b.fn, pos);
    constant_node c;
    c.val = b.val;
    return make_expr(b.type, pos, std::move(c));
}

expr_ptr expression_parser::parse_identifier(){
    validate(token_kind::Identifier, codes::token_expected, "Identifier expected");
    const int pos = tok_.pos;
    const std::string key = lower(tok_.text);

    if(auto t = type_context::instance().find_predefined(key)) return parse_type_access(*t);
    if(key == "true" || key == "false"){
        next_token();
        return make_constant(value(key == "true"), bool_type(), pos);
    }
    if(key == "null"){
        next_token();
        constant_node c;
        c.is_null_literal = true;
        return make_expr(null_type(), pos, std::move(c));
    }
    if(key == "it") return parse_it();
    if(key == "iif") return parse_iif();
    if(key == "new") return parse_new();

    auto s = symbols_.find(key);
    if(s != symbols_.end()){
        next_token();
        if(s->second.param) return make_expr(s->second.param->type, pos, param_node{s->second.param});
        return use_bound(s->second.bound, pos);
    }
    if(it_) return parse_member_access(nullptr, make_expr(it_->type, pos, param_node{it_}));

    parse_error err(codes::unknown_identifier, "Unknown identifier " + quoted(tok_.text), pos);
    std::vector<std::string> pool(symbol_names_);
    pool.insert(pool.end(), std::begin(keyword_names), std::end(keyword_names));
    append_suggestions(err, tok_.text, pool);
    throw err;
}

expr_ptr expression_parser::parse_it(){
    if(!it_) throw parse_error(codes::no_it_in_scope, "No 'it' is in scope", tok_.pos);
    const int pos = tok_.pos;
    next_token();
    return make_expr(it_->type, pos, param_node{it_});
}

expr_ptr expression_parser::parse_iif(){
    const int error_pos = tok_.pos;
    next_token();
    std::vector<expr_ptr> args = parse_argument_list();
    if(args.size() != 3) throw parse_error(codes::iif_arity, "The 'iif' function requires three arguments", error_pos);
    return generate_conditional(std::move(args[0]), std::move(args[1]), std::move(args[2]), error_pos);
}

expr_ptr expression_parser::generate_conditional(expr_ptr test, expr_ptr e1, expr_ptr e2, int error_pos){
    if(test->type != bool_type())
        throw parse_error(codes::first_expr_must_be_bool, "The first expression must be of type 'Boolean'", error_pos);
    if(e1->type != e2->type){
        const bool null1 = is_null_literal(*e1), null2 = is_null_literal(*e2);
        const bool e1as2 = !null2 && can_promote(*e1, e2->type);
        const bool e2as1 = !null1 && can_promote(*e2, e1->type);
        if(e1as2 && !e2as1){
            type_ref t = e2->type;
            e1 = promote_expression(e1, t, true);
        } else if(e2as1 && !e1as2){
            type_ref t = e1->type;
            e2 = promote_expression(e2, t, true);
        } else {
            std::string t1 = null1 ? "null" : type_name(e1->type);
            std::string t2 = null2 ? "null" : type_name(e2->type);
            if(e1as2 && e2as1)
                throw parse_error(codes::both_types_convert, "Both of the types " + quoted(t1) + " and " + quoted(t2) + " convert to the other", error_pos);
            throw parse_error(codes::neither_type_converts, "Neither of the types " + quoted(t1) + " and " + quoted(t2) + " converts to the other", error_pos);
        }
    }
    type_ref t = e1->type;
    return make_expr(t, error_pos, conditional_node{std::move(test), std::move(e1), std::move(e2)});
}

expr_ptr expression_parser::parse_new(){
    const int pos = tok_.pos;
    next_token();
    if(tok_.kind == token_kind::OpenBracket) return parse_new_array(pos);
    validate(token_kind::OpenParen, codes::token_expected, "'(' expected");
    next_token();
    std::vector<property> props;
    std::vector<expr_ptr> args;
    for(;;){
        const int expr_pos = tok_.pos;
        expr_ptr e = parse_expression();
        std::string name;
        if(token_identifier_is("as")){
            next_token();
            name = get_identifier();
            next_token();
        } else {
            auto n = member_name_of(*e);
            if(!n) throw parse_error(codes::missing_as_clause, "Expression is missing an 'as' clause", expr_pos);
            name = *n;
        }
        for(const auto& p : props)
            if(iequals(p.name, name))
                throw parse_error(codes::duplicate_identifier, "The identifier " + quoted(name) + " was defined more than once", expr_pos);
        if(is_null_literal(*e)) e = make_constant(value{}, object_type(), e->pos);
        props.push_back(property{name, e->type});
        args.push_back(std::move(e));
        if(tok_.kind != token_kind::Comma) break;
        next_token();
    }
    validate(token_kind::CloseParen, codes::token_expected, "')' or ',' expected");
    next_token();

    new_record_node n;
    n.record = compile_record_type(props);
    for(const auto& p : props) n.slots.push_back(*n.record->find_property(p.name));
    n.args = std::move(args);
    type_ref t = n.record->as_type();
    return make_expr(t, pos, std::move(n));
}

// new[] { e1, e2, ... }
expr_ptr expression_parser::parse_new_array(int pos){
    next_token();
    validate(token_kind::CloseBracket, codes::token_expected, "']' expected");
    next_token();
    validate(token_kind::OpenBrace, codes::token_expected, "'{' expected");
    next_token();
    std::vector<expr_ptr> items;
    if(tok_.kind != token_kind::CloseBrace) items = parse_arguments();
    validate(token_kind::CloseBrace, codes::token_expected, "'}' or ',' expected");
    next_token();

    // the element type is the first item type every item promotes to
    type_ref element = nullptr;
    for(const auto& candidate : items){
        if(is_null_literal(*candidate)) continue;
        bool all = std::all_of(items.begin(), items.end(), [&](const expr_ptr& i){ return can_promote(*i, candidate->type); });
        if(all){ element = candidate->type; break; }
    }
    if(!element) throw parse_error(codes::type_mismatch, "No best type found for implicitly-typed array", pos);
    for(auto& i : items) i = promote_expression(i, element, false);
    return make_expr(sequence_of(element), pos, new_array_node{std::move(items)});
}

expr_ptr expression_parser::parse_lambda_invocation(const lambda_ref& fn, int error_pos){
    std::vector<expr_ptr> args = parse_argument_list();
    std::vector<signature> sigs(1);
    for(const auto& p : fn->params) sigs[0].push_back(p->type);
    overload_match m;
    if(find_best_overload(sigs, args, m) != 1)
        throw parse_error(codes::lambda_arguments, "Argument list incompatible with lambda expression", error_pos);
    return make_expr(fn->result_type(), error_pos, invoke_node{fn, std::move(m.args)});
}

expr_ptr expression_parser::parse_type_access(type_ref t){
    const int error_pos = tok_.pos;
    next_token();
    if(tok_.kind == token_kind::Question){
        if(!is_value_type(t) || is_nullable(t))
            throw parse_error(codes::no_nullable_form, "Type " + quoted(type_name(t)) + " has no nullable form", error_pos);
        t = nullable_of(t);
        next_token();
    }
    if(tok_.kind == token_kind::OpenParen){
        std::vector<expr_ptr> args = parse_argument_list();
        std::vector<const builtin*> ctors = find_constructors(t);
        std::vector<signature> sigs;
        for(const auto* c : ctors) sigs.push_back(c->params);
        overload_match m;
        switch(find_best_overload(sigs, args, m)){
            case 0:
                if(args.size() == 1) return generate_conversion(std::move(args[0]), t, error_pos);
                throw unknown_member_error(codes::no_matching_constructor, "No matching constructor in type " + quoted(type_name(t)), error_pos);
            case 1:
                return make_expr(t, error_pos, call_node{ctors[m.index], nullptr, std::move(m.args)});
            default:
                throw ambiguous_operator_error(codes::ambiguous_constructor, "Ambiguous invocation of " + quoted(type_name(t)) + " constructor", error_pos);
        }
    }
    validate(token_kind::Dot, codes::token_expected, "'.' or '(' expected");
    next_token();
    return parse_member_access(t, nullptr);
}

expr_ptr expression_parser::generate_conversion(expr_ptr e, type_ref t, int error_pos){
    type_ref et = e->type;
    if(et == t) return e;
    if(is_null_literal(*e) && (!is_value_type(t) || is_nullable(t))) return make_constant(value{}, t, error_pos);
    if(is_value_type(et) && is_value_type(t)){
        if((is_nullable(et) || is_nullable(t)) && non_nullable(et) == non_nullable(t))
            return make_convert(std::move(e), t);
        if(is_numeric(et) && is_numeric(t))
            return make_convert(std::move(e), t, true);
    }
    if(is_assignable(et, t) || is_assignable(t, et)) return make_convert(std::move(e), t);
    throw parse_error(codes::cannot_convert, "A value of type " + quoted(type_name(et)) +
                      " cannot be converted to type " + quoted(type_name(t)), error_pos);
}

expr_ptr expression_parser::parse_member_access(type_ref t, expr_ptr instance){
    if(instance) t = instance->type;
    const int error_pos = tok_.pos;
    const std::string id = get_identifier();
    next_token();
    const bool static_access = instance == nullptr;

    if(instance && is_nullable(t)){
        type_ref underlying = non_nullable(t);
        if(iequals(id, "HasValue") && tok_.kind != token_kind::OpenParen){
            expr_ptr none = make_constant(value{}, t, error_pos);
            return make_expr(bool_type(), error_pos, binary_node{binary_op::NotEqual, std::move(instance), std::move(none)});
        }
        if(iequals(id, "Value") && tok_.kind != token_kind::OpenParen)
            return make_convert(std::move(instance), underlying, true);
        if(iequals(id, "GetValueOrDefault") && tok_.kind == token_kind::OpenParen){
            std::vector<expr_ptr> args = parse_argument_list();
            expr_ptr fallback;
            if(args.empty()) fallback = make_constant(default_value(underlying), underlying, error_pos);
            else if(args.size() == 1) fallback = promote_expression(args[0], underlying, true);
            if(!fallback)
                throw unknown_member_error(codes::no_applicable_method, "No applicable method " + quoted(id) +
                                           " exists in type " + quoted(type_name(t)), error_pos);
            return make_expr(underlying, error_pos, coalesce_node{std::move(instance), std::move(fallback)});
        }
    }

    if(tok_.kind == token_kind::OpenParen){
        if(instance && is_sequence(t)) return parse_aggregate(std::move(instance), t->element, id, error_pos);
        std::vector<expr_ptr> args = parse_argument_list();
        std::vector<const builtin*> methods;
        for(const auto* b : find_builtins(t, id, static_access))
            if(!b->is_property) methods.push_back(b);
        std::vector<signature> sigs;
        for(const auto* b : methods) sigs.push_back(b->params);
        overload_match m;
        switch(find_best_overload(sigs, args, m)){
            case 0: {
                unknown_member_error err(codes::no_applicable_method, "No applicable method " + quoted(id) +
                                         " exists in type " + quoted(type_name(t)), error_pos);
                if(methods.empty()) append_suggestions(err, id, builtin_names(t, static_access));
                throw err;
            }
            case 1: {
                const builtin* fn = methods[m.index];
                return make_expr(fn->result, error_pos, call_node{fn, std::move(instance), std::move(m.args)});
            }
            default:
                throw ambiguous_operator_error(codes::ambiguous_method, "Ambiguous invocation of method " + quoted(id) +
                                               " in type " + quoted(type_name(t)), error_pos);
        }
    }

    std::vector<std::string> pool;
    if(instance && is_record(t)){
        const record_type* rt = t->record;
        if(auto index = rt->find_property(id)){
            const property& p = rt->properties()[*index];
            return make_expr(p.type, error_pos, member_node{std::move(instance), *index, p.name});
        }
        for(const auto& p : rt->properties()) pool.push_back(p.name);
    }
    for(const auto* b : find_builtins(t, id, static_access))
        if(b->is_property) return make_expr(b->result, error_pos, call_node{b, std::move(instance), {}});

    unknown_member_error err(codes::unknown_member, "No property or field " + quoted(id) +
                             " exists in type " + quoted(type_name(t)), error_pos);
    for(auto& n : builtin_names(t, static_access)) pool.push_back(std::move(n));
    append_suggestions(err, id, pool);
    throw err;
}

expr_ptr expression_parser::parse_aggregate(expr_ptr instance, type_ref element, const std::string& name, int error_pos){
    parameter_ref inner = make_parameter("", element);
    std::vector<expr_ptr> args;
    {
        it_scope scope(it_, inner);
        args = parse_argument_list();
    }
    auto fn = aggregate_by_name(name);
    overload_match m;
    if(!fn || find_best_overload(aggregate_signatures(*fn), args, m) != 1){
        unknown_member_error err(codes::no_applicable_aggregate, "No applicable aggregate method " + quoted(name) + " exists", error_pos);
        if(!fn) append_suggestions(err, name, aggregate_names());
        throw err;
    }
    aggregate_node n;
    n.fn = *fn;
    n.source = std::move(instance);
    if(!m.args.empty()){
        n.element = inner;
        n.body = std::move(m.args[0]);
    }
    type_ref result = aggregate_result(*fn, element, n.body ? n.body->type : nullptr);
    return make_expr(result, error_pos, std::move(n));
}

expr_ptr expression_parser::parse_element_access(expr_ptr e){
    const int error_pos = tok_.pos;
    validate(token_kind::OpenBracket, codes::token_expected, "'(' expected");
    next_token();
    std::vector<expr_ptr> args = parse_arguments();
    validate(token_kind::CloseBracket, codes::token_expected, "']' or ',' expected");
    next_token();
    if(is_sequence(e->type)){
        expr_ptr index;
        if(args.size() == 1) index = promote_expression(args[0], int_type(), true);
        if(!index) throw parse_error(codes::invalid_index, "Array index must be an integer expression", error_pos);
        type_ref t = e->type->element;
        return make_expr(t, error_pos, index_node{std::move(e), std::move(index)});
    }
    overload_match m;
    switch(find_best_overload(indexer_signatures(e->type), args, m)){
        case 0:
            throw unknown_member_error(codes::no_applicable_indexer, "No applicable indexer exists in type " + quoted(type_name(e->type)), error_pos);
        case 1:
            return make_expr(base_type(type_kind::Char), error_pos, index_node{std::move(e), std::move(m.args[0])});
        default:
            throw ambiguous_operator_error(codes::ambiguous_indexer, "Ambiguous invocation of indexer in type " + quoted(type_name(e->type)), error_pos);
    }
}

std::vector<expr_ptr> expression_parser::parse_argument_list(){
    validate(token_kind::OpenParen, codes::token_expected, "'(' expected");
    next_token();
    std::vector<expr_ptr> args;
    if(tok_.kind != token_kind::CloseParen) args = parse_arguments();
    validate(token_kind::CloseParen, codes::token_expected, "')' or ',' expected");
    next_token();
    return args;
}

std::vector<expr_ptr> expression_parser::parse_arguments(){
    std::vector<expr_ptr> args;
    for(;;){
        args.push_back(parse_expression());
        if(tok_.kind != token_kind::Comma) break;
        next_token();
    }
    return args;
}

void expression_parser::check_and_promote_operands(signature_family family, const token& op, expr_ptr& left, expr_ptr& right){
    std::vector<expr_ptr> args;
    args.push_back(std::move(left));
    args.push_back(std::move(right));
    overload_match m;
    size_t n = find_best_overload(signatures(family), args, m);
    if(n != 1){
        std::string types = quoted(type_name(args[0]->type)) + " and " + quoted(type_name(args[1]->type));
        if(n == 0)
            throw incompatible_operands_error(codes::incompatible_operands, "Operator " + quoted(op.text) +
                                              " incompatible with operand types " + types, op.pos);
        throw ambiguous_operator_error(codes::ambiguous_operator, "Ambiguous invocation of operator " + quoted(op.text) +
                                       " with operand types " + types, op.pos);
    }
    left = std::move(m.args[0]);
    right = std::move(m.args[1]);
}

void expression_parser::check_and_promote_operand(signature_family family, const token& op, expr_ptr& operand){
    std::vector<expr_ptr> args;
    args.push_back(std::move(operand));
    overload_match m;
    if(find_best_overload(signatures(family), args, m) != 1)
        throw incompatible_operands_error(codes::incompatible_operand, "Operator " + quoted(op.text) +
                                          " incompatible with operand type " + quoted(type_name(args[0]->type)), op.pos);
    operand = std::move(m.args[0]);
}

} // namespace dynq
