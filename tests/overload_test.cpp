#include <cassert>
#include <iostream>
#include <string>
#include <vector>
#include "dynq/overloads.hpp"

using namespace dynq;

namespace {

type_ref T(type_kind k){ return base_type(k); }
type_ref N(type_kind k){ return nullable_of(base_type(k)); }

expr_ptr member_of(type_ref t){
    // a non-literal operand of type t
    return make_convert(make_constant(value{}, object_type()), t);
}

expr_ptr int_literal(int32_t v){
    constant_node c;
    c.val = value(v);
    c.literal = std::to_string(v);
    return make_expr(int_type(), 0, std::move(c));
}

expr_ptr null_literal(){
    constant_node c;
    c.is_null_literal = true;
    return make_expr(null_type(), 0, std::move(c));
}

std::vector<expr_ptr> args_of(expr_ptr a, expr_ptr b){
    std::vector<expr_ptr> out;
    out.push_back(std::move(a));
    out.push_back(std::move(b));
    return out;
}

} // namespace

static void test_implicit_conversions(){
    using K = type_kind;
    assert(is_compatible_with(T(K::Int32), T(K::Int64)));
    assert(is_compatible_with(T(K::Int32), T(K::Double)));
    assert(is_compatible_with(T(K::Int32), N(K::Int32)));
    assert(is_compatible_with(T(K::Int32), N(K::Int64)));
    assert(!is_compatible_with(N(K::Int32), T(K::Int32)));
    assert(!is_compatible_with(T(K::Int64), T(K::Int32)));
    assert(!is_compatible_with(T(K::Int32), T(K::UInt32)));
    assert(is_compatible_with(T(K::UInt32), T(K::Int64)));
    assert(!is_compatible_with(T(K::Double), T(K::Decimal)));
    assert(is_compatible_with(T(K::Single), T(K::Double)));
    // char does not widen to the numeric kinds
    assert(!is_compatible_with(T(K::Char), T(K::Int32)));
    assert(is_compatible_with(T(K::String), object_type()));
    assert(is_compatible_with(null_type(), string_type()));
    assert(!is_compatible_with(null_type(), T(K::Int32)));
}

static void test_conversion_ranking(){
    using K = type_kind;
    // identity wins
    assert(compare_conversions(T(K::Int32), T(K::Int32), T(K::Int64)) == 1);
    // the narrower widening target wins
    assert(compare_conversions(T(K::Int32), T(K::Int64), T(K::Double)) == 1);
    assert(compare_conversions(T(K::Int32), T(K::Double), T(K::Int64)) == -1);
    // signed beats unsigned when neither converts to the other
    assert(compare_conversions(T(K::Byte), T(K::Int32), T(K::UInt32)) == 1);
    assert(compare_conversions(T(K::Int32), T(K::Double), T(K::Decimal)) == 0);
}

static void test_literal_promotion(){
    using K = type_kind;
    auto lit = int_literal(100);
    assert(can_promote(*lit, T(K::Byte)));
    assert(can_promote(*lit, T(K::UInt32)));
    assert(!can_promote(*lit, T(K::Char)));
    auto big = int_literal(300);
    assert(!can_promote(*big, T(K::Byte)));
    expr_ptr promoted = promote_expression(big, T(K::Int16), false);
    assert(promoted && promoted->type == T(K::Int16));
    assert(std::get<constant_node>(promoted->node).val.as<int16_t>() == 300);

    auto nl = null_literal();
    assert(can_promote(*nl, N(K::Int32)));
    assert(can_promote(*nl, string_type()));
    assert(!can_promote(*nl, T(K::Int32)));

    // a failed promotion leaves the operand in place
    auto s = member_of(string_type());
    assert(!promote_expression(s, int_type(), false));
    assert(s && s->type == string_type());
}

static void test_best_overload(){
    using K = type_kind;
    overload_match m;

    auto args = args_of(member_of(T(K::Int32)), member_of(T(K::Int64)));
    assert(find_best_overload(signatures(signature_family::Arithmetic), args, m) == 1);
    assert(m.args.size() == 2 && m.args[0]->type == T(K::Int64) && m.args[1]->type == T(K::Int64));

    args = args_of(member_of(T(K::Int32)), member_of(T(K::UInt32)));
    assert(find_best_overload(signatures(signature_family::Arithmetic), args, m) == 1);
    assert(m.args[0]->type == T(K::Int64));

    // nullable in, nullable out
    args = args_of(member_of(N(K::Int32)), int_literal(1));
    assert(find_best_overload(signatures(signature_family::Arithmetic), args, m) == 1);
    assert(m.args[0]->type == N(K::Int32) && m.args[1]->type == N(K::Int32));

    // Int64 with UInt64 only meets at the real kinds, where Single and Decimal tie
    args = args_of(member_of(T(K::Int64)), member_of(T(K::UInt64)));
    assert(find_best_overload(signatures(signature_family::Arithmetic), args, m) > 1);

    args = args_of(member_of(T(K::Boolean)), member_of(T(K::Boolean)));
    assert(find_best_overload(signatures(signature_family::Relational), args, m) == 0);
    args = args_of(member_of(T(K::Boolean)), member_of(T(K::Boolean)));
    assert(find_best_overload(signatures(signature_family::Equality), args, m) == 1);

    args = args_of(member_of(T(K::DateTime)), member_of(T(K::TimeSpan)));
    assert(find_best_overload(signatures(signature_family::Add), args, m) == 1);
    args = args_of(member_of(T(K::DateTime)), member_of(T(K::DateTime)));
    assert(find_best_overload(signatures(signature_family::Add), args, m) == 0);
    args = args_of(member_of(T(K::DateTime)), member_of(T(K::DateTime)));
    assert(find_best_overload(signatures(signature_family::Subtract), args, m) == 1);

    // candidates that tie are all reported
    std::vector<signature> tied = {{T(K::Double)}, {T(K::Decimal)}};
    std::vector<expr_ptr> one;
    one.push_back(member_of(T(K::Int32)));
    assert(find_best_overload(tied, one, m) == 2);
    // and the arguments stay with the caller
    assert(one[0] && one[0]->type == T(K::Int32));
}

void run_overload_tests(){
    test_implicit_conversions();
    test_conversion_ranking();
    test_literal_promotion();
    test_best_overload();
    std::cout << "Overload tests passed\n";
}
