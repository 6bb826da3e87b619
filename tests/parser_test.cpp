#include <cassert>
#include <iostream>
#include <string>
#include <vector>
#include "conference_model.hpp"
#include "dynq/dynamic_expression.hpp"
#include "dynq/evaluator.hpp"
#include "dynq/record.hpp"
#include "test_rows.hpp"

using namespace dynq;
using dynq_test::Row;

namespace {

type_ref row_type(){ return entity_type_of<Row>(); }

std::string dump(const char* text){
    return to_string(*parse_lambda(row_type(), nullptr, text)->body);
}

type_ref type_of(const char* text, const std::vector<bound_value>& values = {}){
    return parse(text, nullptr, values)->result_type();
}

type_ref row_type_of(const char* text){
    return parse_lambda(row_type(), nullptr, text)->result_type();
}

template<class E, class F>
E expect_error(F&& f){
    try {
        f();
    } catch(const E& e){
        return e;
    }
    assert(false && "expected an error");
    throw std::logic_error("unreachable");
}

query_error row_error(const char* text){
    return expect_error<query_error>([&]{ parse_lambda(row_type(), nullptr, text); });
}

bool has_note(const query_error& e, const std::string& needle){
    for(const auto& n : e.notes())
        if(n.message.find(needle) != std::string::npos) return true;
    return false;
}

} // namespace

static void test_dump_shapes(){
    assert(dump("A < 100") == "(LessThan (Member (Param it) A) (Const Int32 100))");
    assert(dump("it.A >= B") == "(GreaterThanOrEqual (Member (Param it) A) (Member (Param it) B))");
    assert(dump("Flag and not Flag") == "(AndAlso (Member (Param it) Flag) (Not (Member (Param it) Flag)))");
    assert(dump("Name == \"x\"") == "(Equal (Member (Param it) Name) (Const String \"x\"))");
    auto l = parse_lambda(row_type(), bool_type(), "A < 100");
    assert(to_string(*l) == "(Lambda (it:Row) (LessThan (Member (Param it) A) (Const Int32 100)))");
}

static void test_precedence(){
    assert(to_string(*parse("1 + 2 * 3", nullptr)->body) ==
           "(Add (Const Int32 1) (Multiply (Const Int32 2) (Const Int32 3)))");
    assert(to_string(*parse("(1 + 2) * 3", nullptr)->body) ==
           "(Multiply (Add (Const Int32 1) (Const Int32 2)) (Const Int32 3))");
    // and binds tighter than or; equality binds looser than relational
    assert(dump("Flag || A < 1 && B > 2") ==
           "(OrElse (Member (Param it) Flag) (AndAlso (LessThan (Member (Param it) A) (Const Int32 1)) "
           "(GreaterThan (Member (Param it) B) (Const Int32 2))))");
    assert(dump("A < 1 == Flag") ==
           "(Equal (LessThan (Member (Param it) A) (Const Int32 1)) (Member (Param it) Flag))");
    assert(to_string(*parse("7 mod 2", nullptr)->body) == "(Modulo (Const Int32 7) (Const Int32 2))");
}

static void test_literal_typing(){
    assert(type_name(type_of("2147483647")) == "Int32");
    assert(type_name(type_of("2147483648")) == "UInt32");
    assert(type_name(type_of("4294967296")) == "Int64");
    assert(type_name(type_of("9223372036854775808")) == "UInt64");
    assert(type_name(type_of("-2147483648")) == "Int32");
    assert(type_name(type_of("-2147483649")) == "Int64");
    assert(type_name(type_of("1L")) == "Int64");
    assert(type_name(type_of("1U")) == "UInt32");
    assert(type_name(type_of("1UL")) == "UInt64");
    assert(type_name(type_of("0xFF")) == "Int32");
    assert(type_name(type_of("1.5")) == "Double");
    assert(type_name(type_of("1.5f")) == "Single");
    assert(type_name(type_of("1.5m")) == "Decimal");
    assert(type_name(type_of("'c'")) == "Char");
    assert(type_name(type_of("\"s\"")) == "String");
    assert(type_name(type_of("true")) == "Boolean");
    assert(expect_error<lex_error>([]{ parse("99999999999999999999", nullptr); }).code() == codes::invalid_integer_literal);
    assert(expect_error<lex_error>([]{ parse("'ab'", nullptr); }).code() == codes::invalid_character_literal);
}

static void test_operator_typing(){
    assert(row_type_of("A = 1") == bool_type());
    assert(row_type_of("A <> 1") == bool_type());
    assert(row_type_of("N == null") == bool_type());
    assert(row_type_of("Name == null") == bool_type());
    assert(row_type_of("Name + A") == string_type());
    assert(row_type_of("Name & 1") == string_type());
    assert(type_name(row_type_of("A + L")) == "Int64");
    assert(type_name(row_type_of("A * X")) == "Double");
    assert(type_name(row_type_of("N + 1")) == "Int32?");
    assert(type_name(row_type_of("Flag ? A : L")) == "Int64");
    assert(type_name(row_type_of("Maybe && Flag")) == "Boolean?");
}

static void test_conditional_errors(){
    auto e = expect_error<parse_error>([]{ parse_lambda(row_type(), nullptr, "iif(Flag, 1, null)"); });
    assert(e.code() == codes::neither_type_converts);
    assert(e.position() == 0);
    assert(row_error("iif(A, 1, 2)").code() == codes::first_expr_must_be_bool);
    assert(row_error("iif(Flag, 1)").code() == codes::iif_arity);
    assert(row_error("Flag ? Name : A").code() == codes::neither_type_converts);
    // a null branch takes the type of the other branch when it has a null form
    assert(type_name(row_type_of("Flag ? N : null")) == "Int32?");
}

static void test_syntax_errors(){
    auto e = row_error("A +");
    assert(e.code() == codes::expression_expected && e.position() == 3);
    assert(e.message() == "Expression expected");

    e = row_error("A < 1 )");
    assert(e.code() == codes::syntax_error && e.position() == 6);

    e = row_error("(A < 1");
    assert(e.code() == codes::token_expected && e.position() == 6);
    assert(e.message() == "')' or operator expected");

    e = row_error("Flag ? 1 2");
    assert(e.code() == codes::token_expected && e.message() == "':' expected");

    auto ops = expect_error<incompatible_operands_error>([]{ parse("1 == \"x\"", nullptr); });
    assert(ops.code() == codes::incompatible_operands && ops.position() == 2);
    assert(ops.message() == "Operator '==' incompatible with operand types 'Int32' and 'String'");

    auto neg = expect_error<incompatible_operands_error>([]{ parse("-\"x\"", nullptr); });
    assert(neg.code() == codes::incompatible_operand && neg.position() == 0);
}

static void test_identifier_errors(){
    auto e = expect_error<unknown_member_error>([]{ parse_lambda(row_type(), nullptr, "Nmae == \"x\""); });
    assert(e.code() == codes::unknown_member);
    assert(e.message() == "No property or field 'Nmae' exists in type 'Row'");
    assert(e.position() == 0);
    assert(has_note(e, "did you mean") && has_note(e, "Name"));

    auto m = expect_error<unknown_member_error>([]{ parse_lambda(row_type(), nullptr, "Name.Substrng(1) == \"x\""); });
    assert(m.code() == codes::no_applicable_method && m.position() == 5);
    assert(has_note(m, "Substring"));

    auto unknown = expect_error<parse_error>([]{ parse("frob + 1", nullptr); });
    assert(unknown.code() == codes::unknown_identifier);
    assert(unknown.message() == "Unknown identifier 'frob'");

    assert(expect_error<parse_error>([]{ parse("it", nullptr); }).code() == codes::no_it_in_scope);

    auto mismatch = expect_error<parse_error>([]{ parse_lambda(row_type(), bool_type(), "A + 1"); });
    assert(mismatch.code() == codes::type_mismatch && mismatch.position() == 0);
    assert(mismatch.message() == "Expression of type 'Boolean' expected");
}

static void test_placeholders(){
    auto l = parse("{0} + {1}", nullptr, {bind(1), bind(int64_t{2})});
    assert(type_name(l->result_type()) == "Int64");
    assert(invoke(*l, {}).as<int64_t>() == 3);

    auto s = parse("@0.Length", nullptr, {bind("abc")});
    assert(s->result_type() == int_type());
    assert(invoke(*s, {}).as<int32_t>() == 3);

    auto e = expect_error<parse_error>([]{ parse("{2}", nullptr, {bind(1)}); });
    assert(e.code() == codes::placeholder_range && e.position() == 0);

    auto n = parse("@0 == null", bool_type(), {bind_null(nullable_of(int_type()))});
    assert(invoke(*n, {}).as<bool>());
}

static void test_externals(){
    named_values ext;
    ext["limit"] = bind(10);
    auto l = parse_lambda(row_type(), bool_type(), "A < limit", {}, ext);
    Row r;
    r.a = 3;
    assert(invoke(*l, {entity_type<Row>::instance().wrap(r)}).as<bool>());
    r.a = 12;
    assert(!invoke(*l, {entity_type<Row>::instance().wrap(r)}).as<bool>());

    auto twice = parse_lambda({param("x", int_type())}, int_type(), "x * 2");
    named_values fns;
    fns["twice"] = bind(twice);
    auto call = parse_lambda(row_type(), bool_type(), "twice(A) > 4", {}, fns);
    r.a = 3;
    assert(invoke(*call, {entity_type<Row>::instance().wrap(r)}).as<bool>());
    assert(to_string(*call->body).find("(Invoke (Lambda (x:Int32)") != std::string::npos);

    auto bad = expect_error<parse_error>([&]{ parse_lambda(row_type(), bool_type(), "twice(Name) > 4", {}, fns); });
    assert(bad.code() == codes::lambda_arguments);
}

static void test_named_parameters(){
    auto l = parse_lambda({param("c", row_type())}, bool_type(), "c.A > 1");
    Row r;
    r.a = 2;
    assert(invoke(*l, {entity_type<Row>::instance().wrap(r)}).as<bool>());
    // a named parameter does not introduce an implicit it
    assert(expect_error<parse_error>([]{ parse_lambda({param("c", row_type())}, bool_type(), "A > 1"); }).code() == codes::unknown_identifier);

    auto two = parse_lambda({param("x", int_type()), param("y", int_type())}, int_type(), "x - y");
    assert(invoke(*two, {value(int32_t{5}), value(int32_t{7})}).as<int32_t>() == -2);

    auto dup = expect_error<parse_error>([]{ parse_lambda({param("x", int_type()), param("X", int_type())}, nullptr, "x"); });
    assert(dup.code() == codes::duplicate_identifier);

    bool threw = false;
    try {
        parse_lambda(std::vector<parameter_ref>{nullptr}, nullptr, "1");
    } catch(const std::invalid_argument&){
        threw = true;
    }
    assert(threw);
}

static void test_ordering(){
    auto keys = parse_ordering(row_type(), "B, A desc");
    assert(keys.size() == 2);
    assert(keys[0].ascending && !keys[1].ascending);
    assert(to_string(*keys[0].key->body) == "(Member (Param it) B)");

    keys = parse_ordering(row_type(), "Name ascending, X DESCENDING, it.L asc");
    assert(keys.size() == 3);
    assert(keys[0].ascending && !keys[1].ascending && keys[2].ascending);

    auto e = expect_error<parse_error>([]{ parse_ordering(row_type(), "B desc A"); });
    assert(e.code() == codes::syntax_error && e.position() == 7);
}

static void test_new_expressions(){
    auto arr = parse("new[] {1, 2L}", nullptr);
    assert(type_name(arr->result_type()) == "IEnumerable<Int64>");

    auto rec = parse_lambda(row_type(), nullptr, "new(A as Key, Name)");
    assert(is_record(rec->result_type()));
    const record_type* rt = rec->result_type()->record;
    assert(rt->find_property("Key") && rt->find_property("Name"));
    assert(rt->properties().size() == 2);

    assert(row_error("new(A + 1)").code() == codes::missing_as_clause);
    assert(row_error("new(A, A)").code() == codes::duplicate_identifier);
    assert(row_error("new(A as X, B as x)").code() == codes::duplicate_identifier);
    assert(expect_error<parse_error>([]{ parse("new[] {1, \"a\"}", nullptr); }).code() == codes::type_mismatch);
}

static void test_type_access(){
    assert(type_name(row_type_of("Int32?(A)")) == "Int32?");
    assert(row_error("String?(Name)").code() == codes::no_nullable_form);
    assert(type_of("DateTime(2020, 1, 2).Year") == int_type());
    assert(type_of("Int32.MaxValue") == int_type());
    assert(type_of("Math.Abs(-5)") == int_type());
    assert(type_name(row_type_of("Name[0]")) == "Char");
    assert(type_name(row_type_of("Byte(A)")) == "Byte");
    assert(row_error("Int32(Name)").code() == codes::cannot_convert);
    assert(row_error("Name[Flag]").code() == codes::no_applicable_indexer);
}

static void test_nullable_members(){
    assert(row_type_of("N.HasValue") == bool_type());
    assert(row_type_of("N.Value") == int_type());
    assert(row_type_of("N.GetValueOrDefault()") == int_type());
    assert(row_type_of("N.GetValueOrDefault(7)") == int_type());
}

static void test_aggregates(){
    type_ref conf = entity_type_of<conference::Conference>();
    assert(parse_lambda(conf, nullptr, "Sessions.Any(Attendees > 30)")->result_type() == bool_type());
    assert(parse_lambda(conf, nullptr, "Sessions.Any()")->result_type() == bool_type());
    assert(parse_lambda(conf, nullptr, "Sessions.Count()")->result_type() == int_type());
    assert(parse_lambda(conf, nullptr, "Sessions.Sum(Attendees)")->result_type() == int_type());
    assert(type_name(parse_lambda(conf, nullptr, "Sessions.Average(Attendees)")->result_type()) == "Double");
    assert(type_name(parse_lambda(conf, nullptr, "Sessions.Where(Attendees > 3)")->result_type()) == "IEnumerable<Session>");
    // inside the argument list `it` is the element; outside it is the row again
    assert(parse_lambda(conf, nullptr, "Sessions.Any(Attendees > 3) and ConferenceId > 1")->result_type() == bool_type());
    assert(type_name(parse_lambda(conf, nullptr, "Sessions[0].Title")->result_type()) == "String");

    auto e = expect_error<unknown_member_error>([&]{ parse_lambda(conf, nullptr, "Sessions.Frob()"); });
    assert(e.code() == codes::no_applicable_aggregate);
    auto e2 = expect_error<unknown_member_error>([&]{ parse_lambda(conf, nullptr, "Sessions.Any(Title)"); });
    assert(e2.code() == codes::no_applicable_aggregate);
}

static void test_keywords_case_insensitive(){
    assert(type_of("TRUE and NOT false") == bool_type());
    assert(type_of("Null == NULL") == bool_type());
    assert(row_type_of("IIF(FLAG, a, b)") == int_type());
}

static void test_determinism(){
    const char* text = "Flag and (A + B * 2 > L or Name.Contains(\"x\"))";
    assert(dump(text) == dump(text));
}

void run_parser_tests(){
    test_dump_shapes();
    test_precedence();
    test_literal_typing();
    test_operator_typing();
    test_conditional_errors();
    test_syntax_errors();
    test_identifier_errors();
    test_placeholders();
    test_externals();
    test_named_parameters();
    test_ordering();
    test_new_expressions();
    test_type_access();
    test_nullable_members();
    test_aggregates();
    test_keywords_case_insensitive();
    test_determinism();
    std::cout << "Parser tests passed\n";
}
