#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>
#include "conference_model.hpp"
#include "dynq/dynamic_expression.hpp"
#include "dynq/evaluator.hpp"
#include "test_rows.hpp"

using namespace dynq;
using dynq_test::Row;
using conference::Conference;
using conference::Session;

namespace {

value eval(const char* text, const std::vector<bound_value>& values = {}){
    return invoke(*parse(text, nullptr, values), {});
}

value eval_row(const Row& r, const char* text){
    return invoke(*parse_lambda(entity_type_of<Row>(), nullptr, text), {entity_type<Row>::instance().wrap(r)});
}

value eval_conf(const Conference& c, const char* text){
    return invoke(*parse_lambda(entity_type_of<Conference>(), nullptr, text), {entity_type<Conference>::instance().wrap(c)});
}

template<class F>
std::string eval_error(F&& f){
    try {
        f();
    } catch(const evaluation_error& e){
        return e.code();
    }
    assert(false && "expected evaluation_error");
    return {};
}

Conference with_sessions(){
    Conference c;
    c.conference_id = 7;
    c.name = "Parser Week";
    c.sessions.push_back(Session{1, "Lexing", 40});
    c.sessions.push_back(Session{2, "Parsing", 10});
    c.sessions.push_back(Session{3, "Typing", 25});
    return c;
}

} // namespace

static void test_integer_arithmetic(){
    assert(eval("7 / 2").as<int32_t>() == 3);
    assert(eval("-7 / 2").as<int32_t>() == -3);
    assert(eval("-7 % 3").as<int32_t>() == -1);
    assert(eval("7 mod 3").as<int32_t>() == 1);
    // unchecked integer arithmetic wraps
    assert(eval("2147483647 + 1").as<int32_t>() == INT32_MIN);
    assert(eval("4294967295U + 1U").as<uint32_t>() == 0u);
    assert(eval("7.0 / 2").as<double>() == 3.5);
    assert(std::isinf(eval("1.0 / 0").as<double>()));
    assert(eval("1.5f * 2").as<float>() == 3.0f);
    assert(eval("1.5m + 1").as<decimal_t>().v == 2.5L);
}

static void test_arithmetic_faults(){
    assert(eval_error([]{ eval("1 / 0"); }) == codes::divide_by_zero);
    assert(eval_error([]{ eval("1 % 0"); }) == codes::divide_by_zero);
    assert(eval_error([]{ eval("1m / 0m"); }) == codes::divide_by_zero);
    assert(eval_error([]{ eval("-2147483648 / -1"); }) == codes::overflow);
    assert(eval_error([]{ eval("-2147483648 % -1"); }) == codes::overflow);
    assert(eval_error([]{ eval("-9223372036854775808 / -1L"); }) == codes::overflow);

    Row r;
    r.a = 10;
    r.b = 0;
    assert(eval_error([&]{ eval_row(r, "A / B"); }) == codes::divide_by_zero);
    try {
        eval_row(r, "A % B");
        assert(false);
    } catch(const evaluation_error& e){
        assert(std::string(e.what()) == "Attempted to divide by zero.");
    }
}

static void test_checked_conversions(){
    assert(eval("Byte(255)").as<uint8_t>() == 255);
    assert(eval_error([]{ eval("Byte(300)"); }) == codes::overflow);
    assert(eval_error([]{ eval("Int32(3000000000L)"); }) == codes::overflow);
    assert(eval_error([]{ eval("UInt32(-1)"); }) == codes::overflow);
    assert(eval("Int32(3.9)").as<int32_t>() == 3);
    assert(eval("Int64(-2.5)").as<int64_t>() == -2);
    assert(eval("Double(3)").as<double>() == 3.0);

    Row r;
    r.small = 200;
    assert(eval_row(r, "Small + 100").as<int32_t>() == 300);
}

static void test_nullable_lifting(){
    Row r;
    assert(eval_row(r, "N + 1").is_null());
    assert(!eval_row(r, "N > 0").as<bool>());
    assert(!eval_row(r, "N <= 0").as<bool>());
    assert(eval_row(r, "N == null").as<bool>());
    assert(!eval_row(r, "N != null").as<bool>());
    assert(!eval_row(r, "N.HasValue").as<bool>());
    assert(eval_row(r, "N.GetValueOrDefault(7)").as<int32_t>() == 7);
    assert(eval_row(r, "N.GetValueOrDefault()").as<int32_t>() == 0);
    assert(eval_error([&]{ eval_row(r, "N.Value"); }) == codes::null_reference);

    r.n = 5;
    assert(eval_row(r, "N + 1").as<int32_t>() == 6);
    assert(eval_row(r, "N > 0").as<bool>());
    assert(eval_row(r, "N.Value").as<int32_t>() == 5);
    assert(eval_row(r, "N == 5").as<bool>());
}

static void test_three_valued_logic(){
    Row r;
    assert(!eval_row(r, "Maybe && false").as<bool>());
    assert(eval_row(r, "Maybe || true").as<bool>());
    assert(eval_row(r, "Maybe && true").is_null());
    assert(eval_row(r, "Maybe || false").is_null());
    assert(eval_row(r, "!Maybe").is_null());
    r.maybe = true;
    assert(eval_row(r, "Maybe && true").as<bool>());
    assert(!eval_row(r, "!Maybe").as<bool>());
}

static void test_short_circuit(){
    Row r;
    r.a = 10;
    r.b = 0;
    assert(!eval_row(r, "B != 0 && A / B > 1").as<bool>());
    assert(eval_row(r, "B == 0 || A / B > 1").as<bool>());
    assert(eval_row(r, "B == 0 ? 0 : A / B").as<int32_t>() == 0);
    assert(eval_row(r, "iif(B == 0, -1, A / B)").as<int32_t>() == -1);
    r.b = 5;
    assert(eval_row(r, "B == 0 ? 0 : A / B").as<int32_t>() == 2);
}

static void test_null_instance(){
    assert(eval_error([]{ eval("@0.A", {bind_null(entity_type_of<Row>())}); }) == codes::null_reference);
    assert(eval_error([]{ eval("@0.Length", {bind_null(string_type())}); }) == codes::null_reference);
    Row r;
    r.n = std::nullopt;
    // ToString on an empty nullable is the empty string
    assert(eval_row(r, "N.ToString()").as<std::string>().empty());
}

static void test_strings(){
    assert(eval("\"B\" < \"a\"").as<bool>());
    assert(eval("\"abc\" == \"abc\"").as<bool>());
    assert(!eval("\"abc\" == \"ABC\"").as<bool>());
    assert(eval("\"n=\" + 5").as<std::string>() == "n=5");
    assert(eval("\"x\" & true").as<std::string>() == "xTrue");
    assert(eval("\"hello\".Substring(1, 3)").as<std::string>() == "ell");
    assert(eval("\"Hello\".ToUpper()").as<std::string>() == "HELLO");
    assert(eval("\"abc\".Contains(\"b\")").as<bool>());
    assert(eval("\"abc\".StartsWith(\"ab\")").as<bool>());
    assert(eval("\"abc\".IndexOf(\"c\")").as<int32_t>() == 2);
    assert(eval("\"  pad \".Trim()").as<std::string>() == "pad");
    assert(eval("\"abc\"[1]").as<char>() == 'b');
    assert(eval("\"abc\".Length").as<int32_t>() == 3);
    assert(eval("String.IsNullOrEmpty(\"\")").as<bool>());
    assert(eval("\"it\"\"s\"").as<std::string>() == "it\"s");
    assert(eval_error([]{ eval("\"abc\"[5]"); }) == codes::index_out_of_range);
    assert(eval_error([]{ eval("\"abc\".Substring(9)"); }) == codes::index_out_of_range);
    assert(eval("(5).ToString()").as<std::string>() == "5");
    assert(eval("true.ToString()").as<std::string>() == "True");
}

static void test_dates_and_math(){
    assert(eval("DateTime(2020, 2, 28).AddDays(1).Day").as<int32_t>() == 29);
    assert(eval("DateTime(2020, 2, 28).AddDays(1).Month").as<int32_t>() == 2);
    assert(eval("(DateTime(2020, 3, 1) - DateTime(2020, 2, 1)).Days").as<int32_t>() == 29);
    assert(eval("DateTime(2021, 1, 1) > DateTime(2020, 12, 31)").as<bool>());
    assert(eval("DateTime.IsLeapYear(2024)").as<bool>());
    assert(eval("Math.Abs(-5)").as<int32_t>() == 5);
    assert(eval("Math.Max(3, 7)").as<int32_t>() == 7);
    assert(eval("Math.Round(2.5)").as<double>() == 2.0);
    assert(eval("Math.Floor(2.7)").as<double>() == 2.0);
    assert(eval("Int32.MaxValue").as<int32_t>() == INT32_MAX);
    assert(eval("Int32.Parse(\"42\") + 1").as<int32_t>() == 43);
    assert(eval_error([]{ eval("Math.Abs(-2147483648)"); }) == codes::overflow);
}

static void test_aggregates(){
    Conference c = with_sessions();
    assert(eval_conf(c, "Sessions.Count()").as<int32_t>() == 3);
    assert(eval_conf(c, "Sessions.Count(Attendees > 20)").as<int32_t>() == 2);
    assert(eval_conf(c, "Sessions.Any(Attendees > 30)").as<bool>());
    assert(!eval_conf(c, "Sessions.All(Attendees > 30)").as<bool>());
    assert(eval_conf(c, "Sessions.Sum(Attendees)").as<int32_t>() == 75);
    assert(eval_conf(c, "Sessions.Max(Attendees)").as<int32_t>() == 40);
    assert(eval_conf(c, "Sessions.Min(Title)").as<std::string>() == "Lexing");
    assert(eval_conf(c, "Sessions.Average(Attendees)").as<double>() == 25.0);
    assert(eval_conf(c, "Sessions.Where(Attendees > 20).Count()").as<int32_t>() == 2);
    assert(eval_conf(c, "Sessions[1].Title").as<std::string>() == "Parsing");
    // the element scope ends with the argument list
    assert(eval_conf(c, "Sessions.Any(Attendees > 30) and ConferenceId == 7").as<bool>());

    Conference empty;
    assert(eval_conf(empty, "Sessions.Sum(Attendees)").as<int32_t>() == 0);
    assert(eval_conf(empty, "Sessions.All(Attendees > 0)").as<bool>());
    assert(!eval_conf(empty, "Sessions.Any()").as<bool>());
    assert(eval_error([&]{ eval_conf(empty, "Sessions.Max(Attendees)"); }) == codes::empty_sequence);
    assert(eval_error([&]{ eval_conf(empty, "Sessions.Average(Attendees)"); }) == codes::empty_sequence);
    assert(eval_error([&]{ eval_conf(empty, "Sessions[0].Title"); }) == codes::index_out_of_range);
    assert(eval_conf(empty, "Sessions.Min(Title)").is_null());
}

static void test_records_and_arrays(){
    Row r;
    r.a = 1;
    r.name = "x";
    value a = eval_row(r, "new(A as Key, Name)");
    value b = eval_row(r, "new(A as Key, Name)");
    assert(values_equal(a, b));
    assert(hash_value(a) == hash_value(b));
    assert(to_display(a) == "{Key=1, Name=x}");
    r.a = 2;
    assert(!values_equal(a, eval_row(r, "new(A as Key, Name)")));

    value arr = eval("new[] {1, 2L, 3}");
    assert(to_display(arr) == "[1, 2, 3]");
    assert(eval("new[] {1, 2, 3}.Sum(it)").as<int32_t>() == 6);
}

static void test_invoke_arity(){
    auto l = parse_lambda(entity_type_of<Row>(), nullptr, "A");
    bool threw = false;
    try {
        invoke(*l, {});
    } catch(const std::invalid_argument&){
        threw = true;
    }
    assert(threw);
}

static void test_char_and_nan_ordering(){
    // char compares as an unsigned code unit, like ordinal strings
    assert(compare_values(value((char)0xE9), value('a')) == 1);
    assert(compare_values(value(std::string("\xE9")), value(std::string("a"))) == 1);
    Row r;
    r.ch = (char)0xE9;
    assert(eval_row(r, "Ch > 'a'").as<bool>());
    assert(!eval_row(r, "Ch < 'z'").as<bool>());

    // NaN sorts before every number but relational operators stay false
    const double nan = std::nan("");
    assert(compare_values(value(nan), value(-1.0e300)) == -1);
    assert(compare_values(value(1.0), value(nan)) == 1);
    assert(compare_values(value(nan), value(nan)) == 0);
    assert(compare_values(value(std::nanf("")), value(0.0f)) == -1);
    r.x = nan;
    assert(!eval_row(r, "X < 1.0").as<bool>());
    assert(!eval_row(r, "X >= 1.0").as<bool>());
}

void run_evaluator_tests(){
    test_integer_arithmetic();
    test_arithmetic_faults();
    test_checked_conversions();
    test_nullable_lifting();
    test_three_valued_logic();
    test_short_circuit();
    test_null_instance();
    test_strings();
    test_dates_and_math();
    test_aggregates();
    test_records_and_arrays();
    test_invoke_arity();
    test_char_and_nan_ordering();
    std::cout << "Evaluator tests passed\n";
}
