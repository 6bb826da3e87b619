#include <cassert>
#include <iostream>
#include <string>
#include "dynq/diagnostics.hpp"
#include "dynq/dynamic_expression.hpp"
#include "dynq/errors.hpp"
#include "test_env.hpp"
#include "test_rows.hpp"

using namespace dynq;

static query_error capture(const char* text){
    try {
        parse_lambda(entity_type_of<dynq_test::Row>(), bool_type(), text);
    } catch(const query_error& e){
        return e;
    }
    assert(false && "expected a query_error");
    return query_error("", "", -1);
}

static bool has_suggestion(const query_error& e){
    for(const auto& n : e.notes())
        if(n.message.find("did you mean") != std::string::npos) return true;
    return false;
}

static void test_fuzzy_candidates(){
    assert(edit_distance("kitten", "sitting") == 3);
    assert(edit_distance("", "abc") == 3);
    auto c = fuzzy_candidates("Stauts", {"Status", "Name", "StartDate"});
    assert(!c.empty() && c[0] == "Status");
    // matching ignores case
    assert(fuzzy_candidates("NAME", {"Name"}).size() == 1);
    assert(fuzzy_candidates("zzzzzz", {"Name"}).empty());
}

static void test_suggestion_notes(){
    auto e = capture("Flga");
    assert(e.code() == codes::unknown_member);
    assert(has_suggestion(e));
    assert(e.notes()[0].message == "did you mean Flag");
    assert(e.notes()[0].position == 0);

    // gated off with DYNQ_SUGGEST=0
    _putenv("DYNQ_SUGGEST=0");
    auto quiet = capture("Flga");
    _putenv("DYNQ_SUGGEST=");
    assert(quiet.code() == codes::unknown_member);
    assert(!has_suggestion(quiet));
}

static void test_render_caret(){
    const std::string src = "A < 1 )";
    auto e = capture(src.c_str());
    std::string out = render_caret(e, src);
    assert(out == "  A < 1 )\n        ^\nerror[E0201]: Syntax error\n");

    // a position at the end of the text points just past the last character
    auto end = capture("A <");
    std::string tail = render_caret(end, "A <");
    assert(tail.find("\n     ^\n") != std::string::npos);
    assert(tail.find("error[E0202]: Expression expected") != std::string::npos);
}

static void test_json(){
    auto e = capture("Flga");
    std::string js = to_json(e);
    assert(js.rfind("{\"code\":\"E0401\",\"message\":\"No property or field 'Flga' exists in type 'Row'\",\"position\":0,\"notes\":[", 0) == 0);
    assert(js.find("{\"message\":\"did you mean Flag\",\"position\":0}") != std::string::npos);
    assert(json_escape("a\"b\\c\n") == "\"a\\\"b\\\\c\\n\"");
    assert(json_escape(std::string(1, '\x01')) == "\"\\u0001\"");

    query_error bare(codes::syntax_error, "Syntax error", -1);
    assert(to_json(bare) == "{\"code\":\"E0201\",\"message\":\"Syntax error\",\"position\":-1,\"notes\":[]}");
    assert(std::string(bare.what()) == "Syntax error");
}

static void test_error_hierarchy(){
    // every positional error is a query_error; resolution failures are parse_errors
    try {
        parse("1 + \"a\" * 2", nullptr);
        assert(false);
    } catch(const parse_error& e){
        assert(e.code() == codes::incompatible_operands);
        assert(e.position() == 8);
    }
    try {
        parse("1 ~ 2", nullptr);
        assert(false);
    } catch(const lex_error& e){
        assert(e.position() == 2);
    }
}

void run_diagnostics_tests(){
    test_fuzzy_candidates();
    test_suggestion_notes();
    test_render_caret();
    test_json();
    test_error_hierarchy();
    std::cout << "Diagnostics tests passed\n";
}
