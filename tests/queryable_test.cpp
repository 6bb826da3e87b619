#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>
#include "dynq/errors.hpp"
#include "dynq/queryable.hpp"
#include "dynq/record.hpp"
#include "test_rows.hpp"

using namespace dynq;
using dynq_test::Row;

namespace {

Row row(int32_t a, int32_t b, const char* name){
    Row r;
    r.a = a;
    r.b = b;
    r.name = name;
    return r;
}

std::vector<Row> sample(){
    return {row(1, 2, "delta"), row(2, 1, "alpha"), row(3, 2, "charlie"), row(4, 1, "bravo"), row(5, 3, "echo")};
}

std::vector<int32_t> ids(const std::vector<Row>& rows){
    std::vector<int32_t> out;
    for(const auto& r : rows) out.push_back(r.a);
    return out;
}

std::vector<int32_t> ids(const value_sequence& seq){
    std::vector<int32_t> out;
    for(const auto& v : seq.items){
        const record_ref& r = v.as<record_ref>();
        out.push_back(r.type->get(r.object, *r.type->find_property("A")).as<int32_t>());
    }
    return out;
}

} // namespace

static void test_where(){
    auto rows = sample();
    assert(ids(dynamic_queryable::where(rows, "B == 1")) == (std::vector<int32_t>{2, 4}));
    assert(ids(dynamic_queryable::where(rows, "A > @0 and Name.Length > 4", {bind(1)})) == (std::vector<int32_t>{2, 3, 4}));
    assert(dynamic_queryable::where(rows, "false").empty());

    value_sequence seq = dynamic_queryable::as_sequence(rows);
    value_sequence hit = dynamic_queryable::where(seq, "Name.StartsWith(\"e\")");
    assert(ids(hit) == (std::vector<int32_t>{5}));
    assert(hit.element == entity_type_of<Row>());

    bool threw = false;
    try {
        dynamic_queryable::where(rows, "A + 1");
    } catch(const parse_error& e){
        threw = e.code() == codes::type_mismatch;
    }
    assert(threw);
}

static void test_order_by(){
    auto rows = sample();
    assert(ids(dynamic_queryable::order_by(rows, "Name")) == (std::vector<int32_t>{2, 4, 3, 1, 5}));
    assert(ids(dynamic_queryable::order_by(rows, "A desc")) == (std::vector<int32_t>{5, 4, 3, 2, 1}));
    // ties on B keep input order; the second key breaks them when given
    assert(ids(dynamic_queryable::order_by(rows, "B")) == (std::vector<int32_t>{2, 4, 1, 3, 5}));
    assert(ids(dynamic_queryable::order_by(rows, "B, A descending")) == (std::vector<int32_t>{4, 2, 3, 1, 5}));
    assert(ids(dynamic_queryable::order_by(rows, "B desc, Name")) == (std::vector<int32_t>{5, 3, 1, 2, 4}));
}

static void test_stable_order_nulls(){
    std::vector<std::vector<value>> keys = {{value(int32_t{2})}, {value{}}, {value(int32_t{1})}, {value{}}};
    // null sorts first ascending and last descending
    assert(stable_order(keys, {true}) == (std::vector<size_t>{1, 3, 2, 0}));
    assert(stable_order(keys, {false}) == (std::vector<size_t>{0, 2, 1, 3}));
    assert(stable_order(std::vector<std::vector<value>>{}, std::vector<bool>{true}).empty());

    // NaN orders before every number, so sorting stays well defined
    const double nan = std::nan("");
    std::vector<std::vector<value>> reals = {{value(1.0)}, {value(nan)}, {value(0.5)}, {value(nan)}};
    assert(stable_order(reals, {true}) == (std::vector<size_t>{1, 3, 2, 0}));
    assert(stable_order(reals, {false}) == (std::vector<size_t>{0, 2, 1, 3}));
}

static void test_select(){
    auto rows = sample();
    value_sequence names = dynamic_queryable::select(rows, "Name.ToUpper()");
    assert(names.element == string_type());
    assert(names.items.size() == 5 && names.items[1].as<std::string>() == "ALPHA");

    value_sequence shaped = dynamic_queryable::select(rows, "new(A as Id, B * 10 as Score)");
    assert(is_record(shaped.element));
    const record_type* rt = shaped.element->record;
    const record_ref& first = shaped.items[0].as<record_ref>();
    assert(rt->get(first.object, *rt->find_property("Score")).as<int32_t>() == 20);
    assert(to_display(shaped.items[4]) == "{Id=5, Score=30}");

    // projections compare structurally
    value_sequence again = dynamic_queryable::select(rows, "new(A as Id, B * 10 as Score)");
    assert(values_equal(shaped.items[2], again.items[2]));
}

static void test_group_by(){
    auto rows = sample();
    value_sequence groups = dynamic_queryable::group_by(dynamic_queryable::as_sequence(rows), "B", "Name");
    assert(groups.items.size() == 3);
    const record_type* g = groups.element->record;
    const size_t key = *g->find_property("Key");
    const size_t items = *g->find_property("Items");
    // first appearance order: B = 2, 1, 3
    const record_ref& first = groups.items[0].as<record_ref>();
    assert(g->get(first.object, key).as<int32_t>() == 2);
    sequence_ref members = g->get(first.object, items).as<sequence_ref>();
    assert(members->items.size() == 2);
    assert(members->items[0].as<std::string>() == "delta" && members->items[1].as<std::string>() == "charlie");
    const record_ref& last = groups.items[2].as<record_ref>();
    assert(g->get(last.object, key).as<int32_t>() == 3);
    assert(to_display(groups.items[1]).find("[alpha, bravo]") != std::string::npos);
}

static void test_take_skip_any_count(){
    auto rows = sample();
    value_sequence seq = dynamic_queryable::as_sequence(rows);
    assert(ids(dynamic_queryable::take(seq, 2)) == (std::vector<int32_t>{1, 2}));
    assert(ids(dynamic_queryable::skip(seq, 3)) == (std::vector<int32_t>{4, 5}));
    assert(dynamic_queryable::take(seq, 10).items.size() == 5);
    assert(dynamic_queryable::skip(seq, 10).items.empty());
    assert(dynamic_queryable::any(seq));
    assert(!dynamic_queryable::any(dynamic_queryable::skip(seq, 5)));
    assert(dynamic_queryable::any(rows, "Name == \"echo\""));
    assert(!dynamic_queryable::any(rows, "A > 100"));
    assert(dynamic_queryable::count(seq) == 5);
    assert(dynamic_queryable::count(rows, "B == @0", {bind(2)}) == 2);

    value_sequence untyped;
    bool threw = false;
    try {
        dynamic_queryable::where(untyped, "true");
    } catch(const std::invalid_argument&){
        threw = true;
    }
    assert(threw);
}

static void test_compiled_lambda(){
    compiled_lambda fn = compile_lambda(entity_type_of<Row>(), bool_type(), "A > 2");
    assert(fn.valid() && !fn.is_native());
    assert(fn.source() == "A > 2");
    assert(fn.result_type() == bool_type());
    Row r = row(3, 0, "x");
    assert(is_true(fn(entity_type<Row>::instance().wrap(r))));
    assert(!compiled_lambda().valid());
    bool threw = false;
    try {
        compile(nullptr);
    } catch(const std::invalid_argument&){
        threw = true;
    }
    assert(threw);
}

void run_queryable_tests(){
    test_where();
    test_order_by();
    test_stable_order_nulls();
    test_select();
    test_group_by();
    test_take_skip_any_count();
    test_compiled_lambda();
    std::cout << "Queryable tests passed\n";
}
