#include <cassert>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "dynq/entity.hpp"
#include "dynq/record.hpp"

using namespace dynq;

static void test_signature_is_order_independent(){
    auto& f = record_factory::instance();
    const dynamic_record_type* ab = compile_record_type({{"RfA", int_type()}, {"RfB", string_type()}});
    size_t n = f.size();
    const dynamic_record_type* ba = compile_record_type({{"RfB", string_type()}, {"RfA", int_type()}});
    assert(ab == ba);
    assert(f.size() == n);
    // the first request fixes the property order
    assert(ab->properties()[0].name == "RfA");
    assert(ab->name().rfind("DynamicClass", 0) == 0);

    const dynamic_record_type* other = compile_record_type({{"RfA", int_type()}, {"RfB", int_type()}});
    assert(other != ab);
    assert(other->name() != ab->name());
    assert(f.size() == n + 1);
}

static void test_invalid_signatures(){
    bool dup = false, empty = false, untyped = false;
    try { compile_record_type({{"X", int_type()}, {"X", string_type()}}); } catch(const std::invalid_argument&){ dup = true; }
    try { compile_record_type({{"", int_type()}}); } catch(const std::invalid_argument&){ empty = true; }
    try { compile_record_type({{"X", nullptr}}); } catch(const std::invalid_argument&){ untyped = true; }
    assert(dup && empty && untyped);
}

static void test_structural_equality(){
    const dynamic_record_type* t = compile_record_type({{"Key", int_type()}, {"Label", string_type()}});
    value a = t->make({value(int32_t{1}), value(std::string("x"))});
    value b = t->make({value(int32_t{1}), value(std::string("x"))});
    value c = t->make({value(int32_t{2}), value(std::string("x"))});
    assert(values_equal(a, b));
    assert(hash_value(a) == hash_value(b));
    assert(!values_equal(a, c));
    assert(to_display(a) == "{Key=1, Label=x}");

    // missing trailing fields take their defaults
    value partial = t->make({value(int32_t{3})});
    assert(to_display(partial) == "{Key=3, Label=}");
    assert(t->get(partial.as<record_ref>().object, 0).as<int32_t>() == 3);

    bool threw = false;
    try {
        t->make({value(int32_t{1}), value(std::string("x")), value(true)});
    } catch(const std::invalid_argument&){
        threw = true;
    }
    assert(threw);
}

static void test_property_lookup(){
    const dynamic_record_type* t = compile_record_type({{"Total", int_type()}, {"Label", string_type()}});
    assert(*t->find_property("Total") == 0);
    assert(*t->find_property("total") == 0);
    assert(*t->find_property("LABEL") == 1);
    assert(!t->find_property("Sum"));

    // names differing only in case could not be told apart by lookup
    bool threw = false;
    try {
        compile_record_type({{"Total", int_type()}, {"total", string_type()}});
    } catch(const std::invalid_argument&){
        threw = true;
    }
    assert(threw);
}

static void test_primitive_value_traits(){
    assert(value_traits<uint16_t>::static_type() == base_type(type_kind::UInt16));
    assert(value_traits<uint16_t>::to_value(uint16_t{7}).as<uint16_t>() == 7);
    assert(value_traits<char>::static_type() == base_type(type_kind::Char));
    assert(value_traits<std::string>::to_value(std::string("x")).as<std::string>() == "x");
    assert(value_traits<std::optional<int32_t>>::static_type() == nullable_of(int_type()));
    assert(value_traits<std::optional<int32_t>>::to_value(std::nullopt).is_null());
}

void run_record_factory_tests(){
    test_signature_is_order_independent();
    test_invalid_signatures();
    test_structural_equality();
    test_property_lookup();
    test_primitive_value_traits();
    std::cout << "Record factory tests passed\n";
}
