#pragma once
// Entity used by the expression tests: one member per scalar kind.
#include "dynq/entity.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace dynq_test {

struct Row {
    int32_t a{0};
    int32_t b{0};
    int64_t l{0};
    int64_t m{0};
    uint32_t u{0};
    uint32_t v{0};
    double x{0};
    double y{0};
    float f{0};
    uint8_t small{0};
    char ch{'a'};
    bool flag{false};
    std::string name;
    std::optional<int32_t> n;
    std::optional<bool> maybe;
};

} // namespace dynq_test

namespace dynq {

template<> struct entity_traits<dynq_test::Row> {
    static void describe(entity_map<dynq_test::Row>& m){
        m.name("Row");
        m.key("A", &dynq_test::Row::a);
        m.field("B", &dynq_test::Row::b);
        m.field("L", &dynq_test::Row::l);
        m.field("M", &dynq_test::Row::m);
        m.field("U", &dynq_test::Row::u);
        m.field("V", &dynq_test::Row::v);
        m.field("X", &dynq_test::Row::x);
        m.field("Y", &dynq_test::Row::y);
        m.field("F", &dynq_test::Row::f);
        m.field("Small", &dynq_test::Row::small);
        m.field("Ch", &dynq_test::Row::ch);
        m.field("Flag", &dynq_test::Row::flag);
        m.field("Name", &dynq_test::Row::name);
        m.field("N", &dynq_test::Row::n);
        m.field("Maybe", &dynq_test::Row::maybe);
    }
};

} // namespace dynq
