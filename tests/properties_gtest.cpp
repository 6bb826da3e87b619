#include <gtest/gtest.h>
#include <algorithm>
#include <climits>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>
#include "dynq/dynamic_expression.hpp"
#include "dynq/errors.hpp"
#include "dynq/queryable.hpp"
#include "dynq/record.hpp"
#include "test_rows.hpp"

using dynq_test::Row;

namespace {

// Either a value or the code of the evaluation_error it raised.
struct outcome {
    std::optional<int64_t> v;
    std::string code;
};

outcome run(const dynq::compiled_lambda& fn, const Row& r){
    outcome o;
    try {
        dynq::value v = fn(dynq::entity_type<Row>::instance().wrap(r));
        o.v = v.is<bool>() ? (int64_t)v.as<bool>() : v.is<int32_t>() ? (int64_t)v.as<int32_t>() : v.as<int64_t>();
    } catch(const dynq::evaluation_error& e){
        o.code = e.code();
    }
    return o;
}

outcome expected(int64_t v){ outcome o; o.v = v; return o; }
outcome failed(const char* code){ outcome o; o.code = code; return o; }

bool same(const outcome& a, const outcome& b){ return a.v == b.v && a.code == b.code; }

int32_t wrap32(int64_t v){ return (int32_t)(uint32_t)(uint64_t)v; }

struct law {
    const char* text;
    outcome (*oracle)(const Row&);
};

const law laws[] = {
    {"A + B * 3 - L", [](const Row& r){ return expected((int64_t)wrap32((int64_t)r.a + (int64_t)r.b * 3) - r.l); }},
    {"A / B", [](const Row& r){
        if(r.b == 0) return failed(dynq::codes::divide_by_zero);
        if(r.a == INT_MIN && r.b == -1) return failed(dynq::codes::overflow);
        return expected(r.a / r.b);
    }},
    {"A % B", [](const Row& r){
        if(r.b == 0) return failed(dynq::codes::divide_by_zero);
        if(r.a == INT_MIN && r.b == -1) return failed(dynq::codes::overflow);
        return expected(r.a % r.b);
    }},
    {"iif(A > B, A - B, B - A)", [](const Row& r){ return expected(wrap32(r.a > r.b ? (int64_t)r.a - r.b : (int64_t)r.b - r.a)); }},
    {"A >= B && L != 0 || Flag", [](const Row& r){ return expected((r.a >= r.b && r.l != 0) || r.flag); }},
};

std::vector<Row> random_rows(size_t n, uint32_t seed){
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int32_t> small(-50, 50);
    std::uniform_int_distribution<int64_t> wide(-1000000, 1000000);
    std::vector<Row> rows;
    for(size_t i = 0; i < n; ++i){
        Row r;
        r.a = small(gen);
        r.b = small(gen) / 5;
        r.l = wide(gen);
        r.flag = (gen() & 1) != 0;
        if(i % 17 == 0){ r.a = INT_MIN; r.b = -1; }
        if(i % 23 == 0) r.a = INT_MAX;
        rows.push_back(r);
    }
    return rows;
}

} // namespace

TEST(Properties, InterpreterAndNativeAgreeWithOracle){
    auto rows = random_rows(400, 7);
    for(const auto& l : laws){
        auto interp = dynq::compile_lambda(dynq::entity_type_of<Row>(), nullptr, l.text);
        dynq::compile_options opts;
        opts.jit = true;
        auto jit = dynq::compile_lambda(dynq::entity_type_of<Row>(), nullptr, l.text, {}, opts);
        EXPECT_FALSE(interp.is_native());
        for(const auto& r : rows){
            outcome want = l.oracle(r);
            EXPECT_TRUE(same(run(interp, r), want)) << l.text << " a=" << r.a << " b=" << r.b;
            EXPECT_TRUE(same(run(jit, r), want)) << l.text << " (native) a=" << r.a << " b=" << r.b;
        }
    }
}

TEST(Properties, ParsingIsDeterministic){
    const char* texts[] = {"A + B * 3 - L", "iif(A > B, A, B) == 3 or Name.Contains(\"q\")", "new(A as Key, Name)"};
    for(const char* t : texts){
        auto first = dynq::parse_lambda(dynq::entity_type_of<Row>(), nullptr, t);
        auto second = dynq::parse_lambda(dynq::entity_type_of<Row>(), nullptr, t);
        EXPECT_EQ(dynq::to_string(*first), dynq::to_string(*second));
        EXPECT_EQ(first->result_type(), second->result_type());
    }
}

TEST(Properties, OrderingIsStable){
    auto rows = random_rows(300, 11);
    for(size_t i = 0; i < rows.size(); ++i){
        rows[i].m = (int64_t)i;
        rows[i].b = (int32_t)(i * 7 % 4);
    }
    auto sorted = dynq::dynamic_queryable::order_by(rows, "B");
    ASSERT_EQ(sorted.size(), rows.size());
    for(size_t i = 1; i < sorted.size(); ++i){
        ASSERT_LE(sorted[i - 1].b, sorted[i].b);
        if(sorted[i - 1].b == sorted[i].b) EXPECT_LT(sorted[i - 1].m, sorted[i].m);
    }
    auto twice = dynq::dynamic_queryable::order_by(sorted, "B");
    for(size_t i = 0; i < sorted.size(); ++i) EXPECT_EQ(twice[i].m, sorted[i].m);
}

TEST(Properties, MultiKeyOrderingMatchesNestedComparator){
    std::mt19937 gen(23);
    std::vector<Row> rows;
    for(int32_t i = 0; i < 240; ++i){
        Row r;
        r.a = (int32_t)(gen() % 6);
        r.b = (int32_t)(gen() % 4);
        r.flag = (gen() & 1) != 0;
        rows.push_back(r);
    }
    std::shuffle(rows.begin(), rows.end(), gen);
    // m records the position in the permuted input
    for(size_t i = 0; i < rows.size(); ++i) rows[i].m = (int64_t)i;

    std::vector<Row> want = rows;
    std::stable_sort(want.begin(), want.end(), [](const Row& x, const Row& y){
        if(x.b != y.b) return x.b < y.b;
        if(x.flag != y.flag) return x.flag && !y.flag;
        return x.a < y.a;
    });
    auto got = dynq::dynamic_queryable::order_by(rows, "B, Flag desc, A");
    ASSERT_EQ(got.size(), want.size());
    for(size_t i = 0; i < got.size(); ++i) EXPECT_EQ(got[i].m, want[i].m) << "at " << i;

    size_t ties = 0;
    for(size_t i = 1; i < got.size(); ++i){
        const Row& p = got[i - 1];
        const Row& q = got[i];
        if(p.b == q.b && p.flag == q.flag && p.a == q.a){
            ++ties;
            EXPECT_LT(p.m, q.m);
        }
    }
    // 48 key combinations over 240 rows guarantee full ties
    EXPECT_GT(ties, 0u);
}

TEST(Properties, RecordTypesAreCachedBySignature){
    std::vector<const dynq::dynamic_record_type*> seen(6, nullptr);
    std::vector<std::thread> workers;
    for(size_t i = 0; i < seen.size(); ++i){
        workers.emplace_back([&seen, i]{
            // alternate the declaration order; the signature is the same
            std::vector<dynq::property> props = {{"PropQ", dynq::int_type()}, {"PropP", dynq::string_type()}};
            if(i % 2) std::swap(props[0], props[1]);
            seen[i] = dynq::compile_record_type(props);
        });
    }
    for(auto& w : workers) w.join();
    for(const auto* t : seen) EXPECT_EQ(t, seen[0]);
    EXPECT_EQ(dynq::compile_record_type({{"PropP", dynq::string_type()}, {"PropQ", dynq::int_type()}}), seen[0]);
}
