#include <gtest/gtest.h>
#include <future>
#include <vector>
#include "conference_model.hpp"
#include "dynq/dynamic_expression.hpp"
#include "dynq/record.hpp"
#include "dynq/repository.hpp"

using namespace conference;

namespace {

Conference with_status(int32_t id, int32_t status){
    Conference c = make_conference(id);
    c.status = status;
    return c;
}

} // namespace

TEST(Scenarios, IdPredicateSplitsRows){
    auto fn = dynq::compile_lambda(dynq::entity_type_of<Conference>(), dynq::bool_type(), "ConferenceId < 100");
    Conference low = make_conference(50);
    Conference high = make_conference(150);
    EXPECT_TRUE(dynq::is_true(fn(dynq::entity_type<Conference>::instance().wrap(low))));
    EXPECT_FALSE(dynq::is_true(fn(dynq::entity_type<Conference>::instance().wrap(high))));

    conference_repository repo;
    repo.create(low);
    repo.create(high);
    auto rows = repo.find_all("ConferenceId < 100", {});
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].conference_id, 50);
}

TEST(Scenarios, StatusThenIdDescending){
    conference_repository repo;
    repo.create(with_status(5, 2));
    repo.create(with_status(9, 1));
    repo.create(with_status(3, 1));
    dynq::query<Conference> q;
    q.order_by("Status, ConferenceId desc");
    auto rows = repo.find_all(q);
    ASSERT_EQ(rows.size(), 3u);
    std::vector<std::pair<int32_t, int32_t>> got;
    for(const auto& c : rows) got.emplace_back(c.status, c.conference_id);
    std::vector<std::pair<int32_t, int32_t>> want = {{1, 9}, {1, 3}, {2, 5}};
    EXPECT_EQ(got, want);
}

TEST(Scenarios, TruncatedTextReportsEndOfInput){
    try {
        dynq::parse_lambda(dynq::entity_type_of<Conference>(), dynq::bool_type(), "ConferenceId <");
        FAIL() << "expected a parse_error";
    } catch(const dynq::parse_error& e){
        EXPECT_EQ(e.position(), 14);
        EXPECT_EQ(e.code(), dynq::codes::expression_expected);
    }
}

TEST(Scenarios, ConcurrentRecordRequestsShareOneType){
    const std::vector<dynq::property> fields = {{"Name", dynq::string_type()}, {"Count", dynq::int_type()}};
    std::vector<std::future<const dynq::dynamic_record_type*>> pending;
    for(int i = 0; i < 8; ++i)
        pending.push_back(std::async(std::launch::async, [&]{ return dynq::compile_record_type(fields); }));
    const dynq::dynamic_record_type* first = pending[0].get();
    ASSERT_NE(first, nullptr);
    for(size_t i = 1; i < pending.size(); ++i) EXPECT_EQ(pending[i].get(), first);
}
