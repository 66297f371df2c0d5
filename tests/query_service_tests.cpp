#include <gtest/gtest.h>

#include "core/conflict_engine.hpp"
#include "test_support.hpp"
#include "util/clock.hpp"

namespace {

using core::ConflictStatus;
using core::ConflictType;
using core::Polarity;
using test_support::day;
using test_support::ProvisionBuilder;

// Two resolved hierarchical conflicts in the EU and one escalated
// jurisdictional conflict in the US.
class QueryServiceTest : public ::testing::Test {
protected:
    QueryServiceTest() : clock_(test_support::at(2024, 6, 1)), engine_(test_support::test_config(), store_, clock_) {
        auto p = [](const std::string& id, const std::string& fw, const std::string& j, const std::string& topic) {
            return std::move(
                ProvisionBuilder(id).framework(fw).jurisdiction({j}).topics({topic}).effective(day(2020, 1, 1)));
        };
        engine_.run_cycle({p("E1", "gdpr", "EU", "t1").authority(2).polarity(Polarity::Prohibits).build(),
                           p("E2", "nis2", "EU", "t1").authority(1).build(),
                           p("E3", "gdpr", "EU", "t2").authority(3).polarity(Polarity::Prohibits).build(),
                           p("E4", "dora", "EU", "t2").authority(1).build(),
                           p("U1", "ccpa", "US", "t3").build(),
                           p("U2", "hipaa", "US", "t3").polarity(Polarity::Prohibits).build()},
                          core::ResolutionContext{});
    }

    util::ManualClock clock_;
    core::InMemoryConflictStore store_;
    core::ConflictEngine engine_;
};

TEST_F(QueryServiceTest, FiltersConflictsByStatusAndType) {
    core::ConflictQuery q;
    q.statuses = {ConflictStatus::Resolved};
    EXPECT_EQ(engine_.query().conflicts(q).size(), 2u);

    q = {};
    q.type = ConflictType::Jurisdictional;
    const auto rows = engine_.query().conflicts(q);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows.front().status, ConflictStatus::Escalated);
}

TEST_F(QueryServiceTest, FiltersConflictsByScopeAndTime) {
    core::ConflictQuery q;
    q.jurisdiction = "US";
    EXPECT_EQ(engine_.query().conflicts(q).size(), 1u);
    q = {};
    q.framework = "dora";
    EXPECT_EQ(engine_.query().conflicts(q).size(), 1u);
    q = {};
    q.detected.from = clock_.now_ns() + 1;
    EXPECT_TRUE(engine_.query().conflicts(q).empty());
    q = {};
    q.min_severity = 2.0;
    EXPECT_TRUE(engine_.query().conflicts(q).empty());
}

TEST_F(QueryServiceTest, FiltersRecords) {
    core::RecordQuery q;
    q.strategy = core::StrategyKind::LexSuperior;
    EXPECT_EQ(engine_.query().records(q).size(), 2u);
    q.framework = "dora";
    const auto rows = engine_.query().records(q);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows.front().rationale.winner, "E3");
    EXPECT_TRUE(engine_.query().effective_record(rows.front().conflict_id).has_value());

    q = {};
    q.outcome = core::ResolutionOutcome::Reverted;
    EXPECT_TRUE(engine_.query().records(q).empty());
}

TEST_F(QueryServiceTest, FiltersCases) {
    core::CaseQuery q;
    q.statuses = {core::EscalationStatus::Open};
    const auto open = engine_.query().cases(q);
    ASSERT_EQ(open.size(), 1u);
    q.jurisdiction = "EU";
    EXPECT_TRUE(engine_.query().cases(q).empty());
    q = {};
    q.conflict_id = open.front().conflict_id;
    q.min_level = 2;
    EXPECT_TRUE(engine_.query().cases(q).empty());
}

TEST(TimeRangeTest, HalfOpen) {
    core::TimeRange r{10, 20};
    EXPECT_FALSE(r.contains(9));
    EXPECT_TRUE(r.contains(10));
    EXPECT_FALSE(r.contains(20));
    EXPECT_TRUE(core::TimeRange{}.contains(0));
}

} // namespace
