#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

#include "core/resolution_analytics.hpp"
#include "test_support.hpp"

namespace {

using core::ConflictType;
using core::OutcomeEvent;
using core::StatKey;
using core::StrategyKind;

const StatKey kKey{ConflictType::Hierarchical, "eu", StrategyKind::LexSuperior};

TEST(ResolutionAnalyticsTest, EmptySnapshotGivesNeutralPrior) {
    core::ResolutionAnalytics analytics;
    const auto prior = analytics.snapshot()->prior_for(kKey);
    EXPECT_DOUBLE_EQ(prior.rate, 0.5);
    EXPECT_EQ(prior.samples, 0u);
}

TEST(ResolutionAnalyticsTest, CommitPublishesNewSnapshotAndKeepsOld) {
    core::ResolutionAnalytics analytics;
    const auto before = analytics.snapshot();
    analytics.record_outcome(OutcomeEvent{kKey, true, 10});
    analytics.record_outcome(OutcomeEvent{kKey, true, 20});
    analytics.record_outcome(OutcomeEvent{kKey, false, 15});
    EXPECT_EQ(analytics.pending(), 3u);
    EXPECT_EQ(before->find(kKey), nullptr);

    EXPECT_EQ(analytics.commit(), 3u);
    const auto after = analytics.snapshot();
    ASSERT_NE(after->find(kKey), nullptr);
    EXPECT_EQ(after->find(kKey)->success_count, 2u);
    EXPECT_EQ(after->find(kKey)->failure_count, 1u);
    EXPECT_EQ(after->find(kKey)->last_updated, 20u);
    EXPECT_DOUBLE_EQ(after->prior_for(kKey).rate, 3.0 / 5.0);
    EXPECT_EQ(after->epoch(), before->epoch() + 1);
    EXPECT_EQ(before->find(kKey), nullptr);
    EXPECT_EQ(analytics.commit(), 0u);
}

TEST(ResolutionAnalyticsTest, KeysAreSeparatedByBucketAndStrategy) {
    core::ResolutionAnalytics analytics;
    analytics.record_outcome(OutcomeEvent{kKey, true, 1});
    analytics.record_outcome(OutcomeEvent{StatKey{ConflictType::Hierarchical, "us", StrategyKind::LexSuperior}, false, 1});
    analytics.commit();
    EXPECT_EQ(analytics.snapshot()->stats().size(), 2u);
    EXPECT_EQ(analytics.snapshot()->prior_for(kKey).samples, 1u);
}

TEST(ResolutionAnalyticsTest, WarmStartSeedsStats) {
    core::ResolutionAnalytics analytics;
    std::vector<OutcomeEvent> history(4, OutcomeEvent{kKey, false, 5});
    EXPECT_EQ(analytics.warm_start(history), 4u);
    EXPECT_EQ(analytics.snapshot()->find(kKey)->failure_count, 4u);
}

TEST(ResolutionAnalyticsTest, BackgroundCommitterMergesAndStopSettles) {
    core::ResolutionAnalytics analytics;
    ASSERT_TRUE(analytics.start(1'000'000)); // 1ms
    analytics.record_outcome(OutcomeEvent{kKey, true, 1});
    for (int i = 0; i < 1000 && analytics.snapshot()->find(kKey) == nullptr; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    ASSERT_NE(analytics.snapshot()->find(kKey), nullptr);
    analytics.record_outcome(OutcomeEvent{kKey, false, 2});
    analytics.stop();
    EXPECT_EQ(analytics.pending(), 0u);
    EXPECT_EQ(analytics.snapshot()->find(kKey)->samples(), 2u);
}

TEST(ResolutionAnalyticsTest, ConcurrentWritersLoseNothing) {
    core::ResolutionAnalytics analytics;
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&] {
            for (int i = 0; i < 250; ++i) {
                analytics.record_outcome(OutcomeEvent{kKey, i % 2 == 0, 1});
                if (i % 50 == 0) analytics.commit();
            }
        });
    }
    for (auto& w : writers) w.join();
    analytics.commit();
    EXPECT_EQ(analytics.snapshot()->find(kKey)->samples(), 1000u);
}

TEST(JurisdictionBucketsTest, MapsFirstConfiguredTag) {
    const auto cfg = test_support::test_config();
    core::JurisdictionBuckets buckets(cfg);
    core::Conflict c{};
    c.jurisdictions = {"DE", "US"};
    EXPECT_EQ(buckets.bucket_for(c), "eu");
    c.evidence.jurisdiction_intersection = {"US"};
    EXPECT_EQ(buckets.bucket_for(c), "us");
    c.evidence.jurisdiction_intersection = {"JP"};
    EXPECT_EQ(buckets.bucket_for(c), "JP");
    c.evidence.jurisdiction_intersection.clear();
    c.jurisdictions.clear();
    EXPECT_EQ(buckets.bucket_for(c), "unscoped");
}

} // namespace
