#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "core/conflict_detector.hpp"
#include "core/resolution_engine.hpp"
#include "test_support.hpp"
#include "util/clock.hpp"

namespace {

using core::ConflictStatus;
using core::ConflictType;
using core::EscalationReason;
using core::Polarity;
using core::ResolveStatus;
using core::StrategyKind;
using test_support::day;
using test_support::ProvisionBuilder;

class ResolutionEngineTest : public ::testing::Test {
protected:
    ResolutionEngineTest()
        : cfg_(test_support::test_config()),
          clock_(test_support::at(2024, 6, 1)),
          escalation_(cfg_, clock_, &notifier_),
          engine_(store_, ledger_, escalation_, analytics_, cfg_, clock_) {}

    static ProvisionBuilder eu(const std::string& id) {
        return std::move(ProvisionBuilder(id).jurisdiction({"EU"}).topics({"breach"}).effective(day(2020, 1, 1)));
    }

    // Indexes the provisions, runs detection and returns the single conflict
    // of the requested type.
    core::Conflict detect_one(const std::vector<core::NormativeProvision>& ps, ConflictType type) {
        for (const auto& p : ps) index_.upsert(p);
        core::ConflictDetector det(store_, cfg_, nullptr, clock_);
        det.detect_index(index_);
        const auto rows = store_.list([type](const core::Conflict& c) { return c.type == type; });
        EXPECT_EQ(rows.size(), 1u);
        return rows.empty() ? core::Conflict{} : rows.front();
    }

    core::ResolveReport resolve(core::ConflictId id) {
        return engine_.resolve(id, index_, ctx_, analytics_.snapshot());
    }

    core::EngineConfig cfg_;
    util::ManualClock clock_;
    test_support::ScriptedNotifier notifier_;
    core::InMemoryConflictStore store_;
    core::ResolutionLedger ledger_;
    core::ResolutionAnalytics analytics_;
    core::EscalationManager escalation_;
    core::ResolutionEngine engine_;
    core::ProvisionIndex index_;
    core::ResolutionContext ctx_;
};

TEST_F(ResolutionEngineTest, ResolvesHierarchicalWithLexSuperior) {
    const auto c = detect_one({eu("A").authority(2).polarity(Polarity::Prohibits).build(), eu("B").authority(1).build()},
                              ConflictType::Hierarchical);
    const auto r = resolve(c.id);
    ASSERT_EQ(r.status, ResolveStatus::Resolved);
    EXPECT_EQ(r.strategy, StrategyKind::LexSuperior);
    EXPECT_DOUBLE_EQ(r.confidence, 0.92);
    ASSERT_TRUE(r.record.has_value());
    EXPECT_EQ(r.record->outcome, core::ResolutionOutcome::Applied);
    EXPECT_EQ(r.record->rationale.winner, "A");
    EXPECT_EQ(r.record->jurisdiction_bucket, "eu");
    EXPECT_DOUBLE_EQ(r.record->rationale.raw_confidence, 0.92);

    EXPECT_EQ(store_.get(c.id)->status, ConflictStatus::Resolved);
    EXPECT_EQ(ledger_.effective_count(c.id), 1u);
    EXPECT_EQ(analytics_.pending(), 1u);
    EXPECT_FALSE(escalation_.open_case_for(c.id).has_value());
}

TEST_F(ResolutionEngineTest, SecondResolveIsAlreadyHandled) {
    const auto c = detect_one({eu("A").authority(2).polarity(Polarity::Prohibits).build(), eu("B").authority(1).build()},
                              ConflictType::Hierarchical);
    ASSERT_EQ(resolve(c.id).status, ResolveStatus::Resolved);
    EXPECT_EQ(resolve(c.id).status, ResolveStatus::AlreadyHandled);
    EXPECT_EQ(ledger_.size(), 1u);
}

TEST_F(ResolutionEngineTest, UnknownConflictIsNotFound) {
    EXPECT_EQ(resolve(12345).status, ResolveStatus::NotFound);
}

TEST_F(ResolutionEngineTest, LowConfidenceEscalatesWithoutRecord) {
    cfg_.confidence_threshold = 0.95;
    const auto c = detect_one({eu("A").authority(2).polarity(Polarity::Prohibits).build(), eu("B").authority(1).build()},
                              ConflictType::Hierarchical);
    const auto r = resolve(c.id);
    ASSERT_EQ(r.status, ResolveStatus::Escalated);
    ASSERT_TRUE(r.escalation.has_value());
    EXPECT_EQ(r.escalation->reason, EscalationReason::LowConfidence);
    EXPECT_EQ(store_.get(c.id)->status, ConflictStatus::Escalated);
    EXPECT_EQ(ledger_.size(), 0u);
    EXPECT_EQ(engine_.counters().escalated_low_confidence, 1u);
}

TEST_F(ResolutionEngineTest, HistoryOfFailuresPullsConfidenceBelowThreshold) {
    analytics_.warm_start(std::vector<core::OutcomeEvent>(
        20, core::OutcomeEvent{core::StatKey{ConflictType::Hierarchical, "eu", StrategyKind::LexSuperior}, false, 1}));
    const auto c = detect_one({eu("A").authority(2).polarity(Polarity::Prohibits).build(), eu("B").authority(1).build()},
                              ConflictType::Hierarchical);
    const auto r = resolve(c.id);
    EXPECT_EQ(r.status, ResolveStatus::Escalated);
    EXPECT_LT(r.confidence, cfg_.confidence_threshold);
}

TEST_F(ResolutionEngineTest, NoApplicableStrategyEscalatesInapplicable) {
    const auto c = detect_one({eu("A").build(), eu("B").polarity(Polarity::Prohibits).build()},
                              ConflictType::Jurisdictional);
    const auto r = resolve(c.id);
    ASSERT_EQ(r.status, ResolveStatus::Escalated);
    EXPECT_EQ(r.escalation->reason, EscalationReason::StrategyInapplicable);
    EXPECT_EQ(store_.get(c.id)->status, ConflictStatus::Escalated);
    EXPECT_EQ(ledger_.size(), 0u);
}

TEST_F(ResolutionEngineTest, ApplyFailureWritesFailedRecordAndEscalates) {
    ctx_.declared_context = {"offshore"};
    const auto c = detect_one({eu("A").context_flags({"domestic"}).build(),
                               eu("B").context_flags({"cross_border"}).polarity(Polarity::Prohibits).build()},
                              ConflictType::Jurisdictional);
    const auto r = resolve(c.id);
    ASSERT_EQ(r.status, ResolveStatus::Escalated);
    EXPECT_EQ(r.escalation->reason, EscalationReason::ApplyFailed);
    ASSERT_TRUE(r.record.has_value());
    EXPECT_EQ(r.record->outcome, core::ResolutionOutcome::Failed);
    EXPECT_EQ(r.record->rationale.reason, core::ReasonCode::AmbiguousContext);
    EXPECT_EQ(ledger_.effective_count(c.id), 0u);
    EXPECT_EQ(store_.get(c.id)->status, ConflictStatus::Escalated);
}

TEST_F(ResolutionEngineTest, DeclaredContextPicksMatchingProvision) {
    ctx_.declared_context = {"domestic"};
    const auto c = detect_one({eu("A").context_flags({"domestic"}).build(),
                               eu("B").context_flags({"cross_border"}).polarity(Polarity::Prohibits).build()},
                              ConflictType::Jurisdictional);
    const auto r = resolve(c.id);
    ASSERT_EQ(r.status, ResolveStatus::Resolved);
    EXPECT_EQ(r.strategy, StrategyKind::Contextualization);
    EXPECT_EQ(r.record->rationale.winner, "A");
}

TEST_F(ResolutionEngineTest, EscalatePolicyRoutesHarmonizationToReview) {
    cfg_.harmonization_policy = core::HarmonizationPolicy::Escalate;
    const auto c = detect_one({eu("A").obligation("notify").quantity(72, "h").build(),
                               eu("B").obligation("notify").quantity(24, "h").build()},
                              ConflictType::Temporal);
    const auto r = resolve(c.id);
    ASSERT_EQ(r.status, ResolveStatus::Escalated);
    EXPECT_EQ(r.strategy, StrategyKind::Harmonization);
    EXPECT_EQ(r.escalation->reason, EscalationReason::PolicyReview);
    EXPECT_EQ(ledger_.size(), 0u);
}

TEST_F(ResolutionEngineTest, ResolvingClosesOpenCase) {
    cfg_.confidence_threshold = 0.95;
    const auto c = detect_one({eu("A").authority(2).polarity(Polarity::Prohibits).build(), eu("B").authority(1).build()},
                              ConflictType::Hierarchical);
    ASSERT_EQ(resolve(c.id).status, ResolveStatus::Escalated);
    ASSERT_TRUE(escalation_.open_case_for(c.id).has_value());

    // Changed inputs put the conflict back to Detected; a laxer threshold lets it resolve.
    cfg_.confidence_threshold = 0.6;
    index_.upsert(eu("B").authority(1).obligation("changed").build());
    core::ConflictDetector(store_, cfg_, nullptr, clock_).detect_index(index_);
    ASSERT_EQ(store_.get(c.id)->status, ConflictStatus::Detected);
    ASSERT_EQ(resolve(c.id).status, ResolveStatus::Resolved);
    EXPECT_FALSE(escalation_.open_case_for(c.id).has_value());
    EXPECT_EQ(escalation_.counters().closed_auto, 1u);
}

TEST_F(ResolutionEngineTest, HeldLeaseReportsContended) {
    const auto c = detect_one({eu("A").authority(2).polarity(Polarity::Prohibits).build(), eu("B").authority(1).build()},
                              ConflictType::Hierarchical);
    ASSERT_TRUE(engine_.leases().try_acquire(c.id));
    EXPECT_EQ(resolve(c.id).status, ResolveStatus::Contended);
    engine_.leases().release(c.id);
    EXPECT_EQ(resolve(c.id).status, ResolveStatus::Resolved);
}

TEST_F(ResolutionEngineTest, ConcurrentResolversProduceOneRecord) {
    const auto c = detect_one({eu("A").authority(2).polarity(Polarity::Prohibits).build(), eu("B").authority(1).build()},
                              ConflictType::Hierarchical);
    std::atomic<int> resolved{0};
    std::vector<std::thread> pool;
    for (int t = 0; t < 8; ++t) {
        pool.emplace_back([&] {
            if (resolve(c.id).status == ResolveStatus::Resolved) {
                resolved.fetch_add(1);
            }
        });
    }
    for (auto& t : pool) t.join();
    EXPECT_EQ(resolved.load(), 1);
    EXPECT_EQ(ledger_.effective_count(c.id), 1u);
    EXPECT_EQ(ledger_.size(), 1u);
}

TEST_F(ResolutionEngineTest, RevertReturnsConflictToDetected) {
    const auto c = detect_one({eu("A").authority(2).polarity(Polarity::Prohibits).build(), eu("B").authority(1).build()},
                              ConflictType::Hierarchical);
    const auto r = resolve(c.id);
    ASSERT_EQ(r.status, ResolveStatus::Resolved);
    analytics_.commit();

    EXPECT_EQ(engine_.revert(c.id, clock_.now_ns()), core::RevertStatus::Reverted);
    EXPECT_EQ(store_.get(c.id)->status, ConflictStatus::Detected);
    EXPECT_FALSE(ledger_.effective_for(c.id).has_value());
    EXPECT_EQ(ledger_.get(r.record->id)->outcome, core::ResolutionOutcome::Reverted);
    EXPECT_EQ(analytics_.pending(), 1u);

    EXPECT_EQ(engine_.revert(c.id, clock_.now_ns()), core::RevertStatus::NotResolved);
    EXPECT_EQ(engine_.revert(999, clock_.now_ns()), core::RevertStatus::NotFound);
}

TEST_F(ResolutionEngineTest, RevertBlockedBySupersedingInstance) {
    const auto c = detect_one({eu("A").authority(2).polarity(Polarity::Prohibits).build(), eu("B").authority(1).build()},
                              ConflictType::Hierarchical);
    ASSERT_EQ(resolve(c.id).status, ResolveStatus::Resolved);
    index_.upsert(eu("B").authority(0).build());
    core::ConflictDetector(store_, cfg_, nullptr, clock_).detect_index(index_);
    EXPECT_EQ(engine_.revert(c.id, clock_.now_ns()), core::RevertStatus::Superseded);
    EXPECT_EQ(store_.get(c.id)->status, ConflictStatus::Resolved);
}

} // namespace
