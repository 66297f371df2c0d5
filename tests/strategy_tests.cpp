#include <gtest/gtest.h>

#include "core/strategy.hpp"
#include "core/strategy_selector.hpp"
#include "test_support.hpp"

namespace {

using core::ApplyStatus;
using core::ConflictType;
using core::Polarity;
using core::ReasonCode;
using core::StrategyKind;
using test_support::day;
using test_support::ProvisionBuilder;

core::Conflict conflict_of(ConflictType type, const core::NormativeProvision& a, const core::NormativeProvision& b) {
    core::Conflict c{};
    c.id = 1;
    c.pair = core::PairKey::make(a.id, b.id);
    c.type = type;
    c.jurisdictions = core::sorted_union(a.jurisdiction, b.jurisdiction);
    c.topics = core::sorted_intersection(a.topic_tags, b.topic_tags);
    c.evidence.jurisdiction_intersection = core::sorted_intersection(a.jurisdiction, b.jurisdiction);
    c.evidence.overlap = core::overlap_window(a, b);
    c.evidence.authority_gap = a.authority_level - b.authority_level;
    return c;
}

class StrategyTest : public ::testing::Test {
protected:
    StrategyTest() : cfg_(test_support::test_config()) {}

    static ProvisionBuilder base(const std::string& id) {
        return std::move(ProvisionBuilder(id).jurisdiction({"EU"}).topics({"breach"}).effective(day(2020, 1, 1)));
    }

    core::StrategyOutcome apply(const core::Strategy& s, ConflictType type, const core::NormativeProvision& a,
                                const core::NormativeProvision& b) {
        const auto c = conflict_of(type, a, b);
        const core::StrategyInputs in{c, a, b, cfg_, ctx_};
        return core::apply_strategy(s, in);
    }

    std::optional<core::StrategyCandidate> select(ConflictType type, const core::NormativeProvision& a,
                                                  const core::NormativeProvision& b) {
        const auto c = conflict_of(type, a, b);
        const core::StrategyInputs in{c, a, b, cfg_, ctx_};
        return core::select_strategy(in);
    }

    core::EngineConfig cfg_;
    core::ResolutionContext ctx_;
};

TEST_F(StrategyTest, LexSuperiorPicksHigherAuthority) {
    const auto a = base("A").authority(1).build();
    const auto b = base("B").authority(3).build();
    const auto out = apply(core::LexSuperior{-2}, ConflictType::Hierarchical, a, b);
    EXPECT_EQ(out.status, ApplyStatus::Applied);
    EXPECT_EQ(out.rationale.reason, ReasonCode::HigherAuthority);
    EXPECT_EQ(out.rationale.winner, "B");
    EXPECT_EQ(out.rationale.loser, "A");
    EXPECT_GT(out.rationale.evidence_count, 0u);
}

TEST_F(StrategyTest, LexSuperiorFailsOnEqualAuthority) {
    const auto out = apply(core::LexSuperior{}, ConflictType::Hierarchical, base("A").build(), base("B").build());
    EXPECT_EQ(out.status, ApplyStatus::Failed);
    EXPECT_EQ(out.rationale.reason, ReasonCode::NotApplicable);
}

TEST_F(StrategyTest, LexPosteriorPicksLaterDate) {
    const auto a = base("A").effective(day(2023, 6, 1)).build();
    const auto b = base("B").build();
    const auto out = apply(core::LexPosterior{}, ConflictType::Temporal, a, b);
    EXPECT_EQ(out.status, ApplyStatus::Applied);
    EXPECT_EQ(out.rationale.winner, "A");
}

TEST_F(StrategyTest, LexPosteriorRefusesDifferentScopes) {
    const auto a = base("A").build();
    const auto b = base("B").qualifiers({"large"}).effective(day(2023, 1, 1)).build();
    const auto out = apply(core::LexPosterior{}, ConflictType::Temporal, a, b);
    EXPECT_EQ(out.status, ApplyStatus::Failed);
    EXPECT_EQ(out.rationale.reason, ReasonCode::NotApplicable);
}

TEST_F(StrategyTest, LexSpecialisPicksNarrowerAndKeepsGeneralOutside) {
    const auto a = base("A").build();
    const auto b = base("B").qualifiers({"staff>500"}).build();
    const auto out = apply(core::LexSpecialis{}, ConflictType::Jurisdictional, a, b);
    EXPECT_EQ(out.status, ApplyStatus::Applied);
    EXPECT_EQ(out.rationale.reason, ReasonCode::NarrowerScope);
    EXPECT_EQ(out.rationale.winner, "B");
    EXPECT_EQ(out.rationale.loser, "A");
}

TEST_F(StrategyTest, HarmonizationTakesTighterCeiling) {
    const auto a = base("A").quantity(48, "h").build();
    const auto b = base("B").quantity(24, "h").build();
    const auto out = apply(core::Harmonization{core::HarmonizationPolicy::MostRestrictive}, ConflictType::Temporal, a, b);
    ASSERT_EQ(out.status, ApplyStatus::Applied);
    EXPECT_EQ(out.rationale.reason, ReasonCode::MostRestrictive);
    ASSERT_TRUE(out.rationale.harmonized.has_value());
    EXPECT_DOUBLE_EQ(out.rationale.harmonized->value, 24.0);
    EXPECT_EQ(out.rationale.winner, "B");
}

TEST_F(StrategyTest, HarmonizationFloorAndLeastRestrictive) {
    const auto a = base("A").quantity(10, "d", core::QuantityBound::AtLeast).build();
    const auto b = base("B").quantity(30, "d", core::QuantityBound::AtLeast).build();
    auto out = apply(core::Harmonization{core::HarmonizationPolicy::MostRestrictive}, ConflictType::Temporal, a, b);
    EXPECT_DOUBLE_EQ(out.rationale.harmonized->value, 30.0);
    out = apply(core::Harmonization{core::HarmonizationPolicy::LeastRestrictive}, ConflictType::Temporal, a, b);
    EXPECT_EQ(out.rationale.reason, ReasonCode::LeastRestrictive);
    EXPECT_DOUBLE_EQ(out.rationale.harmonized->value, 10.0);
}

TEST_F(StrategyTest, HarmonizationEscalatePolicyDeclines) {
    const auto out = apply(core::Harmonization{core::HarmonizationPolicy::Escalate}, ConflictType::Temporal,
                           base("A").quantity(48, "h").build(), base("B").quantity(24, "h").build());
    EXPECT_EQ(out.status, ApplyStatus::Declined);
    EXPECT_EQ(out.rationale.reason, ReasonCode::PolicyReview);
}

TEST_F(StrategyTest, HarmonizationRejectsMismatchedUnits) {
    const auto out = apply(core::Harmonization{}, ConflictType::Temporal, base("A").quantity(48, "h").build(),
                           base("B").quantity(2, "d").build());
    EXPECT_EQ(out.status, ApplyStatus::Failed);
}

TEST_F(StrategyTest, ContextualizationMatchesDeclaredContext) {
    const auto a = base("A").context_flags({"cross_border"}).build();
    const auto b = base("B").context_flags({"domestic"}).build();
    auto out = apply(core::Contextualization{{"domestic"}}, ConflictType::Jurisdictional, a, b);
    EXPECT_EQ(out.status, ApplyStatus::Applied);
    EXPECT_EQ(out.rationale.reason, ReasonCode::ContextMatch);
    EXPECT_EQ(out.rationale.winner, "B");

    out = apply(core::Contextualization{{"elsewhere"}}, ConflictType::Jurisdictional, a, b);
    EXPECT_EQ(out.status, ApplyStatus::Failed);
    EXPECT_EQ(out.rationale.reason, ReasonCode::AmbiguousContext);
}

TEST_F(StrategyTest, ContextualizationWithoutDeclaredContextChoosesNeither) {
    const auto a = base("A").context_flags({"cross_border"}).build();
    const auto b = base("B").context_flags({"domestic"}).build();
    const auto out = apply(core::Contextualization{}, ConflictType::Jurisdictional, a, b);
    EXPECT_EQ(out.status, ApplyStatus::Failed);
    EXPECT_EQ(out.rationale.reason, ReasonCode::AmbiguousContext);
    EXPECT_FALSE(out.rationale.winner.has_value());
    EXPECT_TRUE(out.rationale.schedule.empty());
}

TEST_F(StrategyTest, ContextualizationWithoutAnyFlagsIsNotApplicable) {
    const auto out =
        apply(core::Contextualization{{"domestic"}}, ConflictType::Jurisdictional, base("A").build(), base("B").build());
    EXPECT_EQ(out.status, ApplyStatus::Failed);
    EXPECT_EQ(out.rationale.reason, ReasonCode::NotApplicable);
}

TEST_F(StrategyTest, TemporalResolutionSchedulesWindows) {
    const auto a = base("A").effective(day(2022, 1, 1)).build();
    const auto b = base("B").effective(day(2020, 1, 1)).expires(day(2021, 1, 1)).build();
    const auto out = apply(core::TemporalResolution{}, ConflictType::Hierarchical, a, b);
    ASSERT_EQ(out.status, ApplyStatus::Applied);
    ASSERT_EQ(out.rationale.schedule.size(), 2u);
    EXPECT_EQ(out.rationale.schedule[0].provision, "B");
    EXPECT_EQ(out.rationale.schedule[1].provision, "A");
    EXPECT_EQ(out.rationale.schedule[1].window->start, day(2022, 1, 1));
}

TEST_F(StrategyTest, ArbitrationUsesRanks) {
    const auto out = apply(core::JurisdictionalArbitration{5, 10}, ConflictType::Jurisdictional, base("A").build(),
                           base("B").build());
    EXPECT_EQ(out.rationale.reason, ReasonCode::PrecedenceTable);
    EXPECT_EQ(out.rationale.winner, "B");
    EXPECT_EQ(apply(core::JurisdictionalArbitration{5, 5}, ConflictType::Jurisdictional, base("A").build(),
                    base("B").build())
                  .status,
              ApplyStatus::Failed);
}

TEST_F(StrategyTest, PrecedenceRankTakesHighestTag) {
    EXPECT_EQ(core::precedence_rank(ProvisionBuilder("X").jurisdiction({"DE", "EU"}).build(), cfg_), 10);
    EXPECT_FALSE(core::precedence_rank(ProvisionBuilder("X").jurisdiction({"JP"}).build(), cfg_).has_value());
}

TEST_F(StrategyTest, SelectsLexSuperiorForHierarchical) {
    const auto c = select(ConflictType::Hierarchical, base("A").authority(2).polarity(Polarity::Prohibits).build(),
                          base("B").authority(1).build());
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(core::kind_of(c->strategy), StrategyKind::LexSuperior);
    EXPECT_DOUBLE_EQ(c->raw_confidence, core::confidence::kLexSuperiorGap1);

    const auto wide = select(ConflictType::Hierarchical, base("A").authority(4).build(), base("B").authority(1).build());
    EXPECT_DOUBLE_EQ(wide->raw_confidence, core::confidence::kLexSuperiorWide);
}

TEST_F(StrategyTest, HierarchicalPrefersTemporalResolutionForSequentialWindows) {
    const auto c = select(ConflictType::Hierarchical, base("A").authority(2).expires(day(2021, 1, 1)).build(),
                          base("B").effective(day(2022, 1, 1)).build());
    EXPECT_EQ(core::kind_of(c->strategy), StrategyKind::TemporalResolution);
}

TEST_F(StrategyTest, TemporalOrderHarmonizationBeforePosterior) {
    const auto a = base("A").obligation("notify").quantity(48, "h").build();
    const auto b = base("B").obligation("notify").quantity(24, "h").effective(day(2023, 1, 1)).build();
    const auto c = select(ConflictType::Temporal, a, b);
    EXPECT_EQ(core::kind_of(c->strategy), StrategyKind::Harmonization);

    const auto posterior = select(ConflictType::Temporal, base("A").obligation("x").build(),
                                  base("B").obligation("y").effective(day(2023, 6, 1)).build());
    EXPECT_EQ(core::kind_of(posterior->strategy), StrategyKind::LexPosterior);
}

TEST_F(StrategyTest, TemporalSameDateFallsThroughToSpecialis) {
    const auto c = select(ConflictType::Temporal, base("A").obligation("x").build(),
                          base("B").obligation("y").qualifiers({"bank"}).build());
    EXPECT_EQ(core::kind_of(c->strategy), StrategyKind::LexSpecialis);
}

TEST_F(StrategyTest, TemporalLaterNarrowerRuleGoesToSpecialis) {
    const auto a = base("A").obligation("report annually").build();
    const auto b = base("B").obligation("report quarterly").qualifiers({"large"}).effective(day(2023, 1, 1)).build();
    const auto c = select(ConflictType::Temporal, a, b);
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(core::kind_of(c->strategy), StrategyKind::LexSpecialis);
    const auto out = apply(c->strategy, ConflictType::Temporal, a, b);
    EXPECT_EQ(out.status, ApplyStatus::Applied);
    EXPECT_EQ(out.rationale.winner, "B");

    // A later but broader rule cannot displace the narrower one.
    const auto broad = base("C").obligation("report annually").effective(day(2024, 1, 1)).build();
    const auto narrow = base("D").obligation("report quarterly").qualifiers({"large"}).build();
    const auto d = select(ConflictType::Temporal, broad, narrow);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(core::kind_of(d->strategy), StrategyKind::LexSpecialis);
    EXPECT_EQ(apply(d->strategy, ConflictType::Temporal, broad, narrow).rationale.winner, "D");
}

TEST_F(StrategyTest, TemporalPosteriorNeedsEqualAuthority) {
    const auto c = select(ConflictType::Temporal, base("A").obligation("x").authority(2).build(),
                          base("B").obligation("y").effective(day(2023, 1, 1)).build());
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(core::kind_of(c->strategy), StrategyKind::LexSuperior);
}

TEST_F(StrategyTest, JurisdictionalWithoutAnyBranchFallsBackToPosterior) {
    const auto c = select(ConflictType::Jurisdictional, base("A").build(),
                          base("B").polarity(Polarity::Prohibits).effective(day(2021, 1, 1)).build());
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(core::kind_of(c->strategy), StrategyKind::LexPosterior);

    const auto none = select(ConflictType::Jurisdictional, base("A").build(),
                             base("B").polarity(Polarity::Prohibits).build());
    EXPECT_FALSE(none.has_value());
}

TEST_F(StrategyTest, JurisdictionalArbitrationAcrossRanks) {
    const auto a = ProvisionBuilder("A").jurisdiction({"DE", "EU"}).topics({"breach"}).effective(day(2020, 1, 1)).build();
    const auto b = ProvisionBuilder("B").jurisdiction({"DE"}).topics({"breach"}).effective(day(2020, 1, 1))
                       .qualifiers({"x"}).polarity(Polarity::Prohibits).build();
    // B is narrower (subset of jurisdictions and superset of qualifiers), so
    // Lex Specialis wins before arbitration.
    EXPECT_EQ(core::kind_of(select(ConflictType::Jurisdictional, a, b)->strategy), StrategyKind::LexSpecialis);

    const auto c = ProvisionBuilder("C").jurisdiction({"DE", "FR"}).topics({"breach"}).effective(day(2020, 1, 1))
                       .polarity(Polarity::Prohibits).build();
    const auto arb = select(ConflictType::Jurisdictional, a, c);
    ASSERT_TRUE(arb.has_value());
    EXPECT_EQ(core::kind_of(arb->strategy), StrategyKind::JurisdictionalArbitration);
}

TEST_F(StrategyTest, DelegationRuleWinsFirst) {
    cfg_.delegation_rules = {{"breach", "EU", "eu-dpb"}};
    const auto c = select(ConflictType::Hierarchical, base("A").authority(3).build(), base("B").build());
    ASSERT_TRUE(c.has_value());
    ASSERT_EQ(core::kind_of(c->strategy), StrategyKind::Delegation);
    EXPECT_EQ(std::get<core::Delegation>(c->strategy).delegate, "eu-dpb");
    EXPECT_DOUBLE_EQ(c->raw_confidence, core::confidence::kDelegation);
}

TEST_F(StrategyTest, BlendWithoutHistoryKeepsRaw) {
    const auto b = core::blend_confidence(0.9, core::StrategyPrior{}, cfg_);
    EXPECT_DOUBLE_EQ(b.combined, 0.9);
    EXPECT_DOUBLE_EQ(b.weight, 0.0);
}

TEST_F(StrategyTest, BlendPullsTowardPrior) {
    const auto b = core::blend_confidence(0.9, core::StrategyPrior{0.5, 5}, cfg_);
    EXPECT_DOUBLE_EQ(b.weight, 0.5);
    EXPECT_NEAR(b.combined, (0.9 + 0.25) / 1.5, 1e-12);
    EXPECT_EQ(b.samples, 5u);
}

} // namespace
