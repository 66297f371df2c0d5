#include "core/strategy.hpp"

#include <algorithm>

namespace core {
namespace {

std::uint32_t evidence_count(const ConflictEvidence& ev) noexcept {
    std::uint32_t n = 0;
    if (ev.overlap) ++n;
    if (ev.similarity) ++n;
    if (!ev.jurisdiction_intersection.empty()) ++n;
    if (ev.authority_gap != 0) ++n;
    return n;
}

StrategyOutcome applied(ReasonCode reason, const NormativeProvision* winner, const NormativeProvision* loser) {
    StrategyOutcome out{};
    out.status = ApplyStatus::Applied;
    out.rationale.reason = reason;
    if (winner) out.rationale.winner = winner->id;
    if (loser) out.rationale.loser = loser->id;
    return out;
}

StrategyOutcome failed(ReasonCode reason) {
    StrategyOutcome out{};
    out.status = ApplyStatus::Failed;
    out.rationale.reason = reason;
    return out;
}

// One operator() per alternative; a missing overload fails to compile.
struct ApplyVisitor {
    const StrategyInputs& in;

    StrategyOutcome operator()(const LexSuperior&) const {
        if (in.a.authority_level == in.b.authority_level) {
            return failed(ReasonCode::NotApplicable);
        }
        const bool a_wins = in.a.authority_level > in.b.authority_level;
        return applied(ReasonCode::HigherAuthority, a_wins ? &in.a : &in.b, a_wins ? &in.b : &in.a);
    }

    StrategyOutcome operator()(const LexPosterior&) const {
        if (!same_scope(in.a, in.b) || !in.a.effective_date || !in.b.effective_date ||
            *in.a.effective_date == *in.b.effective_date) {
            return failed(ReasonCode::NotApplicable);
        }
        const bool a_wins = *in.a.effective_date > *in.b.effective_date;
        return applied(ReasonCode::LaterEnactment, a_wins ? &in.a : &in.b, a_wins ? &in.b : &in.a);
    }

    StrategyOutcome operator()(const LexSpecialis&) const {
        if (is_narrower_scope(in.a, in.b)) {
            return applied(ReasonCode::NarrowerScope, &in.a, &in.b);
        }
        if (is_narrower_scope(in.b, in.a)) {
            return applied(ReasonCode::NarrowerScope, &in.b, &in.a);
        }
        return failed(ReasonCode::NotApplicable);
    }

    StrategyOutcome operator()(const Harmonization& h) const {
        if (!in.a.quantity || !in.b.quantity) {
            return failed(ReasonCode::NotApplicable);
        }
        const Quantity& qa = *in.a.quantity;
        const Quantity& qb = *in.b.quantity;
        if (qa.unit != qb.unit || qa.bound != qb.bound || qa.value == qb.value) {
            return failed(ReasonCode::NotApplicable);
        }
        if (h.policy == HarmonizationPolicy::Escalate) {
            StrategyOutcome out{};
            out.status = ApplyStatus::Declined;
            out.rationale.reason = ReasonCode::PolicyReview;
            return out;
        }
        // A ceiling is tighter when lower, a floor when higher.
        const bool a_tighter = qa.bound == QuantityBound::AtMost ? qa.value < qb.value : qa.value > qb.value;
        const bool a_wins = h.policy == HarmonizationPolicy::MostRestrictive ? a_tighter : !a_tighter;
        const ReasonCode reason = h.policy == HarmonizationPolicy::MostRestrictive ? ReasonCode::MostRestrictive
                                                                                  : ReasonCode::LeastRestrictive;
        StrategyOutcome out = applied(reason, a_wins ? &in.a : &in.b, a_wins ? &in.b : &in.a);
        out.rationale.harmonized = a_wins ? qa : qb;
        return out;
    }

    // Without a declared context neither provision can be chosen.
    StrategyOutcome operator()(const Contextualization& c) const {
        if (in.a.context_flags.empty() && in.b.context_flags.empty()) {
            return failed(ReasonCode::NotApplicable);
        }
        const bool a_match = sorted_intersects(in.a.context_flags, c.declared_context);
        const bool b_match = sorted_intersects(in.b.context_flags, c.declared_context);
        if (a_match == b_match) {
            return failed(ReasonCode::AmbiguousContext);
        }
        return applied(ReasonCode::ContextMatch, a_match ? &in.a : &in.b, a_match ? &in.b : &in.a);
    }

    StrategyOutcome operator()(const Delegation& d) const {
        if (d.delegate.empty()) {
            return failed(ReasonCode::NotApplicable);
        }
        StrategyOutcome out = applied(ReasonCode::Delegated, nullptr, nullptr);
        out.rationale.delegate = d.delegate;
        return out;
    }

    StrategyOutcome operator()(const TemporalResolution&) const {
        const auto wa = validity_window(in.a);
        const auto wb = validity_window(in.b);
        if (!wa || !wb || !windows_disjoint(in.a, in.b)) {
            return failed(ReasonCode::NotApplicable);
        }
        StrategyOutcome out = applied(ReasonCode::SequentialWindows, nullptr, nullptr);
        const bool a_first = wa->start < wb->start;
        out.rationale.schedule.push_back(ScheduleEntry{a_first ? wa : wb, a_first ? in.a.id : in.b.id});
        out.rationale.schedule.push_back(ScheduleEntry{a_first ? wb : wa, a_first ? in.b.id : in.a.id});
        return out;
    }

    StrategyOutcome operator()(const JurisdictionalArbitration& j) const {
        if (j.rank_a == j.rank_b) {
            return failed(ReasonCode::NotApplicable);
        }
        const bool a_wins = j.rank_a > j.rank_b;
        return applied(ReasonCode::PrecedenceTable, a_wins ? &in.a : &in.b, a_wins ? &in.b : &in.a);
    }
};

} // namespace

StrategyOutcome apply_strategy(const Strategy& strategy, const StrategyInputs& in) {
    StrategyOutcome out = std::visit(ApplyVisitor{in}, strategy);
    out.rationale.evidence_count = evidence_count(in.conflict.evidence);
    return out;
}

std::optional<std::int32_t> precedence_rank(const NormativeProvision& p, const EngineConfig& cfg) {
    std::optional<std::int32_t> best;
    for (const auto& entry : cfg.precedence) {
        if (std::binary_search(p.jurisdiction.begin(), p.jurisdiction.end(), entry.jurisdiction)) {
            if (!best || entry.rank > *best) {
                best = entry.rank;
            }
        }
    }
    return best;
}

} // namespace core
