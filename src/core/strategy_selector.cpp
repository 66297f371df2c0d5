#include "core/strategy_selector.hpp"

#include <algorithm>
#include <cstdlib>

namespace core {
namespace {

std::optional<StrategyCandidate> lex_superior(const StrategyInputs& in) {
    const std::int32_t gap = in.a.authority_level - in.b.authority_level;
    if (gap == 0) {
        return std::nullopt;
    }
    const double raw = std::abs(gap) >= 2 ? confidence::kLexSuperiorWide : confidence::kLexSuperiorGap1;
    return StrategyCandidate{LexSuperior{gap}, raw};
}

std::optional<StrategyCandidate> temporal_resolution(const StrategyInputs& in) {
    if (!windows_disjoint(in.a, in.b)) {
        return std::nullopt;
    }
    return StrategyCandidate{TemporalResolution{}, confidence::kTemporalResolution};
}

std::optional<StrategyCandidate> lex_specialis(const StrategyInputs& in) {
    if (!is_narrower_scope(in.a, in.b) && !is_narrower_scope(in.b, in.a)) {
        return std::nullopt;
    }
    return StrategyCandidate{LexSpecialis{}, confidence::kLexSpecialis};
}

std::optional<StrategyCandidate> contextualization(const StrategyInputs& in) {
    if (in.a.context_flags.empty() && in.b.context_flags.empty()) {
        return std::nullopt;
    }
    return StrategyCandidate{Contextualization{in.ctx.declared_context}, confidence::kContextMatch};
}

std::optional<StrategyCandidate> arbitration(const StrategyInputs& in) {
    const auto ra = precedence_rank(in.a, in.cfg);
    const auto rb = precedence_rank(in.b, in.cfg);
    if (!ra || !rb || *ra == *rb) {
        return std::nullopt;
    }
    return StrategyCandidate{JurisdictionalArbitration{*ra, *rb}, confidence::kArbitration};
}

// Later enactment only settles a pair issued at the same level for the same scope.
std::optional<StrategyCandidate> lex_posterior(const StrategyInputs& in) {
    if (in.a.authority_level != in.b.authority_level || !same_scope(in.a, in.b)) {
        return std::nullopt;
    }
    if (!in.a.effective_date || !in.b.effective_date || *in.a.effective_date == *in.b.effective_date) {
        return std::nullopt;
    }
    return StrategyCandidate{LexPosterior{}, confidence::kLexPosterior};
}

std::optional<StrategyCandidate> harmonization(const StrategyInputs& in) {
    if (!in.a.quantity || !in.b.quantity || in.a.polarity == Polarity::Prohibits ||
        in.b.polarity == Polarity::Prohibits || in.a.polarity != in.b.polarity || in.a.obligation != in.b.obligation) {
        return std::nullopt;
    }
    const Quantity& qa = *in.a.quantity;
    const Quantity& qb = *in.b.quantity;
    if (qa.unit != qb.unit || qa.bound != qb.bound || qa.value == qb.value) {
        return std::nullopt;
    }
    return StrategyCandidate{Harmonization{in.cfg.harmonization_policy}, confidence::kHarmonization};
}

template <typename... Branches>
std::optional<StrategyCandidate> first_of(const StrategyInputs& in, Branches... branches) {
    std::optional<StrategyCandidate> out;
    ((out = out ? out : branches(in)), ...);
    return out;
}

std::optional<StrategyCandidate> select_temporal(const StrategyInputs& in) {
    if (auto c = lex_superior(in)) return c;
    if (auto c = harmonization(in)) return c;
    if (auto c = lex_posterior(in)) return c;
    // Differing scopes or equal enactment dates fall through to scope, then context, then precedence.
    return first_of(in, lex_specialis, contextualization, arbitration);
}

std::optional<StrategyCandidate> select_jurisdictional(const StrategyInputs& in) {
    return first_of(in, temporal_resolution, lex_specialis, contextualization, arbitration, lex_posterior);
}

std::optional<StrategyCandidate> select_hierarchical(const StrategyInputs& in) {
    if (auto c = temporal_resolution(in)) return c;
    return lex_superior(in);
}

std::optional<StrategyCandidate> select_semantic(const StrategyInputs& in) {
    return first_of(in, temporal_resolution, lex_superior, lex_specialis, contextualization, arbitration,
                    lex_posterior);
}

} // namespace

std::optional<std::string> delegation_target(const Conflict& c, const EngineConfig& cfg) {
    const auto& tags = c.evidence.jurisdiction_intersection.empty() ? c.jurisdictions
                                                                    : c.evidence.jurisdiction_intersection;
    for (const auto& rule : cfg.delegation_rules) {
        const bool topic = std::binary_search(c.topics.begin(), c.topics.end(), rule.topic);
        const bool juris = std::binary_search(tags.begin(), tags.end(), rule.jurisdiction);
        if (topic && juris) {
            return rule.delegate;
        }
    }
    return std::nullopt;
}

std::optional<StrategyCandidate> select_strategy(const StrategyInputs& in) {
    if (auto delegate = delegation_target(in.conflict, in.cfg)) {
        return StrategyCandidate{Delegation{*delegate}, confidence::kDelegation};
    }
    switch (in.conflict.type) {
    case ConflictType::Temporal: return select_temporal(in);
    case ConflictType::Jurisdictional: return select_jurisdictional(in);
    case ConflictType::Hierarchical: return select_hierarchical(in);
    case ConflictType::Semantic: return select_semantic(in);
    }
    return std::nullopt;
}

BlendedConfidence blend_confidence(double raw, const StrategyPrior& prior, const EngineConfig& cfg) noexcept {
    BlendedConfidence out{};
    out.prior = prior.rate;
    out.samples = prior.samples;
    const double n = static_cast<double>(prior.samples);
    out.weight = n > 0.0 ? cfg.history_weight * n / (n + cfg.history_pseudo_count) : 0.0;
    out.combined = std::clamp((raw + out.weight * prior.rate) / (1.0 + out.weight), 0.0, 1.0);
    return out;
}

} // namespace core
