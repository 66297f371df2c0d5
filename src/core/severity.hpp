#pragma once

#include <algorithm>
#include <cstdint>
#include <cstdlib>

#include "core/engine_config.hpp"
#include "core/provision.hpp"

namespace core {

struct SeverityTerms {
    double authority{0.0};
    double reach{0.0};
    double urgency{0.0};
};

// Each term lies in [0,1]. Urgency is 0 when either effective date is unknown;
// otherwise the conflict starts to bite on the later of the two dates.
inline SeverityTerms severity_terms(const NormativeProvision& a, const NormativeProvision& b, util::CivilDay today,
                                    const EngineConfig& cfg) noexcept {
    SeverityTerms t{};
    const double gap = std::abs(static_cast<double>(a.authority_level) - static_cast<double>(b.authority_level));
    t.authority = std::min(1.0, gap / cfg.authority_gap_scale);

    auto reach_of = [&](std::uint64_t count) {
        const double c = static_cast<double>(count);
        return c / (c + cfg.reach_half_saturation);
    };
    t.reach = std::max(reach_of(a.entity_count), reach_of(b.entity_count));

    if (a.effective_date && b.effective_date) {
        const util::CivilDay bites_on = std::max(*a.effective_date, *b.effective_date);
        if (bites_on <= today) {
            t.urgency = 1.0;
        } else {
            const double days_until = static_cast<double>(bites_on - today);
            t.urgency = 1.0 / (1.0 + days_until / cfg.urgency_horizon_days);
        }
    }
    return t;
}

// Normalized weighted sum. validate_engine_config guarantees a positive weight
// total.
inline double combine_severity(const SeverityTerms& t, const SeverityWeights& w) noexcept {
    const double total = w.authority + w.reach + w.urgency;
    if (total <= 0.0) {
        return 0.0;
    }
    const double s = (w.authority * t.authority + w.reach * t.reach + w.urgency * t.urgency) / total;
    return std::clamp(s, 0.0, 1.0);
}

inline double compute_severity(const NormativeProvision& a, const NormativeProvision& b, util::CivilDay today,
                               const EngineConfig& cfg) noexcept {
    return combine_severity(severity_terms(a, b, today, cfg), cfg.severity_weights);
}

} // namespace core
