#include "core/conflict_analysis.hpp"

namespace core {

ResolutionComplexity classify_complexity(const Conflict& c) noexcept {
    if (c.status == ConflictStatus::Escalated || c.status == ConflictStatus::Failed || c.severity > 0.8 ||
        c.jurisdictions.size() > 3) {
        return ResolutionComplexity::RequiresIntervention;
    }
    // Similarity evidence is probabilistic; treat it like a wide conflict.
    if (c.severity > 0.6 || c.jurisdictions.size() > 2 || c.type == ConflictType::Semantic) {
        return ResolutionComplexity::Complex;
    }
    if (c.severity > 0.4 || c.framework_a != c.framework_b) {
        return ResolutionComplexity::Moderate;
    }
    return ResolutionComplexity::Simple;
}

const char* impact_label(double severity) noexcept {
    if (severity > 0.8) return "critical";
    if (severity > 0.6) return "high";
    if (severity > 0.4) return "medium";
    return "low";
}

ConflictAnalysis analyze_conflict(const Conflict& c) {
    ConflictAnalysis out{};
    out.conflict = c.id;
    out.complexity = classify_complexity(c);
    out.impact = impact_label(c.severity);

    auto& rec = out.recommendations;
    if (out.complexity == ResolutionComplexity::RequiresIntervention) {
        rec.emplace_back("immediate review and resolution required");
        rec.emplace_back("consider stakeholder consultation");
    }
    switch (c.type) {
    case ConflictType::Temporal:
        rec.emplace_back("review effective dates and transition periods");
        break;
    case ConflictType::Jurisdictional:
        rec.emplace_back("clarify jurisdictional boundaries");
        rec.emplace_back("establish precedence rules");
        break;
    case ConflictType::Hierarchical:
        rec.emplace_back("confirm the authority level of both provisions");
        break;
    case ConflictType::Semantic:
        rec.emplace_back("confirm the textual overlap with a reviewer");
        break;
    }
    if (c.status == ConflictStatus::Resolved) {
        rec.emplace_back("regular monitoring recommended");
    }
    return out;
}

} // namespace core
