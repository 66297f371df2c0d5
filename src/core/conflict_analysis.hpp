#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/conflict.hpp"

namespace core {

enum class ResolutionComplexity : std::uint8_t {
    Simple = 0,
    Moderate = 1,
    Complex = 2,
    RequiresIntervention = 3
};

[[nodiscard]] constexpr const char* to_string(ResolutionComplexity c) noexcept {
    switch (c) {
    case ResolutionComplexity::Simple: return "Simple";
    case ResolutionComplexity::Moderate: return "Moderate";
    case ResolutionComplexity::Complex: return "Complex";
    case ResolutionComplexity::RequiresIntervention: return "RequiresIntervention";
    }
    return "Unknown";
}

struct ConflictAnalysis {
    ConflictId conflict{0};
    ResolutionComplexity complexity{ResolutionComplexity::Simple};
    const char* impact{"low"}; // critical, high, medium or low by severity
    std::vector<std::string> recommendations{};
};

// Reviewer-facing triage of a stored conflict. Severity bands and the number
// of jurisdictions involved set the complexity; a conflict the engine already
// escalated or failed always needs intervention.
ResolutionComplexity classify_complexity(const Conflict& c) noexcept;

const char* impact_label(double severity) noexcept;

ConflictAnalysis analyze_conflict(const Conflict& c);

} // namespace core
