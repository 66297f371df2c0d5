#pragma once

#include <optional>
#include <string>

#include "core/resolution_analytics.hpp"
#include "core/strategy.hpp"

namespace core {

// Raw confidences per decision branch.
namespace confidence {
inline constexpr double kLexSuperiorGap1 = 0.92;
inline constexpr double kLexSuperiorWide = 0.95; // authority gap >= 2
inline constexpr double kLexPosterior = 0.85;
inline constexpr double kLexSpecialis = 0.80;
inline constexpr double kHarmonization = 0.75;
inline constexpr double kContextMatch = 0.75;
inline constexpr double kDelegation = 0.70;
inline constexpr double kTemporalResolution = 0.88;
inline constexpr double kArbitration = 0.70;
} // namespace confidence

struct StrategyCandidate {
    Strategy strategy{};
    double raw_confidence{0.0};
};

// Decision tree keyed by conflict type, then by provision metadata. nullopt
// means no branch applies (StrategyInapplicable).
std::optional<StrategyCandidate> select_strategy(const StrategyInputs& in);

// Configured delegate for the conflict's topic and jurisdiction, if any.
std::optional<std::string> delegation_target(const Conflict& c, const EngineConfig& cfg);

struct BlendedConfidence {
    double combined{0.0};
    double prior{0.5};
    std::uint64_t samples{0};
    double weight{0.0};
};

// combined = (raw + w * prior) / (1 + w), w = history_weight * n / (n + pseudo_count).
// With no history w is 0 and the raw confidence stands.
BlendedConfidence blend_confidence(double raw, const StrategyPrior& prior, const EngineConfig& cfg) noexcept;

} // namespace core
