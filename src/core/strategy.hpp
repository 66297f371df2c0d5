#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "core/conflict.hpp"
#include "core/engine_config.hpp"
#include "core/provision.hpp"

namespace core {

enum class StrategyKind : std::uint8_t {
    LexSuperior = 0,
    LexPosterior = 1,
    LexSpecialis = 2,
    Harmonization = 3,
    Contextualization = 4,
    Delegation = 5,
    TemporalResolution = 6,
    JurisdictionalArbitration = 7
};

inline constexpr std::size_t kStrategyKindCount = 8;

// Strategy variants. The variant index equals StrategyKind.
struct LexSuperior {
    std::int32_t authority_gap{0};
    bool operator==(const LexSuperior&) const = default;
};
struct LexPosterior {
    bool operator==(const LexPosterior&) const = default;
};
struct LexSpecialis {
    bool operator==(const LexSpecialis&) const = default;
};
struct Harmonization {
    HarmonizationPolicy policy{HarmonizationPolicy::MostRestrictive};
    bool operator==(const Harmonization&) const = default;
};
struct Contextualization {
    std::vector<std::string> declared_context{};
    bool operator==(const Contextualization&) const = default;
};
struct Delegation {
    std::string delegate{};
    bool operator==(const Delegation&) const = default;
};
struct TemporalResolution {
    bool operator==(const TemporalResolution&) const = default;
};
struct JurisdictionalArbitration {
    std::int32_t rank_a{0};
    std::int32_t rank_b{0};
    bool operator==(const JurisdictionalArbitration&) const = default;
};

using Strategy = std::variant<LexSuperior, LexPosterior, LexSpecialis, Harmonization, Contextualization, Delegation,
                              TemporalResolution, JurisdictionalArbitration>;

static_assert(std::variant_size_v<Strategy> == kStrategyKindCount, "one alternative per StrategyKind");

[[nodiscard]] inline StrategyKind kind_of(const Strategy& s) noexcept {
    return static_cast<StrategyKind>(s.index());
}

[[nodiscard]] constexpr const char* to_string(StrategyKind k) noexcept {
    switch (k) {
    case StrategyKind::LexSuperior: return "LexSuperior";
    case StrategyKind::LexPosterior: return "LexPosterior";
    case StrategyKind::LexSpecialis: return "LexSpecialis";
    case StrategyKind::Harmonization: return "Harmonization";
    case StrategyKind::Contextualization: return "Contextualization";
    case StrategyKind::Delegation: return "Delegation";
    case StrategyKind::TemporalResolution: return "TemporalResolution";
    case StrategyKind::JurisdictionalArbitration: return "JurisdictionalArbitration";
    }
    return "Unknown";
}

enum class ReasonCode : std::uint8_t {
    HigherAuthority = 0,
    LaterEnactment = 1,
    NarrowerScope = 2,
    MostRestrictive = 3,
    LeastRestrictive = 4,
    ContextMatch = 5,
    Delegated = 6,
    SequentialWindows = 7,
    PrecedenceTable = 8,
    AmbiguousContext = 9,
    PolicyReview = 10,
    NotApplicable = 11
};

inline constexpr std::size_t kReasonCodeCount = 12;

[[nodiscard]] constexpr const char* to_string(ReasonCode r) noexcept {
    switch (r) {
    case ReasonCode::HigherAuthority: return "HigherAuthority";
    case ReasonCode::LaterEnactment: return "LaterEnactment";
    case ReasonCode::NarrowerScope: return "NarrowerScope";
    case ReasonCode::MostRestrictive: return "MostRestrictive";
    case ReasonCode::LeastRestrictive: return "LeastRestrictive";
    case ReasonCode::ContextMatch: return "ContextMatch";
    case ReasonCode::Delegated: return "Delegated";
    case ReasonCode::SequentialWindows: return "SequentialWindows";
    case ReasonCode::PrecedenceTable: return "PrecedenceTable";
    case ReasonCode::AmbiguousContext: return "AmbiguousContext";
    case ReasonCode::PolicyReview: return "PolicyReview";
    case ReasonCode::NotApplicable: return "NotApplicable";
    }
    return "Unknown";
}

// One step of a TemporalResolution schedule: which provision governs a window.
struct ScheduleEntry {
    std::optional<DayWindow> window{};
    ProvisionId provision{};

    bool operator==(const ScheduleEntry&) const = default;
};

// Structured rationale attached to every resolution record.
struct Rationale {
    ReasonCode reason{ReasonCode::NotApplicable};
    std::optional<ProvisionId> winner{};
    std::optional<ProvisionId> loser{};     // for Lex Specialis: governs outside the winner's subset
    std::optional<Quantity> harmonized{};   // combined requirement
    std::vector<ScheduleEntry> schedule{};
    std::string delegate{};
    double raw_confidence{0.0};
    double prior{0.5};
    std::uint64_t prior_samples{0};
    std::uint32_t evidence_count{0};

    bool operator==(const Rationale&) const = default;
};

// Situational input for a resolution pass.
struct ResolutionContext {
    std::vector<std::string> declared_context{}; // sorted flags the caller operates under
};

struct StrategyInputs {
    const Conflict& conflict;
    const NormativeProvision& a; // pair.a
    const NormativeProvision& b; // pair.b
    const EngineConfig& cfg;
    const ResolutionContext& ctx;
};

enum class ApplyStatus : std::uint8_t {
    Applied = 0,
    Failed = 1,   // strategy could not produce a defensible result
    Declined = 2  // configured policy routes the conflict to review
};

struct StrategyOutcome {
    ApplyStatus status{ApplyStatus::Failed};
    Rationale rationale{};
};

// Exhaustive dispatch over the strategy variant.
StrategyOutcome apply_strategy(const Strategy& strategy, const StrategyInputs& in);

// Rank of a provision in the precedence table: highest rank among its
// jurisdiction tags that appear in the table.
std::optional<std::int32_t> precedence_rank(const NormativeProvision& p, const EngineConfig& cfg);

} // namespace core
