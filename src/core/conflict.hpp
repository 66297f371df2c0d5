#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/provision.hpp"

namespace core {

using ConflictId = std::uint64_t;

enum class ConflictType : std::uint8_t {
    Temporal = 0,
    Jurisdictional = 1,
    Hierarchical = 2,
    Semantic = 3
};

inline constexpr std::size_t kConflictTypeCount = 4;

enum class ConflictStatus : std::uint8_t {
    Detected = 0,
    StrategySelected = 1,
    Applied = 2,
    Resolved = 3,
    Escalated = 4,
    Failed = 5
};

// Unordered provision pair, normalized so that a < b.
struct PairKey {
    ProvisionId a{};
    ProvisionId b{};

    static PairKey make(const ProvisionId& x, const ProvisionId& y) {
        return x < y ? PairKey{x, y} : PairKey{y, x};
    }

    bool operator==(const PairKey&) const = default;
    auto operator<=>(const PairKey&) const = default;
};

struct ConflictEvidence {
    std::optional<DayWindow> overlap{};
    std::optional<double> similarity{};
    std::optional<double> similarity_confidence{};
    std::vector<std::string> jurisdiction_intersection{};
    std::int32_t authority_gap{0}; // authority(a) - authority(b), pair order

    bool operator==(const ConflictEvidence&) const = default;
};

struct Conflict {
    ConflictId id{0};
    PairKey pair{};
    ConflictType type{ConflictType::Temporal};
    double severity{0.0};
    ConflictEvidence evidence{};
    ConflictStatus status{ConflictStatus::Detected};
    Timestamp detected_at{0};
    Timestamp last_updated_at{0};

    std::string framework_a{};
    std::string framework_b{};
    std::vector<std::string> jurisdictions{}; // union over both provisions
    std::vector<std::string> topics{};        // shared topics
    std::uint64_t version{0};                 // bumped on every write
    std::uint64_t input_fingerprint{0};
    ConflictId supersedes{0};                 // earlier instance of the same pair and type, 0 if none
};

// Detector output before it is reconciled with the store.
struct ConflictCandidate {
    PairKey pair{};
    ConflictType type{ConflictType::Temporal};
    double severity{0.0};
    ConflictEvidence evidence{};
    std::string framework_a{};
    std::string framework_b{};
    std::vector<std::string> jurisdictions{};
    std::vector<std::string> topics{};
    std::uint64_t input_fingerprint{0};
};

[[nodiscard]] constexpr const char* to_string(ConflictType t) noexcept {
    switch (t) {
    case ConflictType::Temporal: return "Temporal";
    case ConflictType::Jurisdictional: return "Jurisdictional";
    case ConflictType::Hierarchical: return "Hierarchical";
    case ConflictType::Semantic: return "Semantic";
    }
    return "Unknown";
}

[[nodiscard]] constexpr const char* to_string(ConflictStatus s) noexcept {
    switch (s) {
    case ConflictStatus::Detected: return "Detected";
    case ConflictStatus::StrategySelected: return "StrategySelected";
    case ConflictStatus::Applied: return "Applied";
    case ConflictStatus::Resolved: return "Resolved";
    case ConflictStatus::Escalated: return "Escalated";
    case ConflictStatus::Failed: return "Failed";
    }
    return "Unknown";
}

} // namespace core
