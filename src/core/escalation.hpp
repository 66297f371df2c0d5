#pragma once

#include <cstdint>
#include <string>

#include "core/conflict.hpp"

namespace core {

using CaseId = std::uint64_t;

enum class EscalationStatus : std::uint8_t {
    Open = 0,
    Acknowledged = 1,
    InReview = 2,
    Closed = 3
};

enum class EscalationReason : std::uint8_t {
    LowConfidence = 0,
    StrategyInapplicable = 1,
    ApplyFailed = 2,
    WriteContention = 3,
    PolicyReview = 4
};

enum class ClosureKind : std::uint8_t {
    None = 0,
    Manual = 1,
    AutoResolved = 2
};

struct EscalationCase {
    CaseId id{0};
    ConflictId conflict_id{0};
    std::uint32_t level{1};
    Timestamp opened_at{0};
    Timestamp sla_deadline{0};
    EscalationStatus status{EscalationStatus::Open};
    EscalationReason reason{EscalationReason::LowConfidence};
    ClosureKind closure{ClosureKind::None};
    Timestamp closed_at{0};
    std::uint32_t timer_generation{0};
    double severity{0.0};
};

[[nodiscard]] constexpr const char* to_string(EscalationStatus s) noexcept {
    switch (s) {
    case EscalationStatus::Open: return "Open";
    case EscalationStatus::Acknowledged: return "Acknowledged";
    case EscalationStatus::InReview: return "InReview";
    case EscalationStatus::Closed: return "Closed";
    }
    return "Unknown";
}

[[nodiscard]] constexpr const char* to_string(EscalationReason r) noexcept {
    switch (r) {
    case EscalationReason::LowConfidence: return "LowConfidence";
    case EscalationReason::StrategyInapplicable: return "StrategyInapplicable";
    case EscalationReason::ApplyFailed: return "ApplyFailed";
    case EscalationReason::WriteContention: return "WriteContention";
    case EscalationReason::PolicyReview: return "PolicyReview";
    }
    return "Unknown";
}

[[nodiscard]] constexpr const char* to_string(ClosureKind k) noexcept {
    switch (k) {
    case ClosureKind::None: return "None";
    case ClosureKind::Manual: return "Manual";
    case ClosureKind::AutoResolved: return "AutoResolved";
    }
    return "Unknown";
}

inline constexpr bool is_valid_transition(EscalationStatus current, EscalationStatus next) noexcept {
    using ES = EscalationStatus;
    switch (current) {
    case ES::Open: return next == ES::Acknowledged || next == ES::Closed;
    case ES::Acknowledged: return next == ES::InReview || next == ES::Closed;
    case ES::InReview: return next == ES::Closed;
    case ES::Closed: return false;
    }
    return false;
}

} // namespace core
