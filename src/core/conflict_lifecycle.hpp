#pragma once

#include "core/conflict.hpp"

namespace core {

// Resolved is the only state a conflict instance never leaves on its own;
// revert is the explicit exception.
inline constexpr bool is_active_status(ConflictStatus s) noexcept {
    return s != ConflictStatus::Resolved;
}

// Escalated and Failed wait for human action or changed inputs.
inline constexpr bool is_settled_status(ConflictStatus s) noexcept {
    return s == ConflictStatus::Resolved || s == ConflictStatus::Escalated || s == ConflictStatus::Failed;
}

inline constexpr bool is_valid_transition(ConflictStatus current, ConflictStatus next) noexcept {
    using CS = ConflictStatus;

    switch (current) {
    case CS::Detected:
        return next == CS::StrategySelected || next == CS::Failed;
    case CS::StrategySelected:
        return next == CS::Applied || next == CS::Escalated;
    case CS::Applied:
        return next == CS::Resolved || next == CS::Escalated || next == CS::Failed;
    case CS::Failed:
        // Escalation of a failed attempt, or a manual retry.
        return next == CS::Escalated || next == CS::Detected;
    case CS::Escalated:
        return next == CS::Detected;
    case CS::Resolved:
        return next == CS::Detected; // revert
    }
    return false;
}

inline bool apply_status_transition(ConflictStatus& current, ConflictStatus next) noexcept {
    if (!is_valid_transition(current, next)) {
        return false;
    }
    current = next;
    return true;
}

} // namespace core
