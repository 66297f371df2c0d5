#pragma once

#include <cstdint>

#include "core/escalation.hpp"
#include "util/wheel_timer.hpp"

namespace core {

// SLA deadline helpers built on generation-based lazy cancellation:
// - each case carries timer_generation
// - scheduling stores (case id, generation) in the wheel
// - cancelling bumps the generation; the stale wheel entry is skipped on expiry

inline void schedule_sla_deadline(util::WheelTimer& wheel, EscalationCase& c, Timestamp deadline_ns) {
    ++c.timer_generation;
    c.sla_deadline = deadline_ns;
    wheel.schedule(c.id, c.timer_generation, deadline_ns);
}

inline void cancel_sla_deadline(EscalationCase& c) noexcept {
    ++c.timer_generation;
    c.sla_deadline = 0;
}

[[nodiscard]] inline bool is_timer_valid(const EscalationCase& c, std::uint32_t scheduled_generation) noexcept {
    return c.status == EscalationStatus::Open && c.timer_generation == scheduled_generation;
}

} // namespace core
