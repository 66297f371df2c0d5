#pragma once

#include <cstdint>

#include "core/escalation.hpp"
#include "core/resolution.hpp"

namespace core {

enum class EscalationEventKind : std::uint8_t {
    Opened = 0,
    Advanced = 1,
    Acknowledged = 2,
    InReview = 3,
    Closed = 4,
    Raised = 5 // open case lifted to a higher level on re-escalation
};

[[nodiscard]] constexpr const char* to_string(EscalationEventKind k) noexcept {
    switch (k) {
    case EscalationEventKind::Opened: return "Opened";
    case EscalationEventKind::Advanced: return "Advanced";
    case EscalationEventKind::Acknowledged: return "Acknowledged";
    case EscalationEventKind::InReview: return "InReview";
    case EscalationEventKind::Closed: return "Closed";
    case EscalationEventKind::Raised: return "Raised";
    }
    return "Unknown";
}

// Observer for durable side effects (journal). Called after the state change
// is committed; implementations must not block.
class EngineEvents {
public:
    virtual ~EngineEvents() = default;
    virtual void on_resolution(const ResolutionRecord& record) = 0;
    virtual void on_revert(const ResolutionRecord& record) = 0;
    virtual void on_escalation(const EscalationCase& escalation_case, EscalationEventKind kind) = 0;
};

} // namespace core
