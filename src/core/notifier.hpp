#pragma once

#include <string>

#include "core/escalation.hpp"

namespace core {

// Delivery collaborator for escalation notices. Returns false when delivery
// failed and may be retried. Must never be on the path of a case transition.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual bool notify(const std::string& stakeholder_ref, const EscalationCase& escalation_case) = 0;
};

} // namespace core
