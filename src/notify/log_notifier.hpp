#pragma once

#include <string>

#include "core/notifier.hpp"
#include "util/async_log.hpp"

namespace notify {

// Writes each notice to the engine log. Used when no transport is configured.
class LogNotifier final : public core::Notifier {
public:
    bool notify(const std::string& stakeholder_ref, const core::EscalationCase& c) override {
        LOG_WARM_FMT(util::LogLevel::Info, "NOTIFY", "stakeholder=%s case=%llu conflict=%llu level=%u status=%s reason=%s",
                     stakeholder_ref.c_str(), static_cast<unsigned long long>(c.id),
                     static_cast<unsigned long long>(c.conflict_id), c.level, core::to_string(c.status),
                     core::to_string(c.reason));
        return true;
    }
};

} // namespace notify
