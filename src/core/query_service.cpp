#include "core/query_service.hpp"

#include <algorithm>

namespace core {
namespace {

bool in_scope(const Conflict& c, const std::optional<std::string>& jurisdiction,
              const std::optional<std::string>& framework) {
    if (jurisdiction &&
        !std::binary_search(c.jurisdictions.begin(), c.jurisdictions.end(), *jurisdiction)) {
        return false;
    }
    if (framework && c.framework_a != *framework && c.framework_b != *framework) {
        return false;
    }
    return true;
}

template <typename T>
bool status_matches(const std::vector<T>& wanted, T status) {
    return wanted.empty() || std::find(wanted.begin(), wanted.end(), status) != wanted.end();
}

} // namespace

bool matches(const ConflictQuery& q, const Conflict& c) {
    if (!status_matches(q.statuses, c.status)) {
        return false;
    }
    if (q.type && c.type != *q.type) {
        return false;
    }
    if (q.min_severity && c.severity < *q.min_severity) {
        return false;
    }
    if (q.max_severity && c.severity > *q.max_severity) {
        return false;
    }
    return in_scope(c, q.jurisdiction, q.framework) && q.detected.contains(c.detected_at);
}

std::vector<Conflict> QueryService::conflicts(const ConflictQuery& q) const {
    return store_.list([&q](const Conflict& c) { return matches(q, c); });
}

bool QueryService::conflict_scope_matches(ConflictId id, const std::optional<std::string>& jurisdiction,
                                          const std::optional<std::string>& framework) const {
    if (!jurisdiction && !framework) {
        return true;
    }
    auto c = store_.get(id);
    return c && in_scope(*c, jurisdiction, framework);
}

std::vector<ResolutionRecord> QueryService::records(const RecordQuery& q) const {
    auto out = ledger_.list([&q](const ResolutionRecord& r) {
        if (q.conflict_id && r.conflict_id != *q.conflict_id) {
            return false;
        }
        if (q.outcome && r.outcome != *q.outcome) {
            return false;
        }
        if (q.strategy && kind_of(r.strategy) != *q.strategy) {
            return false;
        }
        return q.applied.contains(r.applied_at);
    });
    std::erase_if(out, [&](const ResolutionRecord& r) {
        return !conflict_scope_matches(r.conflict_id, q.jurisdiction, q.framework);
    });
    return out;
}

std::vector<EscalationCase> QueryService::cases(const CaseQuery& q) const {
    auto out = escalation_.list([&q](const EscalationCase& c) {
        if (!status_matches(q.statuses, c.status)) {
            return false;
        }
        if (q.min_level && c.level < *q.min_level) {
            return false;
        }
        if (q.conflict_id && c.conflict_id != *q.conflict_id) {
            return false;
        }
        if (q.min_severity && c.severity < *q.min_severity) {
            return false;
        }
        return q.opened.contains(c.opened_at);
    });
    std::erase_if(out, [&](const EscalationCase& c) {
        return !conflict_scope_matches(c.conflict_id, q.jurisdiction, q.framework);
    });
    return out;
}

} // namespace core
