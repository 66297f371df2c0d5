#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/conflict_store.hpp"
#include "core/escalation_manager.hpp"
#include "core/resolution.hpp"

namespace core {

// Half-open [from, to) over nanosecond timestamps; unset ends are unbounded.
struct TimeRange {
    std::optional<Timestamp> from{};
    std::optional<Timestamp> to{};

    bool contains(Timestamp t) const noexcept {
        return (!from || t >= *from) && (!to || t < *to);
    }
};

struct ConflictQuery {
    std::vector<ConflictStatus> statuses{}; // empty matches any
    std::optional<ConflictType> type{};
    std::optional<double> min_severity{};
    std::optional<double> max_severity{};
    std::optional<std::string> jurisdiction{};
    std::optional<std::string> framework{};
    TimeRange detected{};
};

struct RecordQuery {
    std::optional<ConflictId> conflict_id{};
    std::optional<ResolutionOutcome> outcome{};
    std::optional<StrategyKind> strategy{};
    std::optional<std::string> jurisdiction{}; // via the owning conflict
    std::optional<std::string> framework{};
    TimeRange applied{};
};

struct CaseQuery {
    std::vector<EscalationStatus> statuses{};
    std::optional<std::uint32_t> min_level{};
    std::optional<ConflictId> conflict_id{};
    std::optional<double> min_severity{};
    std::optional<std::string> jurisdiction{}; // via the owning conflict
    std::optional<std::string> framework{};
    TimeRange opened{};
};

bool matches(const ConflictQuery& q, const Conflict& c);

// Read-only view over conflicts, resolution records and escalation cases.
class QueryService {
public:
    QueryService(const ConflictStore& store, const ResolutionLedger& ledger, const EscalationManager& escalation)
        : store_(store), ledger_(ledger), escalation_(escalation) {}

    std::optional<Conflict> conflict(ConflictId id) const { return store_.get(id); }
    std::vector<Conflict> conflicts(const ConflictQuery& q) const;

    std::vector<ResolutionRecord> records(const RecordQuery& q) const;
    std::optional<ResolutionRecord> effective_record(ConflictId id) const { return ledger_.effective_for(id); }

    std::vector<EscalationCase> cases(const CaseQuery& q) const;

private:
    bool conflict_scope_matches(ConflictId id, const std::optional<std::string>& jurisdiction,
                                const std::optional<std::string>& framework) const;

    const ConflictStore& store_;
    const ResolutionLedger& ledger_;
    const EscalationManager& escalation_;
};

} // namespace core
