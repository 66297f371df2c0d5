#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <set>

#include "core/conflict_store.hpp"
#include "core/engine_config.hpp"
#include "core/engine_events.hpp"
#include "core/escalation_manager.hpp"
#include "core/provision_index.hpp"
#include "core/resolution.hpp"
#include "core/resolution_analytics.hpp"
#include "core/strategy.hpp"
#include "util/clock.hpp"

namespace core {

enum class ResolveStatus : std::uint8_t {
    Resolved = 0,
    Escalated = 1,
    AlreadyHandled = 2, // another resolver settled it, or it is not in Detected
    Contended = 3,      // lease not obtained within the retry bound
    NotFound = 4
};

[[nodiscard]] constexpr const char* to_string(ResolveStatus s) noexcept {
    switch (s) {
    case ResolveStatus::Resolved: return "Resolved";
    case ResolveStatus::Escalated: return "Escalated";
    case ResolveStatus::AlreadyHandled: return "AlreadyHandled";
    case ResolveStatus::Contended: return "Contended";
    case ResolveStatus::NotFound: return "NotFound";
    }
    return "Unknown";
}

struct ResolveReport {
    ResolveStatus status{ResolveStatus::NotFound};
    std::optional<StrategyKind> strategy{};
    double confidence{0.0};
    std::optional<ResolutionRecord> record{};
    std::optional<EscalationCase> escalation{};
};

enum class RevertStatus : std::uint8_t {
    Reverted = 0,
    NotFound = 1,
    NotResolved = 2,
    Superseded = 3, // a newer instance of the conflict is active
    Contended = 4
};

[[nodiscard]] constexpr const char* to_string(RevertStatus s) noexcept {
    switch (s) {
    case RevertStatus::Reverted: return "Reverted";
    case RevertStatus::NotFound: return "NotFound";
    case RevertStatus::NotResolved: return "NotResolved";
    case RevertStatus::Superseded: return "Superseded";
    case RevertStatus::Contended: return "Contended";
    }
    return "Unknown";
}

struct ResolutionCounters {
    std::uint64_t resolved{0};
    std::uint64_t escalated_low_confidence{0};
    std::uint64_t escalated_inapplicable{0};
    std::uint64_t escalated_apply_failed{0};
    std::uint64_t escalated_policy{0};
    std::uint64_t escalated_contention{0};
    std::uint64_t already_handled{0};
    std::uint64_t contended{0};
    std::uint64_t cas_retries{0};
    std::uint64_t reverted{0};
};

// One active resolver per conflict id.
class ResolverLeases {
public:
    bool try_acquire(ConflictId id);
    void release(ConflictId id);
    bool held(ConflictId id) const;

private:
    mutable std::mutex mutex_;
    std::set<ConflictId> held_;
};

// Selects, applies and records a strategy for a Detected conflict, or routes
// it to escalation. Writes go through compare-and-set on the conflict version.
class ResolutionEngine {
public:
    ResolutionEngine(ConflictStore& store, ResolutionLedger& ledger, EscalationManager& escalation,
                     ResolutionAnalytics& analytics, const EngineConfig& cfg, const util::Clock& clock,
                     EngineEvents* events = nullptr);

    ResolutionEngine(const ResolutionEngine&) = delete;
    ResolutionEngine& operator=(const ResolutionEngine&) = delete;

    // snapshot is the analytics view fixed for the current cycle.
    ResolveReport resolve(ConflictId id, const ProvisionIndex& provisions, const ResolutionContext& ctx,
                          const SnapshotPtr& snapshot);

    // Marks the effective record Reverted, feeds a failure to analytics and
    // returns the conflict to Detected.
    RevertStatus revert(ConflictId id, Timestamp now);

    ResolverLeases& leases() noexcept { return leases_; }
    ResolutionCounters counters() const;

private:
    class LeaseGuard;

    std::optional<ResolveReport> attempt(Conflict conflict, const ProvisionIndex& provisions,
                                         const ResolutionContext& ctx, const AnalyticsSnapshot& snapshot);
    StatusWrite transition(Conflict& c, ConflictStatus next, Timestamp now);
    ResolveReport escalate_to_case(Conflict& c, EscalationReason reason, Timestamp now);
    ResolveReport fail_and_escalate(Conflict& c, EscalationReason reason, Timestamp now);
    ResolveReport escalate_contention(ConflictId id, Timestamp now);
    void count_escalation(EscalationReason reason);

    ConflictStore& store_;
    ResolutionLedger& ledger_;
    EscalationManager& escalation_;
    ResolutionAnalytics& analytics_;
    const EngineConfig& cfg_;
    const util::Clock& clock_;
    EngineEvents* events_;
    JurisdictionBuckets buckets_;
    ResolverLeases leases_;

    mutable std::mutex counters_mutex_;
    ResolutionCounters counters_{};
};

} // namespace core
