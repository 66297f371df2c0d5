#include "core/resolution_engine.hpp"

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>

#include "core/strategy_selector.hpp"
#include "util/async_log.hpp"

namespace core {

bool ResolverLeases::try_acquire(ConflictId id) {
    std::lock_guard lock(mutex_);
    return held_.insert(id).second;
}

void ResolverLeases::release(ConflictId id) {
    std::lock_guard lock(mutex_);
    held_.erase(id);
}

bool ResolverLeases::held(ConflictId id) const {
    std::lock_guard lock(mutex_);
    return held_.count(id) != 0;
}

class ResolutionEngine::LeaseGuard {
public:
    LeaseGuard(ResolverLeases& leases, ConflictId id) noexcept : leases_(leases), id_(id) {}
    ~LeaseGuard() { leases_.release(id_); }

    LeaseGuard(const LeaseGuard&) = delete;
    LeaseGuard& operator=(const LeaseGuard&) = delete;

private:
    ResolverLeases& leases_;
    ConflictId id_;
};

ResolutionEngine::ResolutionEngine(ConflictStore& store, ResolutionLedger& ledger, EscalationManager& escalation,
                                   ResolutionAnalytics& analytics, const EngineConfig& cfg,
                                   const util::Clock& clock, EngineEvents* events)
    : store_(store),
      ledger_(ledger),
      escalation_(escalation),
      analytics_(analytics),
      cfg_(cfg),
      clock_(clock),
      events_(events),
      buckets_(cfg) {}

ResolveReport ResolutionEngine::resolve(ConflictId id, const ProvisionIndex& provisions,
                                        const ResolutionContext& ctx, const SnapshotPtr& snapshot) {
    ResolutionContext sorted_ctx = ctx;
    std::sort(sorted_ctx.declared_context.begin(), sorted_ctx.declared_context.end());
    sorted_ctx.declared_context.erase(
        std::unique(sorted_ctx.declared_context.begin(), sorted_ctx.declared_context.end()),
        sorted_ctx.declared_context.end());

    const AnalyticsSnapshot empty_snapshot{};
    const AnalyticsSnapshot& view = snapshot ? *snapshot : empty_snapshot;

    bool acquired = false;
    for (std::uint32_t attempt = 0; attempt < cfg_.resolver_lease_attempts; ++attempt) {
        if (leases_.try_acquire(id)) {
            acquired = true;
            break;
        }
        auto current = store_.get(id);
        if (!current) {
            return ResolveReport{};
        }
        if (current->status != ConflictStatus::Detected) {
            std::lock_guard lock(counters_mutex_);
            ++counters_.already_handled;
            ResolveReport r{};
            r.status = ResolveStatus::AlreadyHandled;
            return r;
        }
        std::this_thread::sleep_for(std::chrono::nanoseconds(cfg_.resolver_backoff_ns * (attempt + 1)));
    }
    if (!acquired) {
        {
            std::lock_guard lock(counters_mutex_);
            ++counters_.contended;
        }
        LOG_WARM_FMT(util::LogLevel::Warn, "RESOLVE", "lease contended conflict=%llu",
                     static_cast<unsigned long long>(id));
        ResolveReport r{};
        r.status = ResolveStatus::Contended;
        return r;
    }
    LeaseGuard guard(leases_, id);

    for (std::uint32_t round = 0; round < cfg_.cas_attempts; ++round) {
        auto current = store_.get(id);
        if (!current) {
            return ResolveReport{};
        }
        if (current->status != ConflictStatus::Detected) {
            std::lock_guard lock(counters_mutex_);
            ++counters_.already_handled;
            ResolveReport r{};
            r.status = ResolveStatus::AlreadyHandled;
            return r;
        }
        auto report = attempt(std::move(*current), provisions, sorted_ctx, view);
        if (report) {
            return std::move(*report);
        }
        std::lock_guard lock(counters_mutex_);
        ++counters_.cas_retries;
    }
    return escalate_contention(id, clock_.now_ns());
}

std::optional<ResolveReport> ResolutionEngine::attempt(Conflict conflict, const ProvisionIndex& provisions,
                                                       const ResolutionContext& ctx,
                                                       const AnalyticsSnapshot& snapshot) {
    const Timestamp now = clock_.now_ns();
    const NormativeProvision* a = provisions.find(conflict.pair.a);
    const NormativeProvision* b = provisions.find(conflict.pair.b);
    if (!a || !b) {
        LOG_WARM_FMT(util::LogLevel::Warn, "RESOLVE", "conflict=%llu provision missing",
                     static_cast<unsigned long long>(conflict.id));
        return fail_and_escalate(conflict, EscalationReason::StrategyInapplicable, now);
    }

    const StrategyInputs in{conflict, *a, *b, cfg_, ctx};
    const auto candidate = select_strategy(in);
    if (!candidate) {
        return fail_and_escalate(conflict, EscalationReason::StrategyInapplicable, now);
    }

    const StrategyKind kind = kind_of(candidate->strategy);
    const std::string bucket = buckets_.bucket_for(conflict);
    const StatKey key{conflict.type, bucket, kind};
    const BlendedConfidence blended = blend_confidence(candidate->raw_confidence, snapshot.prior_for(key), cfg_);

    StatusWrite selected = store_.compare_and_set_status(conflict.id, conflict.version,
                                                         ConflictStatus::StrategySelected, now);
    if (selected.result != CasResult::Ok) {
        if (selected.result == CasResult::VersionMismatch && selected.current.status == ConflictStatus::Detected) {
            return std::nullopt;
        }
        std::lock_guard lock(counters_mutex_);
        ++counters_.already_handled;
        ResolveReport r{};
        r.status = selected.result == CasResult::NotFound ? ResolveStatus::NotFound : ResolveStatus::AlreadyHandled;
        return r;
    }
    conflict = selected.current;

    ResolveReport report{};
    report.strategy = kind;
    report.confidence = blended.combined;

    if (blended.combined < cfg_.confidence_threshold) {
        LOG_WARM_FMT(util::LogLevel::Info, "RESOLVE", "conflict=%llu strategy=%s confidence=%.3f below threshold",
                     static_cast<unsigned long long>(conflict.id), to_string(kind), blended.combined);
        auto escalated = escalate_to_case(conflict, EscalationReason::LowConfidence, now);
        escalated.strategy = report.strategy;
        escalated.confidence = report.confidence;
        return escalated;
    }

    StrategyOutcome applied = apply_strategy(candidate->strategy, in);
    if (applied.status == ApplyStatus::Declined) {
        auto escalated = escalate_to_case(conflict, EscalationReason::PolicyReview, now);
        escalated.strategy = report.strategy;
        escalated.confidence = report.confidence;
        return escalated;
    }

    if (transition(conflict, ConflictStatus::Applied, now).result != CasResult::Ok) {
        return escalate_contention(conflict.id, now);
    }

    ResolutionRecord rec{};
    rec.conflict_id = conflict.id;
    rec.conflict_type = conflict.type;
    rec.jurisdiction_bucket = bucket;
    rec.strategy = candidate->strategy;
    rec.confidence = blended.combined;
    rec.rationale = std::move(applied.rationale);
    rec.rationale.raw_confidence = candidate->raw_confidence;
    rec.rationale.prior = blended.prior;
    rec.rationale.prior_samples = blended.samples;
    rec.applied_at = now;

    if (applied.status == ApplyStatus::Failed) {
        rec.outcome = ResolutionOutcome::Failed;
        rec = ledger_.append(std::move(rec));
        analytics_.record_outcome(OutcomeEvent{key, false, now});
        if (events_) {
            events_->on_resolution(rec);
        }
        LOG_WARM_FMT(util::LogLevel::Warn, "RESOLVE", "conflict=%llu strategy=%s apply failed reason=%s",
                     static_cast<unsigned long long>(conflict.id), to_string(kind), to_string(rec.rationale.reason));
        auto escalated = fail_and_escalate(conflict, EscalationReason::ApplyFailed, now);
        escalated.strategy = report.strategy;
        escalated.confidence = report.confidence;
        escalated.record = std::move(rec);
        return escalated;
    }

    rec.outcome = ResolutionOutcome::Applied;
    rec = ledger_.append(std::move(rec));
    if (ledger_.effective_count(conflict.id) != 1 ||
        transition(conflict, ConflictStatus::Resolved, now).result != CasResult::Ok) {
        // Never leave an effective record behind an unresolved conflict.
        if (auto reverted = ledger_.mark_reverted(rec.id, now)) {
            rec = std::move(*reverted);
        }
        auto escalated = escalate_contention(conflict.id, now);
        escalated.strategy = report.strategy;
        escalated.confidence = report.confidence;
        escalated.record = std::move(rec);
        return escalated;
    }

    analytics_.record_outcome(OutcomeEvent{key, true, now});
    if (events_) {
        events_->on_resolution(rec);
    }
    escalation_.close_for_conflict(conflict.id, ClosureKind::AutoResolved, now);
    // Cases left open on earlier instances of the pair end with this resolution.
    for (ConflictId prev = conflict.supersedes; prev != 0;) {
        escalation_.close_for_conflict(prev, ClosureKind::AutoResolved, now);
        const auto row = store_.get(prev);
        prev = row && row->status != ConflictStatus::Resolved ? row->supersedes : 0;
    }
    {
        std::lock_guard lock(counters_mutex_);
        ++counters_.resolved;
    }
    LOG_WARM_FMT(util::LogLevel::Info, "RESOLVE", "conflict=%llu resolved strategy=%s reason=%s confidence=%.3f",
                 static_cast<unsigned long long>(conflict.id), to_string(kind), to_string(rec.rationale.reason),
                 blended.combined);
    report.status = ResolveStatus::Resolved;
    report.record = std::move(rec);
    return report;
}

StatusWrite ResolutionEngine::transition(Conflict& c, ConflictStatus next, Timestamp now) {
    const ConflictStatus from = c.status;
    StatusWrite w{};
    for (std::uint32_t i = 0; i < cfg_.cas_attempts; ++i) {
        w = store_.compare_and_set_status(c.id, c.version, next, now);
        if (w.result == CasResult::Ok) {
            c = w.current;
            return w;
        }
        if (w.result != CasResult::VersionMismatch || w.current.status != from) {
            return w;
        }
        // Concurrent re-detection bumped the version without moving the status.
        c = w.current;
        std::lock_guard lock(counters_mutex_);
        ++counters_.cas_retries;
    }
    return w;
}

void ResolutionEngine::count_escalation(EscalationReason reason) {
    std::lock_guard lock(counters_mutex_);
    switch (reason) {
    case EscalationReason::LowConfidence: ++counters_.escalated_low_confidence; break;
    case EscalationReason::StrategyInapplicable: ++counters_.escalated_inapplicable; break;
    case EscalationReason::ApplyFailed: ++counters_.escalated_apply_failed; break;
    case EscalationReason::WriteContention: ++counters_.escalated_contention; break;
    case EscalationReason::PolicyReview: ++counters_.escalated_policy; break;
    }
}

ResolveReport ResolutionEngine::escalate_to_case(Conflict& c, EscalationReason reason, Timestamp now) {
    if (transition(c, ConflictStatus::Escalated, now).result != CasResult::Ok) {
        return escalate_contention(c.id, now);
    }
    count_escalation(reason);
    ResolveReport r{};
    r.status = ResolveStatus::Escalated;
    r.escalation = escalation_.escalate(c, reason, now);
    return r;
}

ResolveReport ResolutionEngine::fail_and_escalate(Conflict& c, EscalationReason reason, Timestamp now) {
    if (c.status != ConflictStatus::Failed &&
        transition(c, ConflictStatus::Failed, now).result != CasResult::Ok) {
        return escalate_contention(c.id, now);
    }
    return escalate_to_case(c, reason, now);
}

ResolveReport ResolutionEngine::escalate_contention(ConflictId id, Timestamp now) {
    ResolveReport r{};
    // Walk the row toward Escalated along the lifecycle from wherever it is.
    std::optional<Conflict> current;
    for (std::uint32_t i = 0; i < cfg_.cas_attempts * 2 + 2; ++i) {
        current = store_.get(id);
        if (!current || current->status == ConflictStatus::Escalated ||
            current->status == ConflictStatus::Resolved) {
            break;
        }
        const ConflictStatus next =
            current->status == ConflictStatus::Detected ? ConflictStatus::Failed : ConflictStatus::Escalated;
        store_.compare_and_set_status(id, current->version, next, now);
    }
    if (!current) {
        return r;
    }
    if (current->status == ConflictStatus::Resolved) {
        r.status = ResolveStatus::AlreadyHandled;
        return r;
    }
    count_escalation(EscalationReason::WriteContention);
    LOG_WARM_FMT(util::LogLevel::Warn, "RESOLVE", "conflict=%llu write contention status=%s",
                 static_cast<unsigned long long>(id), to_string(current->status));
    r.status = ResolveStatus::Escalated;
    r.escalation = escalation_.escalate(*current, EscalationReason::WriteContention, now);
    return r;
}

RevertStatus ResolutionEngine::revert(ConflictId id, Timestamp now) {
    if (!leases_.try_acquire(id)) {
        return RevertStatus::Contended;
    }
    LeaseGuard guard(leases_, id);

    for (std::uint32_t i = 0; i < cfg_.cas_attempts; ++i) {
        auto current = store_.get(id);
        if (!current) {
            return RevertStatus::NotFound;
        }
        if (current->status != ConflictStatus::Resolved) {
            return RevertStatus::NotResolved;
        }
        const StatusWrite w = store_.compare_and_set_status(id, current->version, ConflictStatus::Detected, now);
        if (w.result == CasResult::ActiveExists) {
            LOG_WARM_FMT(util::LogLevel::Info, "RESOLVE", "revert conflict=%llu blocked by newer instance",
                         static_cast<unsigned long long>(id));
            return RevertStatus::Superseded;
        }
        if (w.result == CasResult::VersionMismatch) {
            continue;
        }
        if (w.result != CasResult::Ok) {
            return RevertStatus::NotResolved;
        }

        auto effective = ledger_.effective_for(id);
        if (effective) {
            if (auto reverted = ledger_.mark_reverted(effective->id, now)) {
                analytics_.record_outcome(
                    OutcomeEvent{StatKey{reverted->conflict_type, reverted->jurisdiction_bucket,
                                         kind_of(reverted->strategy)},
                                 false, now});
                if (events_) {
                    events_->on_revert(*reverted);
                }
            }
        }
        {
            std::lock_guard lock(counters_mutex_);
            ++counters_.reverted;
        }
        LOG_WARM_FMT(util::LogLevel::Info, "RESOLVE", "conflict=%llu reverted", static_cast<unsigned long long>(id));
        return RevertStatus::Reverted;
    }
    return RevertStatus::Contended;
}

ResolutionCounters ResolutionEngine::counters() const {
    std::lock_guard lock(counters_mutex_);
    return counters_;
}

} // namespace core
