#include "core/conflict_engine.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "util/async_log.hpp"

namespace core {
namespace {

EngineConfig checked(EngineConfig cfg) {
    std::string error;
    if (!validate_engine_config(cfg, error)) {
        throw std::invalid_argument("invalid engine config: " + error);
    }
    return cfg;
}

} // namespace

ConflictEngine::ConflictEngine(EngineConfig cfg, ConflictStore& store, const util::Clock& clock,
                               SimilarityScorer* scorer, Notifier* notifier, EngineEvents* events)
    : cfg_(checked(std::move(cfg))),
      store_(store),
      clock_(clock),
      escalation_(cfg_, clock_, notifier, events),
      detector_(store_, cfg_, scorer, clock_),
      resolver_(store_, ledger_, escalation_, analytics_, cfg_, clock_, events),
      query_(store_, ledger_, escalation_) {}

ConflictEngine::~ConflictEngine() { stop_background(); }

CycleReport ConflictEngine::run_cycle(const std::vector<NormativeProvision>& provisions,
                                      const ResolutionContext& ctx) {
    std::lock_guard lock(cycle_mutex_);
    index_.clear();
    for (const auto& p : provisions) {
        index_.upsert(p);
    }
    return resolve_pending(detector_.detect_index(index_), ctx);
}

CycleReport ConflictEngine::run_incremental(const std::vector<NormativeProvision>& delta,
                                            const ResolutionContext& ctx) {
    std::lock_guard lock(cycle_mutex_);
    return resolve_pending(detector_.detect_incremental(delta, index_), ctx);
}

std::size_t ConflictEngine::retire(const std::vector<ProvisionId>& ids) {
    std::lock_guard lock(cycle_mutex_);
    std::size_t removed = 0;
    for (const auto& id : ids) {
        if (index_.remove(id)) {
            ++removed;
        }
    }
    return removed;
}

CycleReport ConflictEngine::resolve_pending(DetectionResult detection, const ResolutionContext& ctx) {
    CycleReport report{};
    report.detection = detection.counters;
    report.detected_conflicts = detection.conflicts.size();

    const SnapshotPtr snapshot = analytics_.snapshot();
    report.snapshot_epoch = snapshot ? snapshot->epoch() : 0;

    const auto pending = store_.list([](const Conflict& c) { return c.status == ConflictStatus::Detected; });
    report.reports.reserve(pending.size());
    for (const auto& c : pending) {
        ++report.attempted;
        ResolveReport r = resolver_.resolve(c.id, index_, ctx, snapshot);
        switch (r.status) {
        case ResolveStatus::Resolved: ++report.resolved; break;
        case ResolveStatus::Escalated: ++report.escalated; break;
        case ResolveStatus::AlreadyHandled: ++report.already_handled; break;
        case ResolveStatus::Contended: ++report.contended; break;
        case ResolveStatus::NotFound: break;
        }
        report.reports.push_back(std::move(r));
    }

    report.analytics_merged = analytics_.commit();
    LOG_WARM_FMT(util::LogLevel::Info, "RESOLVE", "cycle attempted=%zu resolved=%zu escalated=%zu merged=%zu",
                 report.attempted, report.resolved, report.escalated, report.analytics_merged);
    return report;
}

RevertStatus ConflictEngine::revert(ConflictId id) { return resolver_.revert(id, clock_.now_ns()); }

bool ConflictEngine::start_background() {
    if (!escalation_.start()) {
        return false;
    }
    if (!analytics_.start(cfg_.analytics_commit_interval_ns)) {
        escalation_.stop();
        return false;
    }
    return true;
}

void ConflictEngine::stop_background() {
    escalation_.stop();
    analytics_.stop();
}

} // namespace core
