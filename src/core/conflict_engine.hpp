#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

#include "core/conflict_detector.hpp"
#include "core/conflict_store.hpp"
#include "core/engine_config.hpp"
#include "core/engine_events.hpp"
#include "core/escalation_manager.hpp"
#include "core/notifier.hpp"
#include "core/provision_index.hpp"
#include "core/query_service.hpp"
#include "core/resolution.hpp"
#include "core/resolution_analytics.hpp"
#include "core/resolution_engine.hpp"
#include "core/similarity.hpp"
#include "util/clock.hpp"

namespace core {

struct CycleReport {
    DetectionCounters detection{};
    std::size_t detected_conflicts{0}; // conflicts the detection pass (re)confirmed
    std::size_t attempted{0};          // conflicts in Detected handed to the resolver
    std::size_t resolved{0};
    std::size_t escalated{0};
    std::size_t already_handled{0};
    std::size_t contended{0};
    std::uint64_t snapshot_epoch{0};   // analytics view used for the cycle
    std::size_t analytics_merged{0};
    std::vector<ResolveReport> reports{};
};

// Wires detector, resolver, escalation and analytics around one store and one
// configuration. A cycle reads a single analytics snapshot up front and
// commits the outcomes it produced at the end.
class ConflictEngine {
public:
    // Throws std::invalid_argument when cfg does not validate. scorer,
    // notifier and events may be null.
    ConflictEngine(EngineConfig cfg, ConflictStore& store, const util::Clock& clock,
                   SimilarityScorer* scorer = nullptr, Notifier* notifier = nullptr,
                   EngineEvents* events = nullptr);
    ~ConflictEngine();

    ConflictEngine(const ConflictEngine&) = delete;
    ConflictEngine& operator=(const ConflictEngine&) = delete;

    // Full pass: the provision set replaces the maintained index.
    CycleReport run_cycle(const std::vector<NormativeProvision>& provisions, const ResolutionContext& ctx);

    // Applies new or changed provisions to the index and re-evaluates only the
    // pairs they touch.
    CycleReport run_incremental(const std::vector<NormativeProvision>& delta, const ResolutionContext& ctx);

    // Drops provisions from the index. Their conflicts stay in the store.
    std::size_t retire(const std::vector<ProvisionId>& ids);

    RevertStatus revert(ConflictId id);

    // SLA scheduler and analytics committer threads.
    bool start_background();
    void stop_background();

    const EngineConfig& config() const noexcept { return cfg_; }
    ConflictStore& store() noexcept { return store_; }
    ResolutionLedger& ledger() noexcept { return ledger_; }
    ResolutionAnalytics& analytics() noexcept { return analytics_; }
    EscalationManager& escalation() noexcept { return escalation_; }
    ConflictDetector& detector() noexcept { return detector_; }
    ResolutionEngine& resolver() noexcept { return resolver_; }
    const QueryService& query() const noexcept { return query_; }
    const ProvisionIndex& index() const noexcept { return index_; }

private:
    CycleReport resolve_pending(DetectionResult detection, const ResolutionContext& ctx);

    EngineConfig cfg_;
    ConflictStore& store_;
    const util::Clock& clock_;

    ResolutionLedger ledger_;
    ResolutionAnalytics analytics_;
    EscalationManager escalation_;
    ConflictDetector detector_;
    ResolutionEngine resolver_;
    QueryService query_;

    std::mutex cycle_mutex_; // one cycle at a time; guards index_
    ProvisionIndex index_;
};

} // namespace core
