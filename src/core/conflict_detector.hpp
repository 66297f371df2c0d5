#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "core/conflict.hpp"
#include "core/conflict_store.hpp"
#include "core/engine_config.hpp"
#include "core/provision_index.hpp"
#include "core/similarity.hpp"
#include "util/clock.hpp"
#include "util/log.hpp"

namespace core {

struct DetectionCounters {
    std::uint64_t pairs_evaluated{0};
    std::uint64_t temporal_hits{0};
    std::uint64_t jurisdictional_hits{0};
    std::uint64_t hierarchical_hits{0};
    std::uint64_t semantic_hits{0};

    std::uint64_t semantic_skipped{0};   // scorer unavailable or timed out; pair queued
    std::uint64_t semantic_disabled{0};  // no scorer wired in
    std::uint64_t data_quality_skips{0}; // check skipped for missing jurisdiction/date

    std::uint64_t inserted{0};
    std::uint64_t updated{0};
    std::uint64_t reset{0};
    std::uint64_t unchanged{0};

    void merge(const DetectionCounters& o) noexcept;
};

// Restricts a pass to provisions from the named frameworks and/or touching the
// named jurisdictions. Empty lists do not filter.
struct DetectionScope {
    std::vector<std::string> frameworks{};
    std::vector<std::string> jurisdictions{};

    bool matches(const NormativeProvision& p) const;
};

struct DetectionResult {
    std::vector<Conflict> conflicts{}; // every conflict the pass (re)confirmed, by id
    DetectionCounters counters{};
};

// Scans provisions for temporal, jurisdictional, hierarchical and semantic
// conflicts and reconciles the findings with the store through its atomic
// per-key upsert. Buckets are scanned by cfg.detection_workers threads.
class ConflictDetector {
public:
    // scorer may be null: the semantic check is then disabled, not skipped.
    ConflictDetector(ConflictStore& store, const EngineConfig& cfg, SimilarityScorer* scorer,
                     const util::Clock& clock);

    ConflictDetector(const ConflictDetector&) = delete;
    ConflictDetector& operator=(const ConflictDetector&) = delete;

    DetectionResult detect(const std::vector<NormativeProvision>& provisions,
                           const std::optional<DetectionScope>& scope = std::nullopt);

    // Applies the delta to the index, then evaluates every pair touching a
    // new or changed provision plus any pair queued for a semantic recheck.
    DetectionResult detect_incremental(const std::vector<NormativeProvision>& new_or_changed,
                                       ProvisionIndex& index);

    // Full pass over an already-built index.
    DetectionResult detect_index(const ProvisionIndex& index);

    std::vector<PairKey> pending_rechecks() const;
    DetectionCounters counters() const;

private:
    struct PairTask {
        const NormativeProvision* a{nullptr};
        const NormativeProvision* b{nullptr};
        bool semantic_only{false};
    };

    struct WorkerState {
        DetectionCounters counters{};
        std::vector<ConflictId> touched{};
        std::vector<PairKey> recheck{};
    };

    DetectionResult run_tasks(const std::vector<std::vector<PairTask>>& work);
    void evaluate_pair(const PairTask& task, util::CivilDay today, Timestamp now, WorkerState& state);
    void emit(const NormativeProvision& a, const NormativeProvision& b, ConflictType type, double severity,
              const ConflictEvidence& evidence, Timestamp now, WorkerState& state);
    void note_data_quality(const NormativeProvision& p, const char* what);

    static std::vector<std::vector<PairTask>> bucket_tasks(const ProvisionIndex& index);

    ConflictStore& store_;
    const EngineConfig& cfg_;
    SimilarityScorer* scorer_;
    const util::Clock& clock_;

    mutable std::mutex mutex_; // guards recheck_, totals_ and dq_limiter_
    std::set<PairKey> recheck_;
    DetectionCounters totals_{};
    util::LogRateLimiter dq_limiter_{};
};

} // namespace core
