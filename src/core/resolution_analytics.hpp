#pragma once

#include <atomic>
#include <compare>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "core/conflict.hpp"
#include "core/engine_config.hpp"
#include "core/strategy.hpp"

namespace core {

struct StatKey {
    ConflictType type{ConflictType::Temporal};
    std::string jurisdiction_bucket{};
    StrategyKind strategy{StrategyKind::LexSuperior};

    bool operator==(const StatKey&) const = default;
    auto operator<=>(const StatKey&) const = default;
};

struct StrategyOutcomeStat {
    std::uint64_t success_count{0};
    std::uint64_t failure_count{0};
    Timestamp last_updated{0};

    std::uint64_t samples() const noexcept { return success_count + failure_count; }

    // Laplace smoothed; 0.5 with no history.
    double success_rate() const noexcept {
        return (static_cast<double>(success_count) + 1.0) / (static_cast<double>(samples()) + 2.0);
    }
};

struct StrategyPrior {
    double rate{0.5};
    std::uint64_t samples{0};
};

// Terminal outcome of one resolution attempt.
struct OutcomeEvent {
    StatKey key{};
    bool success{false};
    Timestamp at{0};
};

// Immutable once published.
class AnalyticsSnapshot {
public:
    AnalyticsSnapshot() = default;
    AnalyticsSnapshot(std::map<StatKey, StrategyOutcomeStat> stats, std::uint64_t epoch)
        : stats_(std::move(stats)), epoch_(epoch) {}

    StrategyPrior prior_for(const StatKey& key) const;
    const StrategyOutcomeStat* find(const StatKey& key) const;
    const std::map<StatKey, StrategyOutcomeStat>& stats() const noexcept { return stats_; }
    std::uint64_t epoch() const noexcept { return epoch_; }

private:
    std::map<StatKey, StrategyOutcomeStat> stats_{};
    std::uint64_t epoch_{0};
};

using SnapshotPtr = std::shared_ptr<const AnalyticsSnapshot>;

// Pools jurisdiction tags into analytics buckets per configuration. A conflict
// falls into the bucket of its first mapped jurisdiction; unmapped tags are
// their own bucket, and a conflict without jurisdictions is "unscoped".
class JurisdictionBuckets {
public:
    explicit JurisdictionBuckets(const EngineConfig& cfg);

    std::string bucket_for(const Conflict& c) const;

private:
    std::map<std::string, std::string> mapping_;
};

// Aggregates terminal outcomes into per-signature stats. Writers only enqueue;
// commit() folds pending events into a fresh snapshot and swaps it in. Readers
// holding an older snapshot are never disturbed.
class ResolutionAnalytics {
public:
    ResolutionAnalytics();
    ~ResolutionAnalytics();

    ResolutionAnalytics(const ResolutionAnalytics&) = delete;
    ResolutionAnalytics& operator=(const ResolutionAnalytics&) = delete;

    void record_outcome(const OutcomeEvent& ev);

    // Returns the number of events merged.
    std::size_t commit();

    SnapshotPtr snapshot() const;

    // Seeds stats from persisted outcomes and publishes the result.
    std::size_t warm_start(const std::vector<OutcomeEvent>& history);

    // Background committer; commit() stays callable while it runs.
    bool start(std::uint64_t interval_ns);
    void stop();

    std::size_t pending() const;

private:
    void committer_loop(std::uint64_t interval_ns);

    mutable std::mutex pending_mutex_;
    std::vector<OutcomeEvent> pending_;

    std::mutex commit_mutex_; // one merge at a time

    mutable std::mutex snapshot_mutex_; // guards the pointer swap only
    SnapshotPtr current_;

    std::mutex run_mutex_;
    std::condition_variable run_cv_;
    bool stop_requested_{false};
    std::thread committer_;
};

} // namespace core
