#include "core/resolution_analytics.hpp"

#include <algorithm>
#include <chrono>
#include <system_error>
#include <utility>

#include "util/async_log.hpp"

namespace core {

StrategyPrior AnalyticsSnapshot::prior_for(const StatKey& key) const {
    auto it = stats_.find(key);
    if (it == stats_.end()) {
        return StrategyPrior{};
    }
    return StrategyPrior{it->second.success_rate(), it->second.samples()};
}

const StrategyOutcomeStat* AnalyticsSnapshot::find(const StatKey& key) const {
    auto it = stats_.find(key);
    return it == stats_.end() ? nullptr : &it->second;
}

JurisdictionBuckets::JurisdictionBuckets(const EngineConfig& cfg) {
    for (const auto& entry : cfg.jurisdiction_buckets) {
        mapping_.emplace(entry.jurisdiction, entry.bucket);
    }
}

std::string JurisdictionBuckets::bucket_for(const Conflict& c) const {
    const auto& tags = c.evidence.jurisdiction_intersection.empty() ? c.jurisdictions
                                                                    : c.evidence.jurisdiction_intersection;
    for (const auto& tag : tags) {
        auto it = mapping_.find(tag);
        if (it != mapping_.end()) {
            return it->second;
        }
    }
    if (!tags.empty()) {
        return tags.front();
    }
    return "unscoped";
}

ResolutionAnalytics::ResolutionAnalytics() : current_(std::make_shared<const AnalyticsSnapshot>()) {}

ResolutionAnalytics::~ResolutionAnalytics() { stop(); }

void ResolutionAnalytics::record_outcome(const OutcomeEvent& ev) {
    std::lock_guard lock(pending_mutex_);
    pending_.push_back(ev);
}

std::size_t ResolutionAnalytics::commit() {
    std::lock_guard commit_lock(commit_mutex_);
    std::vector<OutcomeEvent> batch;
    {
        std::lock_guard lock(pending_mutex_);
        batch.swap(pending_);
    }
    if (batch.empty()) {
        return 0;
    }

    const SnapshotPtr base = snapshot();
    auto stats = base->stats();
    for (const auto& ev : batch) {
        StrategyOutcomeStat& s = stats[ev.key];
        if (ev.success) {
            ++s.success_count;
        } else {
            ++s.failure_count;
        }
        s.last_updated = std::max(s.last_updated, ev.at);
    }
    auto next = std::make_shared<const AnalyticsSnapshot>(std::move(stats), base->epoch() + 1);
    {
        std::lock_guard lock(snapshot_mutex_);
        current_ = std::move(next);
    }
    LOG_WARM_FMT(util::LogLevel::Debug, "ANALYT", "committed %zu outcomes epoch=%llu", batch.size(),
                 static_cast<unsigned long long>(base->epoch() + 1));
    return batch.size();
}

SnapshotPtr ResolutionAnalytics::snapshot() const {
    std::lock_guard lock(snapshot_mutex_);
    return current_;
}

std::size_t ResolutionAnalytics::warm_start(const std::vector<OutcomeEvent>& history) {
    {
        std::lock_guard lock(pending_mutex_);
        pending_.insert(pending_.begin(), history.begin(), history.end());
    }
    const std::size_t merged = commit();
    LOG_WARM_FMT(util::LogLevel::Info, "ANALYT", "warm start merged %zu outcomes", merged);
    return merged;
}

bool ResolutionAnalytics::start(std::uint64_t interval_ns) {
    std::lock_guard lock(run_mutex_);
    if (committer_.joinable()) {
        return true;
    }
    stop_requested_ = false;
    try {
        committer_ = std::thread([this, interval_ns] { committer_loop(interval_ns); });
    } catch (const std::system_error&) {
        return false;
    }
    return true;
}

void ResolutionAnalytics::stop() {
    {
        std::lock_guard lock(run_mutex_);
        if (!committer_.joinable()) {
            return;
        }
        stop_requested_ = true;
    }
    run_cv_.notify_all();
    committer_.join();
    commit(); // settle whatever arrived before shutdown
}

void ResolutionAnalytics::committer_loop(std::uint64_t interval_ns) {
    std::unique_lock lock(run_mutex_);
    while (!stop_requested_) {
        run_cv_.wait_for(lock, std::chrono::nanoseconds(interval_ns), [this] { return stop_requested_; });
        if (stop_requested_) {
            break;
        }
        lock.unlock();
        commit();
        lock.lock();
    }
}

std::size_t ResolutionAnalytics::pending() const {
    std::lock_guard lock(pending_mutex_);
    return pending_.size();
}

} // namespace core
