#include "core/resolution.hpp"

#include <utility>

namespace core {

ResolutionRecord ResolutionLedger::append(ResolutionRecord record) {
    std::lock_guard lock(mutex_);
    record.id = next_id_++;
    by_conflict_.emplace(record.conflict_id, record.id);
    return records_.emplace(record.id, std::move(record)).first->second;
}

std::optional<ResolutionRecord> ResolutionLedger::mark_reverted(RecordId id, Timestamp now) {
    std::lock_guard lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end() || it->second.outcome != ResolutionOutcome::Applied) {
        return std::nullopt;
    }
    it->second.outcome = ResolutionOutcome::Reverted;
    it->second.reverted_at = now;
    return it->second;
}

std::optional<ResolutionRecord> ResolutionLedger::get(RecordId id) const {
    std::lock_guard lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<ResolutionRecord> ResolutionLedger::effective_for(ConflictId conflict_id) const {
    std::lock_guard lock(mutex_);
    auto [lo, hi] = by_conflict_.equal_range(conflict_id);
    for (auto it = lo; it != hi; ++it) {
        const ResolutionRecord& r = records_.at(it->second);
        if (r.outcome == ResolutionOutcome::Applied) {
            return r;
        }
    }
    return std::nullopt;
}

std::size_t ResolutionLedger::effective_count(ConflictId conflict_id) const {
    std::lock_guard lock(mutex_);
    std::size_t n = 0;
    auto [lo, hi] = by_conflict_.equal_range(conflict_id);
    for (auto it = lo; it != hi; ++it) {
        if (records_.at(it->second).outcome == ResolutionOutcome::Applied) {
            ++n;
        }
    }
    return n;
}

std::vector<ResolutionRecord> ResolutionLedger::for_conflict(ConflictId conflict_id) const {
    std::lock_guard lock(mutex_);
    std::vector<ResolutionRecord> out;
    auto [lo, hi] = by_conflict_.equal_range(conflict_id);
    for (auto it = lo; it != hi; ++it) {
        out.push_back(records_.at(it->second));
    }
    return out;
}

std::vector<ResolutionRecord> ResolutionLedger::list(const std::function<bool(const ResolutionRecord&)>& pred) const {
    std::lock_guard lock(mutex_);
    std::vector<ResolutionRecord> out;
    for (const auto& [id, r] : records_) {
        if (!pred || pred(r)) {
            out.push_back(r);
        }
    }
    return out;
}

std::size_t ResolutionLedger::size() const {
    std::lock_guard lock(mutex_);
    return records_.size();
}

} // namespace core
