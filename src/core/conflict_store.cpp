#include "core/conflict_store.hpp"

#include <mutex>

#include "core/conflict_lifecycle.hpp"

namespace core {

Conflict& InMemoryConflictStore::insert_locked(const ConflictCandidate& candidate, Timestamp now,
                                               ConflictId supersedes) {
    Conflict c{};
    c.id = next_id_++;
    c.pair = candidate.pair;
    c.type = candidate.type;
    c.severity = candidate.severity;
    c.evidence = candidate.evidence;
    c.status = ConflictStatus::Detected;
    c.detected_at = now;
    c.last_updated_at = now;
    c.framework_a = candidate.framework_a;
    c.framework_b = candidate.framework_b;
    c.jurisdictions = candidate.jurisdictions;
    c.topics = candidate.topics;
    c.version = 1;
    c.input_fingerprint = candidate.input_fingerprint;
    c.supersedes = supersedes;
    latest_[Identity{c.pair, c.type}] = c.id;
    ++writes_;
    return rows_.emplace(c.id, std::move(c)).first->second;
}

UpsertResult InMemoryConflictStore::upsert(const ConflictCandidate& candidate, Timestamp now) {
    std::unique_lock lock(mutex_);
    UpsertResult result{};

    auto latest = latest_.find(Identity{candidate.pair, candidate.type});
    if (latest == latest_.end()) {
        result.outcome = UpsertOutcome::Inserted;
        result.conflict = insert_locked(candidate, now);
        return result;
    }

    Conflict& row = rows_.at(latest->second);
    result.previous_status = row.status;
    if (row.input_fingerprint == candidate.input_fingerprint) {
        result.outcome = UpsertOutcome::Unchanged;
        result.conflict = row;
        return result;
    }

    if (row.status == ConflictStatus::Resolved) {
        // The resolution stands for the inputs it was made on.
        result.outcome = UpsertOutcome::Inserted;
        result.conflict = insert_locked(candidate, now, row.id);
        return result;
    }
    if (row.status == ConflictStatus::Escalated || row.status == ConflictStatus::Failed) {
        // The old instance keeps its records; the changed inputs start over.
        result.outcome = UpsertOutcome::Reset;
        result.conflict = insert_locked(candidate, now, row.id);
        return result;
    }

    row.severity = candidate.severity;
    row.evidence = candidate.evidence;
    row.framework_a = candidate.framework_a;
    row.framework_b = candidate.framework_b;
    row.jurisdictions = candidate.jurisdictions;
    row.topics = candidate.topics;
    row.input_fingerprint = candidate.input_fingerprint;
    row.last_updated_at = now;
    ++row.version;
    ++writes_;
    result.outcome = UpsertOutcome::Updated;
    result.conflict = row;
    return result;
}

StatusWrite InMemoryConflictStore::compare_and_set_status(ConflictId id, std::uint64_t expected_version,
                                                          ConflictStatus next, Timestamp now) {
    std::unique_lock lock(mutex_);
    StatusWrite out{};
    auto it = rows_.find(id);
    if (it == rows_.end()) {
        out.result = CasResult::NotFound;
        return out;
    }
    Conflict& row = it->second;
    if (row.version != expected_version) {
        out.result = CasResult::VersionMismatch;
        out.current = row;
        return out;
    }
    if (!is_valid_transition(row.status, next)) {
        out.result = CasResult::InvalidTransition;
        out.current = row;
        return out;
    }
    if (next == ConflictStatus::Detected) {
        auto latest = latest_.find(Identity{row.pair, row.type});
        if (latest != latest_.end() && latest->second != row.id) {
            out.result = CasResult::ActiveExists;
            out.current = row;
            return out;
        }
    }
    row.status = next;
    row.last_updated_at = now;
    ++row.version;
    ++writes_;
    out.result = CasResult::Ok;
    out.current = row;
    return out;
}

std::optional<Conflict> InMemoryConflictStore::get(ConflictId id) const {
    std::shared_lock lock(mutex_);
    auto it = rows_.find(id);
    if (it == rows_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Conflict> InMemoryConflictStore::find_active(const PairKey& pair, ConflictType type) const {
    std::shared_lock lock(mutex_);
    auto latest = latest_.find(Identity{pair, type});
    if (latest == latest_.end()) {
        return std::nullopt;
    }
    const Conflict& row = rows_.at(latest->second);
    if (!is_active_status(row.status)) {
        return std::nullopt;
    }
    return row;
}

std::vector<Conflict> InMemoryConflictStore::list(const std::function<bool(const Conflict&)>& pred) const {
    std::shared_lock lock(mutex_);
    std::vector<Conflict> out;
    for (const auto& [id, row] : rows_) {
        if (!pred || pred(row)) {
            out.push_back(row);
        }
    }
    return out;
}

std::size_t InMemoryConflictStore::size() const {
    std::shared_lock lock(mutex_);
    return rows_.size();
}

std::uint64_t InMemoryConflictStore::write_count() const {
    std::shared_lock lock(mutex_);
    return writes_;
}

} // namespace core
