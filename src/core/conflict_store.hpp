#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <utility>
#include <vector>

#include "core/conflict.hpp"

namespace core {

enum class UpsertOutcome : std::uint8_t {
    Inserted = 0,   // first detection, or changed inputs after a Resolved instance
    Updated = 1,    // active row, inputs changed, status kept
    Reset = 2,      // Escalated/Failed row, inputs changed; a new Detected instance replaces it
    Unchanged = 3   // same fingerprint; nothing written
};

struct UpsertResult {
    UpsertOutcome outcome{UpsertOutcome::Unchanged};
    Conflict conflict{};
    ConflictStatus previous_status{ConflictStatus::Detected};
};

enum class CasResult : std::uint8_t {
    Ok = 0,
    VersionMismatch = 1,
    InvalidTransition = 2,
    NotFound = 3,
    ActiveExists = 4   // reopen blocked: a newer instance owns the pair key
};

struct StatusWrite {
    CasResult result{CasResult::NotFound};
    Conflict current{}; // state after the write, or the fresh state that blocked it
};

[[nodiscard]] constexpr const char* to_string(UpsertOutcome o) noexcept {
    switch (o) {
    case UpsertOutcome::Inserted: return "Inserted";
    case UpsertOutcome::Updated: return "Updated";
    case UpsertOutcome::Reset: return "Reset";
    case UpsertOutcome::Unchanged: return "Unchanged";
    }
    return "Unknown";
}

[[nodiscard]] constexpr const char* to_string(CasResult r) noexcept {
    switch (r) {
    case CasResult::Ok: return "Ok";
    case CasResult::VersionMismatch: return "VersionMismatch";
    case CasResult::InvalidTransition: return "InvalidTransition";
    case CasResult::NotFound: return "NotFound";
    case CasResult::ActiveExists: return "ActiveExists";
    }
    return "Unknown";
}

// Repository of conflict instances. Identity is (pair key, type); only the
// newest instance per identity is live, earlier ones keep their final status.
// All operations are atomic with respect to each other.
class ConflictStore {
public:
    virtual ~ConflictStore() = default;

    virtual UpsertResult upsert(const ConflictCandidate& candidate, Timestamp now) = 0;

    // Status transition guarded by the lifecycle table and the row version.
    virtual StatusWrite compare_and_set_status(ConflictId id, std::uint64_t expected_version, ConflictStatus next,
                                               Timestamp now) = 0;

    virtual std::optional<Conflict> get(ConflictId id) const = 0;
    virtual std::optional<Conflict> find_active(const PairKey& pair, ConflictType type) const = 0;
    virtual std::vector<Conflict> list(const std::function<bool(const Conflict&)>& pred) const = 0;
    virtual std::size_t size() const = 0;
};

// In-memory store. Readers share the lock; every write takes it exclusively,
// which makes the per-key upsert atomic across detection workers.
class InMemoryConflictStore final : public ConflictStore {
public:
    InMemoryConflictStore() = default;

    InMemoryConflictStore(const InMemoryConflictStore&) = delete;
    InMemoryConflictStore& operator=(const InMemoryConflictStore&) = delete;

    UpsertResult upsert(const ConflictCandidate& candidate, Timestamp now) override;
    StatusWrite compare_and_set_status(ConflictId id, std::uint64_t expected_version, ConflictStatus next,
                                       Timestamp now) override;

    std::optional<Conflict> get(ConflictId id) const override;
    std::optional<Conflict> find_active(const PairKey& pair, ConflictType type) const override;
    std::vector<Conflict> list(const std::function<bool(const Conflict&)>& pred) const override;
    std::size_t size() const override;

    std::uint64_t write_count() const;

private:
    using Identity = std::pair<PairKey, ConflictType>;

    Conflict& insert_locked(const ConflictCandidate& candidate, Timestamp now, ConflictId supersedes = 0);

    mutable std::shared_mutex mutex_;
    std::map<ConflictId, Conflict> rows_;
    std::map<Identity, ConflictId> latest_; // newest instance per identity, any status
    ConflictId next_id_{1};
    std::uint64_t writes_{0};
};

} // namespace core
