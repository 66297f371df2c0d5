#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

#include "core/conflict.hpp"
#include "core/strategy.hpp"

namespace core {

using RecordId = std::uint64_t;

enum class ResolutionOutcome : std::uint8_t {
    Applied = 0,
    Reverted = 1,
    Failed = 2
};

[[nodiscard]] constexpr const char* to_string(ResolutionOutcome o) noexcept {
    switch (o) {
    case ResolutionOutcome::Applied: return "Applied";
    case ResolutionOutcome::Reverted: return "Reverted";
    case ResolutionOutcome::Failed: return "Failed";
    }
    return "Unknown";
}

struct ResolutionRecord {
    RecordId id{0};
    ConflictId conflict_id{0};
    ConflictType conflict_type{ConflictType::Temporal};
    std::string jurisdiction_bucket{};
    Strategy strategy{};
    ResolutionOutcome outcome{ResolutionOutcome::Applied};
    double confidence{0.0};
    Rationale rationale{};
    Timestamp applied_at{0};
    Timestamp reverted_at{0};
};

// Append-only store of resolution records. The only mutation is marking an
// Applied record Reverted.
class ResolutionLedger {
public:
    ResolutionLedger() = default;

    ResolutionLedger(const ResolutionLedger&) = delete;
    ResolutionLedger& operator=(const ResolutionLedger&) = delete;

    // Assigns the id and returns the stored copy.
    ResolutionRecord append(ResolutionRecord record);

    // Applied -> Reverted. Returns the updated record, or nullopt if the record
    // is unknown or not Applied.
    std::optional<ResolutionRecord> mark_reverted(RecordId id, Timestamp now);

    std::optional<ResolutionRecord> get(RecordId id) const;

    // The single non-reverted Applied record for the conflict, if any.
    std::optional<ResolutionRecord> effective_for(ConflictId conflict_id) const;
    std::size_t effective_count(ConflictId conflict_id) const;

    std::vector<ResolutionRecord> for_conflict(ConflictId conflict_id) const;
    std::vector<ResolutionRecord> list(const std::function<bool(const ResolutionRecord&)>& pred) const;
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<RecordId, ResolutionRecord> records_;
    std::multimap<ConflictId, RecordId> by_conflict_;
    RecordId next_id_{1};
};

} // namespace core
