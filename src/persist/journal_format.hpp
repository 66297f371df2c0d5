#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "core/engine_events.hpp"
#include "core/escalation.hpp"
#include "core/resolution.hpp"

namespace persist {

// On-disk record:
//   [u32 type_le][u32 payload_len_le][payload][u32 crc32c_le]
// The CRC covers header and payload. Every payload opens with a u16 schema
// version. Strings are [u16 len_le][bytes], capped at journal_max_string.

enum class JournalRecordType : std::uint32_t {
    Reserved = 0,
    Resolution = 1,
    Revert = 2,
    Escalation = 3,
};

inline constexpr std::uint16_t journal_schema_version_v1 = 1;

inline constexpr std::size_t header_size = sizeof(std::uint32_t) * 2;
inline constexpr std::size_t trailer_size = sizeof(std::uint32_t);
inline constexpr std::size_t journal_max_string = 96;
inline constexpr std::size_t journal_max_frame = 512;

// Fixed parts of the v1 payloads, strings excluded.
inline constexpr std::size_t resolution_fixed_v1_size = 62;
inline constexpr std::size_t revert_fixed_v1_size = 28;
inline constexpr std::size_t escalation_payload_v1_size = 58;

inline constexpr std::size_t record_size_from_payload(std::size_t payload_len) noexcept {
    return header_size + payload_len + trailer_size;
}

// One encoded record; trivially copyable so it can travel through the ring.
struct JournalFrame {
    std::uint32_t size{0};
    std::array<std::byte, journal_max_frame> bytes{};

    std::span<const std::byte> view() const noexcept { return {bytes.data(), size}; }
};

struct JournalResolution {
    core::RecordId record_id{0};
    core::ConflictId conflict_id{0};
    core::ConflictType conflict_type{core::ConflictType::Temporal};
    core::StrategyKind strategy{core::StrategyKind::LexSuperior};
    core::ResolutionOutcome outcome{core::ResolutionOutcome::Applied};
    core::ReasonCode reason{core::ReasonCode::NotApplicable};
    double confidence{0.0};
    double raw_confidence{0.0};
    double prior{0.5};
    std::uint64_t prior_samples{0};
    core::Timestamp applied_at{0};
    std::string jurisdiction_bucket{};
    std::string winner{};
    std::string delegate{};
};

struct JournalRevert {
    core::RecordId record_id{0};
    core::ConflictId conflict_id{0};
    core::ConflictType conflict_type{core::ConflictType::Temporal};
    core::StrategyKind strategy{core::StrategyKind::LexSuperior};
    core::Timestamp reverted_at{0};
    std::string jurisdiction_bucket{};
};

struct JournalEscalation {
    core::CaseId case_id{0};
    core::ConflictId conflict_id{0};
    core::EscalationEventKind kind{core::EscalationEventKind::Opened};
    core::EscalationStatus status{core::EscalationStatus::Open};
    core::EscalationReason reason{core::EscalationReason::LowConfidence};
    core::ClosureKind closure{core::ClosureKind::None};
    std::uint32_t level{0};
    core::Timestamp opened_at{0};
    core::Timestamp closed_at{0};
    core::Timestamp sla_deadline{0};
    double severity{0.0};
};

struct DecodedJournalRecord {
    JournalRecordType type{JournalRecordType::Reserved};
    std::uint16_t schema_version{0};
    std::uint32_t payload_len{0};
    JournalResolution resolution{};
    JournalRevert revert{};
    JournalEscalation escalation{};
};

enum class DecodeError {
    Ok = 0,
    TruncatedAtEnd,
    InvalidType,
    VersionMismatch,
    InvalidLength,
    InvalidCrc,
    InvalidEnum,
};

[[nodiscard]] constexpr const char* to_string(DecodeError e) noexcept {
    switch (e) {
    case DecodeError::Ok: return "Ok";
    case DecodeError::TruncatedAtEnd: return "TruncatedAtEnd";
    case DecodeError::InvalidType: return "InvalidType";
    case DecodeError::VersionMismatch: return "VersionMismatch";
    case DecodeError::InvalidLength: return "InvalidLength";
    case DecodeError::InvalidCrc: return "InvalidCrc";
    case DecodeError::InvalidEnum: return "InvalidEnum";
    }
    return "Unknown";
}

inline bool is_graceful_eof(DecodeError err) noexcept { return err == DecodeError::TruncatedAtEnd; }

struct JournalCounters {
    // Producer drops (ring full).
    std::atomic<std::uint64_t> drop_ring_full{0};
    // Writer drops while degraded.
    std::atomic<std::uint64_t> drop_degraded{0};
    std::atomic<std::uint64_t> strings_truncated{0};

    std::atomic<std::uint64_t> records_written{0};
    std::atomic<std::uint64_t> files_opened{0};
    std::atomic<std::uint64_t> io_errors{0};
    std::atomic<std::uint64_t> recovery_attempts{0};
    std::atomic<std::uint64_t> degraded_mode_time_ns{0};

    std::atomic<std::uint64_t> parse_errors_version_mismatch{0};
    std::atomic<std::uint64_t> parse_errors_invalid_length{0};
    std::atomic<std::uint64_t> parse_errors_truncated{0};
    std::atomic<std::uint64_t> parse_errors_crc{0};
    std::atomic<std::uint64_t> parse_errors_invalid_type{0};
};

bool encode_resolution_record(const core::ResolutionRecord& rec, JournalFrame& out,
                              JournalCounters* counters = nullptr) noexcept;
bool encode_revert_record(const core::ResolutionRecord& rec, JournalFrame& out,
                          JournalCounters* counters = nullptr) noexcept;
bool encode_escalation_record(const core::EscalationCase& c, core::EscalationEventKind kind,
                              JournalFrame& out) noexcept;

DecodeError decode_record(std::span<const std::byte> data, DecodedJournalRecord& out,
                          JournalCounters* counters = nullptr);

inline std::string_view journal_filename_prefix() noexcept { return "journal_"; }

} // namespace persist
