#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>

#include "core/escalation.hpp"
#include "persist/byte_codec.hpp"

namespace notify {

// Fixed-size little-endian escalation notice as published on the wire.
//
//   0  u16 version          2  u8 status        3  u8 reason
//   4  u32 level            8  u64 case_id      16 u64 conflict_id
//   24 u64 opened_at        32 u64 sla_deadline 40 f64 severity
//   48 u8 closure           49 u8 stakeholder_len
//   50 stakeholder bytes (truncated to notice_stakeholder_capacity)
inline constexpr std::uint16_t notice_version = 1;
inline constexpr std::size_t notice_size = 80;
inline constexpr std::size_t notice_stakeholder_offset = 50;
inline constexpr std::size_t notice_stakeholder_capacity = notice_size - notice_stakeholder_offset;

using NoticeBuffer = std::array<std::byte, notice_size>;

struct EscalationNotice {
    std::string stakeholder_ref{};
    core::EscalationCase escalation_case{};
};

// Returns true when the stakeholder reference fit without truncation.
inline bool encode_notice(std::string_view stakeholder_ref, const core::EscalationCase& c, NoticeBuffer& out) noexcept {
    out.fill(std::byte{0});
    std::byte* p = out.data();
    persist::store_le16(notice_version, p);
    p[2] = static_cast<std::byte>(c.status);
    p[3] = static_cast<std::byte>(c.reason);
    persist::store_le32(c.level, p + 4);
    persist::store_le64(c.id, p + 8);
    persist::store_le64(c.conflict_id, p + 16);
    persist::store_le64(c.opened_at, p + 24);
    persist::store_le64(c.sla_deadline, p + 32);
    persist::store_f64(c.severity, p + 40);
    p[48] = static_cast<std::byte>(c.closure);
    const std::size_t len = std::min(stakeholder_ref.size(), notice_stakeholder_capacity);
    p[49] = static_cast<std::byte>(len);
    std::memcpy(p + notice_stakeholder_offset, stakeholder_ref.data(), len);
    return len == stakeholder_ref.size();
}

inline bool decode_notice(std::span<const std::byte> in, EscalationNotice& out) {
    if (in.size() != notice_size) {
        return false;
    }
    const std::byte* p = in.data();
    if (persist::load_le16(p) != notice_version) {
        return false;
    }
    const auto status = std::to_integer<std::uint8_t>(p[2]);
    const auto reason = std::to_integer<std::uint8_t>(p[3]);
    const auto closure = std::to_integer<std::uint8_t>(p[48]);
    const auto len = std::to_integer<std::uint8_t>(p[49]);
    if (status > static_cast<std::uint8_t>(core::EscalationStatus::Closed) ||
        reason > static_cast<std::uint8_t>(core::EscalationReason::PolicyReview) ||
        closure > static_cast<std::uint8_t>(core::ClosureKind::AutoResolved) || len > notice_stakeholder_capacity) {
        return false;
    }
    core::EscalationCase& c = out.escalation_case;
    c = core::EscalationCase{};
    c.status = static_cast<core::EscalationStatus>(status);
    c.reason = static_cast<core::EscalationReason>(reason);
    c.closure = static_cast<core::ClosureKind>(closure);
    c.level = persist::load_le32(p + 4);
    c.id = persist::load_le64(p + 8);
    c.conflict_id = persist::load_le64(p + 16);
    c.opened_at = persist::load_le64(p + 24);
    c.sla_deadline = persist::load_le64(p + 32);
    c.severity = persist::load_f64(p + 40);
    out.stakeholder_ref.assign(reinterpret_cast<const char*>(p + notice_stakeholder_offset), len);
    return true;
}

} // namespace notify
