#include "persist/journal_format.hpp"

#include <algorithm>
#include <cstddef>
#include <string_view>

#include "persist/byte_codec.hpp"
#include "util/crc32c.hpp"

namespace persist {
namespace {

class FrameWriter {
public:
    explicit FrameWriter(JournalFrame& f) noexcept : f_(f) { f_.size = static_cast<std::uint32_t>(header_size); }

    void u8(std::uint8_t v) noexcept {
        if (fits(1)) {
            f_.bytes[f_.size++] = static_cast<std::byte>(v);
        }
    }
    void u16(std::uint16_t v) noexcept {
        if (fits(2)) {
            store_le16(v, f_.bytes.data() + f_.size);
            f_.size += 2;
        }
    }
    void u32(std::uint32_t v) noexcept {
        if (fits(4)) {
            store_le32(v, f_.bytes.data() + f_.size);
            f_.size += 4;
        }
    }
    void u64(std::uint64_t v) noexcept {
        if (fits(8)) {
            store_le64(v, f_.bytes.data() + f_.size);
            f_.size += 8;
        }
    }
    void f64(double v) noexcept {
        if (fits(8)) {
            store_f64(v, f_.bytes.data() + f_.size);
            f_.size += 8;
        }
    }
    // Returns false when the value had to be cut to journal_max_string.
    bool str(std::string_view s) noexcept {
        const std::size_t n = std::min(s.size(), journal_max_string);
        u16(static_cast<std::uint16_t>(n));
        if (fits(n)) {
            std::transform(s.begin(), s.begin() + static_cast<std::ptrdiff_t>(n), f_.bytes.begin() + f_.size,
                           [](char c) { return static_cast<std::byte>(c); });
            f_.size += static_cast<std::uint32_t>(n);
        }
        return n == s.size();
    }

    // Writes header and CRC around the payload written so far.
    bool seal(JournalRecordType type) noexcept {
        if (overflow_ || !fits(trailer_size)) {
            return false;
        }
        const auto payload_len = static_cast<std::uint32_t>(f_.size - header_size);
        std::byte* base = f_.bytes.data();
        store_le32(static_cast<std::uint32_t>(type), base);
        store_le32(payload_len, base + 4);
        const std::uint32_t crc = util::Crc32c::compute(base, header_size + payload_len);
        store_le32(crc, base + f_.size);
        f_.size += static_cast<std::uint32_t>(trailer_size);
        return true;
    }

private:
    bool fits(std::size_t n) noexcept {
        if (f_.size + n > f_.bytes.size()) {
            overflow_ = true;
            return false;
        }
        return true;
    }

    JournalFrame& f_;
    bool overflow_{false};
};

class PayloadReader {
public:
    explicit PayloadReader(std::span<const std::byte> p) noexcept : p_(p) {}

    bool ok() const noexcept { return ok_; }
    bool done() const noexcept { return ok_ && pos_ == p_.size(); }

    std::uint8_t u8() noexcept {
        if (!need(1)) return 0;
        return static_cast<std::uint8_t>(p_[pos_++]);
    }
    std::uint16_t u16() noexcept {
        if (!need(2)) return 0;
        const auto v = load_le16(p_.data() + pos_);
        pos_ += 2;
        return v;
    }
    std::uint32_t u32() noexcept {
        if (!need(4)) return 0;
        const auto v = load_le32(p_.data() + pos_);
        pos_ += 4;
        return v;
    }
    std::uint64_t u64() noexcept {
        if (!need(8)) return 0;
        const auto v = load_le64(p_.data() + pos_);
        pos_ += 8;
        return v;
    }
    double f64() noexcept {
        if (!need(8)) return 0.0;
        const auto v = load_f64(p_.data() + pos_);
        pos_ += 8;
        return v;
    }
    std::string str() {
        const std::size_t n = u16();
        if (n > journal_max_string || !need(n)) {
            ok_ = false;
            return {};
        }
        std::string out(reinterpret_cast<const char*>(p_.data() + pos_), n);
        pos_ += n;
        return out;
    }

private:
    bool need(std::size_t n) noexcept {
        if (!ok_ || pos_ + n > p_.size()) {
            ok_ = false;
            return false;
        }
        return true;
    }

    std::span<const std::byte> p_;
    std::size_t pos_{0};
    bool ok_{true};
};

template <typename E>
bool enum_in_range(std::uint8_t raw, std::size_t count, E& out) noexcept {
    if (raw >= count) {
        return false;
    }
    out = static_cast<E>(raw);
    return true;
}

void note_truncation(bool complete, JournalCounters* counters) noexcept {
    if (!complete && counters) {
        counters->strings_truncated.fetch_add(1, std::memory_order_relaxed);
    }
}

DecodeError decode_resolution(std::span<const std::byte> payload, JournalResolution& r) {
    PayloadReader in(payload);
    in.u16(); // schema, checked by the caller
    const std::uint8_t type = in.u8();
    const std::uint8_t strategy = in.u8();
    const std::uint8_t outcome = in.u8();
    const std::uint8_t reason = in.u8();
    const bool enums_ok = enum_in_range(type, core::kConflictTypeCount, r.conflict_type) &&
                          enum_in_range(strategy, core::kStrategyKindCount, r.strategy) &&
                          enum_in_range(outcome, 3, r.outcome) && enum_in_range(reason, core::kReasonCodeCount, r.reason);
    r.record_id = in.u64();
    r.conflict_id = in.u64();
    r.confidence = in.f64();
    r.raw_confidence = in.f64();
    r.prior = in.f64();
    r.prior_samples = in.u64();
    r.applied_at = in.u64();
    r.jurisdiction_bucket = in.str();
    r.winner = in.str();
    r.delegate = in.str();
    if (!in.done()) {
        return DecodeError::InvalidLength;
    }
    return enums_ok ? DecodeError::Ok : DecodeError::InvalidEnum;
}

DecodeError decode_revert(std::span<const std::byte> payload, JournalRevert& r) {
    PayloadReader in(payload);
    in.u16();
    const std::uint8_t type = in.u8();
    const std::uint8_t strategy = in.u8();
    const bool enums_ok = enum_in_range(type, core::kConflictTypeCount, r.conflict_type) &&
                          enum_in_range(strategy, core::kStrategyKindCount, r.strategy);
    r.record_id = in.u64();
    r.conflict_id = in.u64();
    r.reverted_at = in.u64();
    r.jurisdiction_bucket = in.str();
    if (!in.done()) {
        return DecodeError::InvalidLength;
    }
    return enums_ok ? DecodeError::Ok : DecodeError::InvalidEnum;
}

DecodeError decode_escalation(std::span<const std::byte> payload, JournalEscalation& e) {
    if (payload.size() != escalation_payload_v1_size) {
        return DecodeError::InvalidLength;
    }
    PayloadReader in(payload);
    in.u16();
    const std::uint8_t kind = in.u8();
    const std::uint8_t status = in.u8();
    const std::uint8_t reason = in.u8();
    const std::uint8_t closure = in.u8();
    const bool enums_ok = enum_in_range(kind, 6, e.kind) && enum_in_range(status, 4, e.status) &&
                          enum_in_range(reason, 5, e.reason) && enum_in_range(closure, 3, e.closure);
    e.level = in.u32();
    e.case_id = in.u64();
    e.conflict_id = in.u64();
    e.opened_at = in.u64();
    e.closed_at = in.u64();
    e.sla_deadline = in.u64();
    e.severity = in.f64();
    if (!in.done()) {
        return DecodeError::InvalidLength;
    }
    return enums_ok ? DecodeError::Ok : DecodeError::InvalidEnum;
}

} // namespace

bool encode_resolution_record(const core::ResolutionRecord& rec, JournalFrame& out,
                              JournalCounters* counters) noexcept {
    FrameWriter w(out);
    w.u16(journal_schema_version_v1);
    w.u8(static_cast<std::uint8_t>(rec.conflict_type));
    w.u8(static_cast<std::uint8_t>(core::kind_of(rec.strategy)));
    w.u8(static_cast<std::uint8_t>(rec.outcome));
    w.u8(static_cast<std::uint8_t>(rec.rationale.reason));
    w.u64(rec.id);
    w.u64(rec.conflict_id);
    w.f64(rec.confidence);
    w.f64(rec.rationale.raw_confidence);
    w.f64(rec.rationale.prior);
    w.u64(rec.rationale.prior_samples);
    w.u64(rec.applied_at);
    note_truncation(w.str(rec.jurisdiction_bucket), counters);
    note_truncation(w.str(rec.rationale.winner.value_or(std::string{})), counters);
    note_truncation(w.str(rec.rationale.delegate), counters);
    return w.seal(JournalRecordType::Resolution);
}

bool encode_revert_record(const core::ResolutionRecord& rec, JournalFrame& out, JournalCounters* counters) noexcept {
    FrameWriter w(out);
    w.u16(journal_schema_version_v1);
    w.u8(static_cast<std::uint8_t>(rec.conflict_type));
    w.u8(static_cast<std::uint8_t>(core::kind_of(rec.strategy)));
    w.u64(rec.id);
    w.u64(rec.conflict_id);
    w.u64(rec.reverted_at);
    note_truncation(w.str(rec.jurisdiction_bucket), counters);
    return w.seal(JournalRecordType::Revert);
}

bool encode_escalation_record(const core::EscalationCase& c, core::EscalationEventKind kind,
                              JournalFrame& out) noexcept {
    FrameWriter w(out);
    w.u16(journal_schema_version_v1);
    w.u8(static_cast<std::uint8_t>(kind));
    w.u8(static_cast<std::uint8_t>(c.status));
    w.u8(static_cast<std::uint8_t>(c.reason));
    w.u8(static_cast<std::uint8_t>(c.closure));
    w.u32(c.level);
    w.u64(c.id);
    w.u64(c.conflict_id);
    w.u64(c.opened_at);
    w.u64(c.closed_at);
    w.u64(c.sla_deadline);
    w.f64(c.severity);
    return w.seal(JournalRecordType::Escalation);
}

DecodeError decode_record(std::span<const std::byte> data, DecodedJournalRecord& out, JournalCounters* counters) {
    auto count = [counters](std::atomic<std::uint64_t> JournalCounters::*field) {
        if (counters) {
            (counters->*field).fetch_add(1, std::memory_order_relaxed);
        }
    };

    if (data.size() < header_size) {
        count(&JournalCounters::parse_errors_truncated);
        return DecodeError::TruncatedAtEnd;
    }
    const std::byte* header = data.data();
    const std::uint32_t type_raw = load_le32(header);
    const std::uint32_t payload_len = load_le32(header + 4);
    if (payload_len > journal_max_frame) {
        count(&JournalCounters::parse_errors_invalid_length);
        return DecodeError::InvalidLength;
    }
    const std::size_t total = record_size_from_payload(payload_len);
    if (data.size() < total) {
        count(&JournalCounters::parse_errors_truncated);
        return DecodeError::TruncatedAtEnd;
    }
    const auto type = static_cast<JournalRecordType>(type_raw);
    if (type != JournalRecordType::Resolution && type != JournalRecordType::Revert &&
        type != JournalRecordType::Escalation) {
        count(&JournalCounters::parse_errors_invalid_type);
        return DecodeError::InvalidType;
    }
    const std::byte* payload = header + header_size;
    const std::uint32_t crc_expected = load_le32(payload + payload_len);
    if (crc_expected != util::Crc32c::compute(header, header_size + payload_len)) {
        count(&JournalCounters::parse_errors_crc);
        return DecodeError::InvalidCrc;
    }
    if (payload_len < sizeof(std::uint16_t)) {
        count(&JournalCounters::parse_errors_invalid_length);
        return DecodeError::InvalidLength;
    }

    out = {};
    out.type = type;
    out.payload_len = payload_len;
    out.schema_version = load_le16(payload);
    if (out.schema_version != journal_schema_version_v1) {
        count(&JournalCounters::parse_errors_version_mismatch);
        return DecodeError::VersionMismatch;
    }

    const std::span<const std::byte> body(payload, payload_len);
    DecodeError err = DecodeError::Ok;
    switch (type) {
    case JournalRecordType::Resolution:
        err = payload_len < resolution_fixed_v1_size ? DecodeError::InvalidLength
                                                     : decode_resolution(body, out.resolution);
        break;
    case JournalRecordType::Revert:
        err = payload_len < revert_fixed_v1_size ? DecodeError::InvalidLength : decode_revert(body, out.revert);
        break;
    case JournalRecordType::Escalation:
        err = decode_escalation(body, out.escalation);
        break;
    case JournalRecordType::Reserved:
        err = DecodeError::InvalidType;
        break;
    }
    if (err == DecodeError::InvalidLength) {
        count(&JournalCounters::parse_errors_invalid_length);
    }
    return err;
}

} // namespace persist
