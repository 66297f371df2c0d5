#include <gtest/gtest.h>

#include <string>

#include "journal_test_support.hpp"
#include "persist/byte_codec.hpp"
#include "persist/journal_format.hpp"
#include "util/crc32c.hpp"

namespace {

using namespace journal_test;

TEST(JournalFormatTest, ResolutionRecordDecodes) {
    persist::JournalFrame frame{};
    ASSERT_TRUE(persist::encode_resolution_record(resolution(5, core::ResolutionOutcome::Applied), frame));

    persist::DecodedJournalRecord rec{};
    ASSERT_EQ(persist::decode_record(frame.view(), rec), persist::DecodeError::Ok);
    EXPECT_EQ(rec.type, persist::JournalRecordType::Resolution);
    EXPECT_EQ(rec.schema_version, persist::journal_schema_version_v1);
    EXPECT_EQ(persist::record_size_from_payload(rec.payload_len), frame.size);
    EXPECT_EQ(rec.resolution.record_id, 5u);
    EXPECT_EQ(rec.resolution.conflict_id, 105u);
    EXPECT_EQ(rec.resolution.conflict_type, core::ConflictType::Hierarchical);
    EXPECT_EQ(rec.resolution.strategy, core::StrategyKind::LexSuperior);
    EXPECT_EQ(rec.resolution.reason, core::ReasonCode::HigherAuthority);
    EXPECT_DOUBLE_EQ(rec.resolution.confidence, 0.92);
    EXPECT_DOUBLE_EQ(rec.resolution.raw_confidence, 0.95);
    EXPECT_EQ(rec.resolution.prior_samples, 12u);
    EXPECT_EQ(rec.resolution.jurisdiction_bucket, "eu");
    EXPECT_EQ(rec.resolution.winner, "GDPR-33");
    EXPECT_TRUE(rec.resolution.delegate.empty());
}

TEST(JournalFormatTest, RevertAndEscalationDecode) {
    auto r = resolution(9, core::ResolutionOutcome::Reverted);
    r.reverted_at = 4242;
    persist::JournalFrame frame{};
    ASSERT_TRUE(persist::encode_revert_record(r, frame));
    persist::DecodedJournalRecord rec{};
    ASSERT_EQ(persist::decode_record(frame.view(), rec), persist::DecodeError::Ok);
    EXPECT_EQ(rec.type, persist::JournalRecordType::Revert);
    EXPECT_EQ(rec.revert.record_id, 9u);
    EXPECT_EQ(rec.revert.reverted_at, 4242u);

    ASSERT_TRUE(persist::encode_escalation_record(escalation_case(3), core::EscalationEventKind::Advanced, frame));
    ASSERT_EQ(persist::decode_record(frame.view(), rec), persist::DecodeError::Ok);
    EXPECT_EQ(rec.type, persist::JournalRecordType::Escalation);
    EXPECT_EQ(rec.payload_len, persist::escalation_payload_v1_size);
    EXPECT_EQ(rec.escalation.kind, core::EscalationEventKind::Advanced);
    EXPECT_EQ(rec.escalation.status, core::EscalationStatus::Acknowledged);
    EXPECT_EQ(rec.escalation.reason, core::EscalationReason::ApplyFailed);
    EXPECT_EQ(rec.escalation.level, 2u);
    EXPECT_EQ(rec.escalation.sla_deadline, 2000u);
    EXPECT_DOUBLE_EQ(rec.escalation.severity, 0.85);
}

TEST(JournalFormatTest, LongStringsAreTruncatedAndCounted) {
    persist::JournalCounters counters;
    auto r = resolution(1, core::ResolutionOutcome::Applied, std::string(200, 'b'));
    persist::JournalFrame frame{};
    ASSERT_TRUE(persist::encode_resolution_record(r, frame, &counters));
    EXPECT_EQ(counters.strings_truncated.load(), 1u);

    persist::DecodedJournalRecord rec{};
    ASSERT_EQ(persist::decode_record(frame.view(), rec), persist::DecodeError::Ok);
    EXPECT_EQ(rec.resolution.jurisdiction_bucket.size(), persist::journal_max_string);
}

TEST(JournalFormatTest, FlippedByteFailsCrc) {
    persist::JournalFrame frame{};
    ASSERT_TRUE(persist::encode_resolution_record(resolution(1, core::ResolutionOutcome::Applied), frame));
    frame.bytes[persist::header_size + 10] ^= std::byte{0x01};

    persist::JournalCounters counters;
    persist::DecodedJournalRecord rec{};
    EXPECT_EQ(persist::decode_record(frame.view(), rec, &counters), persist::DecodeError::InvalidCrc);
    EXPECT_EQ(counters.parse_errors_crc.load(), 1u);
}

TEST(JournalFormatTest, ShortBufferIsTruncated) {
    persist::JournalFrame frame{};
    ASSERT_TRUE(persist::encode_resolution_record(resolution(1, core::ResolutionOutcome::Applied), frame));
    persist::DecodedJournalRecord rec{};
    EXPECT_EQ(persist::decode_record(frame.view().first(frame.size - 1), rec), persist::DecodeError::TruncatedAtEnd);
    EXPECT_EQ(persist::decode_record(frame.view().first(3), rec), persist::DecodeError::TruncatedAtEnd);
    EXPECT_TRUE(persist::is_graceful_eof(persist::DecodeError::TruncatedAtEnd));
}

TEST(JournalFormatTest, UnknownTypeAndSchemaAreRejected) {
    persist::JournalFrame frame{};
    ASSERT_TRUE(persist::encode_revert_record(resolution(1, core::ResolutionOutcome::Reverted), frame));

    persist::JournalFrame bad_type = frame;
    persist::store_le32(9, bad_type.bytes.data());
    persist::DecodedJournalRecord rec{};
    EXPECT_EQ(persist::decode_record(bad_type.view(), rec), persist::DecodeError::InvalidType);

    // Schema v2 with a valid CRC.
    persist::JournalFrame v2 = frame;
    persist::store_le16(2, v2.bytes.data() + persist::header_size);
    const std::size_t crc_at = v2.size - persist::trailer_size;
    persist::store_le32(util::Crc32c::compute(v2.bytes.data(), crc_at), v2.bytes.data() + crc_at);
    persist::JournalCounters counters;
    EXPECT_EQ(persist::decode_record(v2.view(), rec, &counters), persist::DecodeError::VersionMismatch);
    EXPECT_EQ(counters.parse_errors_version_mismatch.load(), 1u);
}

TEST(JournalFormatTest, OversizedLengthIsInvalid) {
    persist::JournalFrame frame{};
    ASSERT_TRUE(persist::encode_revert_record(resolution(1, core::ResolutionOutcome::Reverted), frame));
    persist::store_le32(persist::journal_max_frame + 1, frame.bytes.data() + 4);
    persist::DecodedJournalRecord rec{};
    EXPECT_EQ(persist::decode_record(frame.view(), rec), persist::DecodeError::InvalidLength);
}

} // namespace
