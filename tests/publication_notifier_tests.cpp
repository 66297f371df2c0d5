#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "notify/escalation_notice.hpp"
#include "notify/publication_notifier.hpp"

namespace {

class FakePublication final : public notify::PublicationView {
public:
    std::int64_t offer(const std::uint8_t* data, std::size_t length) override {
        if (next_result <= 0) {
            return next_result;
        }
        const auto* p = reinterpret_cast<const std::byte*>(data);
        messages.emplace_back(p, p + length);
        position += static_cast<std::int64_t>(length);
        return position;
    }

    std::int64_t next_result{1};
    std::int64_t position{0};
    std::vector<std::vector<std::byte>> messages;
};

core::EscalationCase sample_case() {
    core::EscalationCase c{};
    c.id = 42;
    c.conflict_id = 7;
    c.level = 3;
    c.opened_at = 1'000;
    c.sla_deadline = 9'000;
    c.status = core::EscalationStatus::InReview;
    c.reason = core::EscalationReason::WriteContention;
    c.severity = 0.9;
    return c;
}

TEST(EscalationNoticeTest, EncodesFixedLayout) {
    notify::NoticeBuffer buf{};
    ASSERT_TRUE(notify::encode_notice("general-counsel", sample_case(), buf));

    notify::EscalationNotice notice;
    ASSERT_TRUE(notify::decode_notice(buf, notice));
    EXPECT_EQ(notice.stakeholder_ref, "general-counsel");
    EXPECT_EQ(notice.escalation_case.id, 42u);
    EXPECT_EQ(notice.escalation_case.level, 3u);
    EXPECT_EQ(notice.escalation_case.status, core::EscalationStatus::InReview);
    EXPECT_EQ(notice.escalation_case.reason, core::EscalationReason::WriteContention);
    EXPECT_EQ(notice.escalation_case.sla_deadline, 9'000u);
    EXPECT_DOUBLE_EQ(notice.escalation_case.severity, 0.9);
}

TEST(EscalationNoticeTest, RejectsWrongSizeVersionAndEnums) {
    notify::NoticeBuffer buf{};
    notify::encode_notice("desk", sample_case(), buf);
    notify::EscalationNotice notice;
    EXPECT_FALSE(notify::decode_notice(std::span<const std::byte>(buf).first(40), notice));

    auto bad_version = buf;
    bad_version[0] = std::byte{9};
    EXPECT_FALSE(notify::decode_notice(bad_version, notice));

    auto bad_status = buf;
    bad_status[2] = std::byte{17};
    EXPECT_FALSE(notify::decode_notice(bad_status, notice));
}

TEST(PublicationNotifierTest, PublishesEncodedNotice) {
    auto pub = std::make_shared<FakePublication>();
    notify::PublicationNotifier notifier(pub);
    ASSERT_TRUE(notifier.notify("compliance-desk", sample_case()));
    ASSERT_EQ(pub->messages.size(), 1u);
    ASSERT_EQ(pub->messages[0].size(), notify::notice_size);

    notify::EscalationNotice notice;
    ASSERT_TRUE(notify::decode_notice(pub->messages[0], notice));
    EXPECT_EQ(notice.stakeholder_ref, "compliance-desk");
    EXPECT_EQ(notifier.counters().published.load(), 1u);
}

TEST(PublicationNotifierTest, RejectedOfferIsAFailedDelivery) {
    auto pub = std::make_shared<FakePublication>();
    pub->next_result = -2;
    notify::PublicationNotifier notifier(pub);
    EXPECT_FALSE(notifier.notify("desk", sample_case()));
    EXPECT_EQ(notifier.counters().rejected.load(), 1u);
    EXPECT_TRUE(pub->messages.empty());

    notify::PublicationNotifier unconnected(nullptr);
    EXPECT_FALSE(unconnected.notify("desk", sample_case()));
    EXPECT_EQ(unconnected.counters().rejected.load(), 1u);
}

TEST(PublicationNotifierTest, LongStakeholderIsTruncated) {
    auto pub = std::make_shared<FakePublication>();
    notify::PublicationNotifier notifier(pub);
    const std::string longer(notify::notice_stakeholder_capacity + 10, 's');
    ASSERT_TRUE(notifier.notify(longer, sample_case()));
    EXPECT_EQ(notifier.counters().stakeholder_truncated.load(), 1u);

    notify::EscalationNotice notice;
    ASSERT_TRUE(notify::decode_notice(pub->messages[0], notice));
    EXPECT_EQ(notice.stakeholder_ref.size(), notify::notice_stakeholder_capacity);
}

} // namespace
