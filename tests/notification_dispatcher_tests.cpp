#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

#include "notify/notification_dispatcher.hpp"
#include "test_support.hpp"

namespace {

using namespace std::chrono_literals;

core::EngineConfig fast_cfg() {
    core::EngineConfig cfg = test_support::test_config();
    cfg.notify_max_attempts = 3;
    cfg.notify_initial_backoff_ns = 1'000'000;
    cfg.notify_max_backoff_ns = 4'000'000;
    cfg.notify_queue_capacity = 8;
    return cfg;
}

core::EscalationCase make_case(core::CaseId id) {
    core::EscalationCase c{};
    c.id = id;
    c.conflict_id = id * 10;
    c.level = 1;
    return c;
}

TEST(NotificationDispatcherTest, RejectsZeroCapacityOrAttempts) {
    test_support::ScriptedNotifier target;
    auto cfg = fast_cfg();
    cfg.notify_queue_capacity = 0;
    EXPECT_THROW(notify::NotificationDispatcher(target, cfg), std::invalid_argument);
    cfg = fast_cfg();
    cfg.notify_max_attempts = 0;
    EXPECT_THROW(notify::NotificationDispatcher(target, cfg), std::invalid_argument);
}

TEST(NotificationDispatcherTest, DeliversInOrder) {
    test_support::ScriptedNotifier target;
    notify::NotificationDispatcher dispatcher(target, fast_cfg());
    ASSERT_TRUE(dispatcher.start());
    EXPECT_TRUE(dispatcher.notify("desk", make_case(1)));
    EXPECT_TRUE(dispatcher.notify("lead", make_case(2)));
    ASSERT_TRUE(dispatcher.wait_idle(2s));

    const auto notices = target.notices();
    ASSERT_EQ(notices.size(), 2u);
    EXPECT_EQ(notices[0].stakeholder, "desk");
    EXPECT_EQ(notices[1].escalation_case.id, 2u);
    const auto c = dispatcher.counters();
    EXPECT_EQ(c.accepted, 2u);
    EXPECT_EQ(c.delivered, 2u);
    EXPECT_EQ(c.retries, 0u);
    dispatcher.stop();
}

TEST(NotificationDispatcherTest, RetriesFailedDelivery) {
    test_support::ScriptedNotifier target(2);
    notify::NotificationDispatcher dispatcher(target, fast_cfg());
    ASSERT_TRUE(dispatcher.start());
    ASSERT_TRUE(dispatcher.notify("desk", make_case(1)));
    ASSERT_TRUE(dispatcher.wait_idle(2s));

    EXPECT_EQ(target.calls(), 3u);
    EXPECT_EQ(target.notices().size(), 1u);
    const auto c = dispatcher.counters();
    EXPECT_EQ(c.retries, 2u);
    EXPECT_EQ(c.delivered, 1u);
    EXPECT_EQ(c.dropped_exhausted, 0u);
}

TEST(NotificationDispatcherTest, GivesUpAfterMaxAttempts) {
    test_support::ScriptedNotifier target;
    target.set_always_fail(true);
    notify::NotificationDispatcher dispatcher(target, fast_cfg());
    ASSERT_TRUE(dispatcher.start());
    ASSERT_TRUE(dispatcher.notify("desk", make_case(1)));
    ASSERT_TRUE(dispatcher.wait_idle(2s));

    EXPECT_EQ(target.calls(), 3u);
    const auto c = dispatcher.counters();
    EXPECT_EQ(c.dropped_exhausted, 1u);
    EXPECT_EQ(c.delivered, 0u);
}

TEST(NotificationDispatcherTest, BackoffDelaysRetry) {
    test_support::ScriptedNotifier target(1);
    auto cfg = fast_cfg();
    cfg.notify_initial_backoff_ns = 30'000'000;
    cfg.notify_max_backoff_ns = 30'000'000;
    notify::NotificationDispatcher dispatcher(target, cfg);
    ASSERT_TRUE(dispatcher.start());
    const auto begin = std::chrono::steady_clock::now();
    ASSERT_TRUE(dispatcher.notify("desk", make_case(1)));
    ASSERT_TRUE(dispatcher.wait_idle(2s));
    EXPECT_GE(std::chrono::steady_clock::now() - begin, 30ms);
    EXPECT_EQ(target.notices().size(), 1u);
}

TEST(NotificationDispatcherTest, FullQueueRejectsAndStopDropsPending) {
    test_support::ScriptedNotifier target;
    auto cfg = fast_cfg();
    cfg.notify_queue_capacity = 2;
    notify::NotificationDispatcher dispatcher(target, cfg);
    EXPECT_TRUE(dispatcher.notify("a", make_case(1)));
    EXPECT_TRUE(dispatcher.notify("b", make_case(2)));
    EXPECT_FALSE(dispatcher.notify("c", make_case(3)));
    EXPECT_EQ(dispatcher.pending(), 2u);

    dispatcher.stop();
    const auto c = dispatcher.counters();
    EXPECT_EQ(c.dropped_queue_full, 1u);
    EXPECT_EQ(c.dropped_on_stop, 2u);
    EXPECT_EQ(dispatcher.pending(), 0u);
    EXPECT_EQ(target.calls(), 0u);
}

} // namespace
