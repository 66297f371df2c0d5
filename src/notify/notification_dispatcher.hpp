#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include "core/engine_config.hpp"
#include "core/notifier.hpp"
#include "util/log.hpp"

namespace notify {

struct DispatchCounters {
    std::uint64_t accepted{0};
    std::uint64_t delivered{0};
    std::uint64_t retries{0};
    std::uint64_t dropped_queue_full{0};
    std::uint64_t dropped_exhausted{0}; // gave up after notify_max_attempts
    std::uint64_t dropped_on_stop{0};
};

// Fire-and-forget front for a delivery notifier. notify() only enqueues; a
// worker thread calls the target and retries failures with exponential
// backoff, each notice on its own schedule. A full queue rejects the notice
// and counts it, so the caller never waits on delivery.
class NotificationDispatcher final : public core::Notifier {
public:
    // Throws std::invalid_argument when the queue capacity or attempt bound is zero.
    NotificationDispatcher(core::Notifier& target, const core::EngineConfig& cfg);
    ~NotificationDispatcher() override;

    NotificationDispatcher(const NotificationDispatcher&) = delete;
    NotificationDispatcher& operator=(const NotificationDispatcher&) = delete;

    bool start();
    // Pending notices are dropped and counted.
    void stop();

    bool notify(const std::string& stakeholder_ref, const core::EscalationCase& escalation_case) override;

    // Waits until nothing is queued or in flight.
    bool wait_idle(std::chrono::milliseconds timeout);

    DispatchCounters counters() const;
    std::size_t pending() const;

private:
    using SteadyClock = std::chrono::steady_clock;

    struct Pending {
        std::string stakeholder_ref;
        core::EscalationCase escalation_case;
        std::uint32_t attempts{0};
    };

    std::chrono::nanoseconds backoff_for(std::uint32_t attempts) const noexcept;
    void run();

    core::Notifier& target_;
    const std::uint32_t max_attempts_;
    const std::chrono::nanoseconds initial_backoff_;
    const std::chrono::nanoseconds max_backoff_;
    const std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::multimap<SteadyClock::time_point, Pending> queue_;
    std::size_t in_flight_{0};
    bool stop_requested_{false};
    DispatchCounters counters_{};
    std::thread worker_;
    util::LogRateLimiter drop_limiter_{};
};

} // namespace notify
