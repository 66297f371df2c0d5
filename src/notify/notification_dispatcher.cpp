#include "notify/notification_dispatcher.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "util/async_log.hpp"

namespace notify {

NotificationDispatcher::NotificationDispatcher(core::Notifier& target, const core::EngineConfig& cfg)
    : target_(target)
    , max_attempts_(cfg.notify_max_attempts)
    , initial_backoff_(static_cast<std::int64_t>(cfg.notify_initial_backoff_ns))
    , max_backoff_(static_cast<std::int64_t>(std::max(cfg.notify_max_backoff_ns, cfg.notify_initial_backoff_ns)))
    , capacity_(cfg.notify_queue_capacity) {
    if (capacity_ == 0 || max_attempts_ == 0) {
        throw std::invalid_argument("notification dispatcher needs a queue and at least one attempt");
    }
}

NotificationDispatcher::~NotificationDispatcher() { stop(); }

bool NotificationDispatcher::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_.joinable()) {
        return true;
    }
    stop_requested_ = false;
    try {
        worker_ = std::thread([this] { run(); });
    } catch (const std::system_error& e) {
        LOG_SLOW_ERROR("notification dispatcher: failed to start worker: %s", e.what());
        return false;
    }
    return true;
}

void NotificationDispatcher::stop() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
        worker = std::move(worker_);
    }
    cv_.notify_all();
    if (worker.joinable()) {
        worker.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!queue_.empty()) {
        counters_.dropped_on_stop += queue_.size();
        LOG_SLOW_WARN("notification dispatcher: dropped %zu pending notices on stop", queue_.size());
        queue_.clear();
    }
    idle_cv_.notify_all();
}

bool NotificationDispatcher::notify(const std::string& stakeholder_ref, const core::EscalationCase& escalation_case) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() + in_flight_ >= capacity_) {
            ++counters_.dropped_queue_full;
            if (drop_limiter_.should_log(SteadyClock::now())) {
                LOG_WARM_FMT(util::LogLevel::Warn, "NOTIFY", "queue full, dropping notice case=%llu stakeholder=%s",
                             static_cast<unsigned long long>(escalation_case.id), stakeholder_ref.c_str());
            }
            return false;
        }
        queue_.emplace(SteadyClock::now(), Pending{stakeholder_ref, escalation_case, 0});
        ++counters_.accepted;
    }
    cv_.notify_one();
    return true;
}

std::chrono::nanoseconds NotificationDispatcher::backoff_for(std::uint32_t attempts) const noexcept {
    auto delay = initial_backoff_;
    for (std::uint32_t i = 1; i < attempts && delay < max_backoff_; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_backoff_);
}

void NotificationDispatcher::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        if (queue_.empty()) {
            cv_.wait(lock, [this] { return stop_requested_ || !queue_.empty(); });
            continue;
        }
        const auto due = queue_.begin()->first;
        if (SteadyClock::now() < due) {
            cv_.wait_until(lock, due);
            continue;
        }
        Pending item = std::move(queue_.begin()->second);
        queue_.erase(queue_.begin());
        ++in_flight_;
        lock.unlock();

        const bool ok = target_.notify(item.stakeholder_ref, item.escalation_case);
        ++item.attempts;

        lock.lock();
        --in_flight_;
        if (ok) {
            ++counters_.delivered;
        } else if (item.attempts >= max_attempts_) {
            ++counters_.dropped_exhausted;
            LOG_WARM_FMT(util::LogLevel::Error, "NOTIFY", "giving up case=%llu stakeholder=%s after %u attempts",
                         static_cast<unsigned long long>(item.escalation_case.id), item.stakeholder_ref.c_str(),
                         item.attempts);
        } else {
            ++counters_.retries;
            const auto next = SteadyClock::now() + backoff_for(item.attempts);
            queue_.emplace(next, std::move(item));
        }
        if (queue_.empty() && in_flight_ == 0) {
            idle_cv_.notify_all();
        }
    }
}

bool NotificationDispatcher::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return queue_.empty() && in_flight_ == 0; });
}

DispatchCounters NotificationDispatcher::counters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_;
}

std::size_t NotificationDispatcher::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size() + in_flight_;
}

} // namespace notify
