#include "core/escalation_manager.hpp"

#include <algorithm>
#include <chrono>
#include <system_error>

#include "core/sla_timer.hpp"
#include "util/async_log.hpp"

namespace core {
namespace {

util::WheelTimer::Config wheel_config(const EngineConfig& cfg) {
    util::WheelTimer::Config wc{};
    wc.tick_ns = cfg.sla_tick_ns;
    return wc;
}

} // namespace

EscalationManager::EscalationManager(const EngineConfig& cfg, const util::Clock& clock, Notifier* notifier,
                                     EngineEvents* events)
    : cfg_(cfg), clock_(clock), notifier_(notifier), events_(events), wheel_(wheel_config(cfg), clock.now_ns()) {}

EscalationManager::~EscalationManager() { stop(); }

std::uint32_t EscalationManager::initial_level(double severity) const noexcept {
    const std::uint32_t level = severity >= cfg_.escalation_level2_severity ? 2u : 1u;
    return std::min(level, std::max<std::uint32_t>(1u, max_escalation_level(cfg_)));
}

std::uint64_t EscalationManager::window_for(std::uint32_t level) const noexcept {
    const std::size_t idx = std::min<std::size_t>(level == 0 ? 0 : level - 1, cfg_.sla_windows_ns.size() - 1);
    return cfg_.sla_windows_ns[idx];
}

void EscalationManager::publish(const EscalationCase& c, EscalationEventKind kind) {
    if (events_) {
        events_->on_escalation(c, kind);
    }
}

EscalationCase EscalationManager::escalate(const Conflict& conflict, EscalationReason reason, Timestamp now) {
    std::vector<Notice> notices;
    EscalationCase out{};
    {
        std::lock_guard lock(mutex_);
        const std::uint32_t wanted = initial_level(conflict.severity);

        auto open = open_by_conflict_.find(conflict.id);
        if (open != open_by_conflict_.end()) {
            EscalationCase& c = cases_.at(open->second);
            c.reason = reason;
            c.severity = conflict.severity;
            if (wanted > c.level) {
                c.level = wanted;
                levels_[c.id].push_back(c.level);
                ++counters_.raised;
                if (c.status == EscalationStatus::Open) {
                    schedule_sla_deadline(wheel_, c, now + window_for(c.level));
                }
                publish(c, EscalationEventKind::Raised);
                notices.emplace_back(c.level, c);
            }
            out = c;
        } else {
            std::uint32_t level = wanted;
            auto prev = last_level_by_conflict_.find(conflict.id);
            if (prev != last_level_by_conflict_.end()) {
                level = std::max(level, prev->second);
                ++counters_.reopened;
            }
            EscalationCase c{};
            c.id = next_id_++;
            c.conflict_id = conflict.id;
            c.level = level;
            c.opened_at = now;
            c.status = EscalationStatus::Open;
            c.reason = reason;
            c.severity = conflict.severity;
            schedule_sla_deadline(wheel_, c, now + window_for(level));
            open_by_conflict_[conflict.id] = c.id;
            levels_[c.id].push_back(level);
            ++counters_.opened;
            out = cases_.emplace(c.id, c).first->second;
            publish(out, EscalationEventKind::Opened);
            notices.emplace_back(level, out);
        }
    }
    LOG_WARM_FMT(util::LogLevel::Warn, "ESCAL", "conflict=%llu case=%llu level=%u reason=%s",
                 static_cast<unsigned long long>(conflict.id), static_cast<unsigned long long>(out.id), out.level,
                 to_string(reason));
    deliver(notices);
    return out;
}

bool EscalationManager::transition_locked(EscalationCase& c, EscalationStatus next, Timestamp now) {
    if (!is_valid_transition(c.status, next)) {
        return false;
    }
    c.status = next;
    if (next != EscalationStatus::Open) {
        cancel_sla_deadline(c);
    }
    if (next == EscalationStatus::Closed) {
        c.closed_at = now;
        open_by_conflict_.erase(c.conflict_id);
        auto& last = last_level_by_conflict_[c.conflict_id];
        last = std::max(last, c.level);
    }
    return true;
}

bool EscalationManager::acknowledge(CaseId id, Timestamp now) {
    std::lock_guard lock(mutex_);
    auto it = cases_.find(id);
    if (it == cases_.end() || !transition_locked(it->second, EscalationStatus::Acknowledged, now)) {
        return false;
    }
    publish(it->second, EscalationEventKind::Acknowledged);
    return true;
}

bool EscalationManager::start_review(CaseId id, Timestamp now) {
    std::lock_guard lock(mutex_);
    auto it = cases_.find(id);
    if (it == cases_.end() || !transition_locked(it->second, EscalationStatus::InReview, now)) {
        return false;
    }
    publish(it->second, EscalationEventKind::InReview);
    return true;
}

bool EscalationManager::close(CaseId id, ClosureKind kind, Timestamp now) {
    std::lock_guard lock(mutex_);
    auto it = cases_.find(id);
    if (it == cases_.end()) {
        return false;
    }
    EscalationCase& c = it->second;
    if (!transition_locked(c, EscalationStatus::Closed, now)) {
        return false;
    }
    c.closure = kind == ClosureKind::None ? ClosureKind::Manual : kind;
    if (c.closure == ClosureKind::AutoResolved) {
        ++counters_.closed_auto;
    } else {
        ++counters_.closed_manual;
    }
    publish(c, EscalationEventKind::Closed);
    return true;
}

bool EscalationManager::close_for_conflict(ConflictId conflict_id, ClosureKind kind, Timestamp now) {
    CaseId id = 0;
    {
        std::lock_guard lock(mutex_);
        auto it = open_by_conflict_.find(conflict_id);
        if (it == open_by_conflict_.end()) {
            return false;
        }
        id = it->second;
    }
    return close(id, kind, now);
}

std::size_t EscalationManager::poll_sla(Timestamp now) {
    std::vector<Notice> notices;
    std::size_t advanced = 0;
    {
        std::lock_guard lock(mutex_);
        const std::uint32_t cap = max_escalation_level(cfg_);
        wheel_.poll_expired(now, [&](std::uint64_t key, std::uint32_t generation) {
            auto it = cases_.find(key);
            if (it == cases_.end() || !is_timer_valid(it->second, generation)) {
                ++counters_.stale_timers;
                return;
            }
            EscalationCase& c = it->second;
            if (c.level < cap) {
                ++c.level;
                levels_[c.id].push_back(c.level);
                ++counters_.advanced;
                ++advanced;
                publish(c, EscalationEventKind::Advanced);
            } else {
                ++counters_.breaches_at_cap;
            }
            schedule_sla_deadline(wheel_, c, now + window_for(c.level));
            notices.emplace_back(c.level, c);
        });
    }
    for (const auto& [level, c] : notices) {
        LOG_WARM_FMT(util::LogLevel::Warn, "ESCAL", "SLA breach case=%llu conflict=%llu level=%u",
                     static_cast<unsigned long long>(c.id), static_cast<unsigned long long>(c.conflict_id), level);
    }
    deliver(notices);
    return advanced;
}

void EscalationManager::deliver(const std::vector<Notice>& notices) {
    if (!notifier_) {
        return;
    }
    for (const auto& [level, c] : notices) {
        std::vector<std::string> refs;
        if (level >= 1 && level - 1 < cfg_.stakeholders_per_level.size()) {
            refs = cfg_.stakeholders_per_level[level - 1];
        }
        if (refs.empty()) {
            refs.push_back("level-" + std::to_string(level));
        }
        for (const auto& ref : refs) {
            if (!notifier_->notify(ref, c)) {
                std::lock_guard lock(mutex_);
                ++counters_.notify_failures;
            }
        }
    }
}

bool EscalationManager::start() {
    std::lock_guard lock(run_mutex_);
    if (scheduler_.joinable()) {
        return true;
    }
    stop_requested_ = false;
    try {
        scheduler_ = std::thread([this] { scheduler_loop(); });
    } catch (const std::system_error&) {
        return false;
    }
    return true;
}

void EscalationManager::stop() {
    {
        std::lock_guard lock(run_mutex_);
        if (!scheduler_.joinable()) {
            return;
        }
        stop_requested_ = true;
    }
    run_cv_.notify_all();
    scheduler_.join();
}

void EscalationManager::scheduler_loop() {
    std::unique_lock lock(run_mutex_);
    while (!stop_requested_) {
        run_cv_.wait_for(lock, std::chrono::nanoseconds(cfg_.sla_tick_ns), [this] { return stop_requested_; });
        if (stop_requested_) {
            break;
        }
        lock.unlock();
        poll_sla(clock_.now_ns());
        lock.lock();
    }
}

std::optional<EscalationCase> EscalationManager::get(CaseId id) const {
    std::lock_guard lock(mutex_);
    auto it = cases_.find(id);
    if (it == cases_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<EscalationCase> EscalationManager::open_case_for(ConflictId conflict_id) const {
    std::lock_guard lock(mutex_);
    auto it = open_by_conflict_.find(conflict_id);
    if (it == open_by_conflict_.end()) {
        return std::nullopt;
    }
    return cases_.at(it->second);
}

std::vector<EscalationCase> EscalationManager::list(const std::function<bool(const EscalationCase&)>& pred) const {
    std::lock_guard lock(mutex_);
    std::vector<EscalationCase> out;
    for (const auto& [id, c] : cases_) {
        if (!pred || pred(c)) {
            out.push_back(c);
        }
    }
    return out;
}

std::vector<std::uint32_t> EscalationManager::level_history(CaseId id) const {
    std::lock_guard lock(mutex_);
    auto it = levels_.find(id);
    return it == levels_.end() ? std::vector<std::uint32_t>{} : it->second;
}

EscalationCounters EscalationManager::counters() const {
    std::lock_guard lock(mutex_);
    return counters_;
}

std::size_t EscalationManager::pending_timers() const {
    std::lock_guard lock(mutex_);
    return wheel_.total_pending();
}

} // namespace core
