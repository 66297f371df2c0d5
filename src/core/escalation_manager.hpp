#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "core/conflict.hpp"
#include "core/engine_config.hpp"
#include "core/engine_events.hpp"
#include "core/escalation.hpp"
#include "core/notifier.hpp"
#include "util/clock.hpp"
#include "util/wheel_timer.hpp"

namespace core {

struct EscalationCounters {
    std::uint64_t opened{0};
    std::uint64_t reopened{0};       // new case after a Closed one for the same conflict
    std::uint64_t raised{0};
    std::uint64_t advanced{0};
    std::uint64_t breaches_at_cap{0}; // SLA expired at the highest level
    std::uint64_t stale_timers{0};
    std::uint64_t closed_manual{0};
    std::uint64_t closed_auto{0};
    std::uint64_t notify_failures{0};
};

// Owns escalation cases and their SLA timers. Transitions are the source of
// truth; notifications are handed to the notifier afterwards and their result
// never changes a case.
class EscalationManager {
public:
    // notifier and events may be null.
    EscalationManager(const EngineConfig& cfg, const util::Clock& clock, Notifier* notifier,
                      EngineEvents* events = nullptr);
    ~EscalationManager();

    EscalationManager(const EscalationManager&) = delete;
    EscalationManager& operator=(const EscalationManager&) = delete;

    // Opens a case for the conflict, or returns the existing open one (raising
    // its level if the conflict's severity now warrants more).
    EscalationCase escalate(const Conflict& conflict, EscalationReason reason, Timestamp now);

    bool acknowledge(CaseId id, Timestamp now);
    bool start_review(CaseId id, Timestamp now);
    bool close(CaseId id, ClosureKind kind, Timestamp now);

    // Closes the open case for a conflict that has since been auto-resolved.
    bool close_for_conflict(ConflictId conflict_id, ClosureKind kind, Timestamp now);

    // Fires due SLA timers; returns the number of cases advanced.
    std::size_t poll_sla(Timestamp now);

    // Scheduler thread polling on the configured tick.
    bool start();
    void stop();

    std::optional<EscalationCase> get(CaseId id) const;
    std::optional<EscalationCase> open_case_for(ConflictId conflict_id) const;
    std::vector<EscalationCase> list(const std::function<bool(const EscalationCase&)>& pred) const;
    std::vector<std::uint32_t> level_history(CaseId id) const;

    EscalationCounters counters() const;
    std::size_t pending_timers() const;

    std::uint32_t initial_level(double severity) const noexcept;

private:
    using Notice = std::pair<std::uint32_t, EscalationCase>; // (level, snapshot)

    std::uint64_t window_for(std::uint32_t level) const noexcept;
    bool transition_locked(EscalationCase& c, EscalationStatus next, Timestamp now);
    void deliver(const std::vector<Notice>& notices);
    void publish(const EscalationCase& c, EscalationEventKind kind);
    void scheduler_loop();

    const EngineConfig& cfg_;
    const util::Clock& clock_;
    Notifier* notifier_;
    EngineEvents* events_;

    mutable std::mutex mutex_;
    util::WheelTimer wheel_;
    std::map<CaseId, EscalationCase> cases_;
    std::map<ConflictId, CaseId> open_by_conflict_;
    std::map<ConflictId, std::uint32_t> last_level_by_conflict_;
    std::map<CaseId, std::vector<std::uint32_t>> levels_;
    CaseId next_id_{1};
    EscalationCounters counters_{};

    std::mutex run_mutex_;
    std::condition_variable run_cv_;
    bool stop_requested_{false};
    std::thread scheduler_;
};

} // namespace core
