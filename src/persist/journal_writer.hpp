#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "core/engine_events.hpp"
#include "persist/file_sink.hpp"
#include "persist/journal_format.hpp"
#include "util/log.hpp"
#include "util/mpmc_ring.hpp"

namespace persist {

struct JournalConfig {
    std::filesystem::path output_dir{"./journal"};
    std::size_t rotate_max_bytes{64 * 1024 * 1024};
    std::chrono::seconds rotate_interval{std::chrono::hours(1)};
    std::size_t batch_max_records{64};
    std::size_t batch_max_bytes{256 * 1024};
    std::chrono::milliseconds flush_idle_timeout{10};
    std::size_t staging_buffer_bytes{1024 * 1024};
    std::size_t ring_capacity_pow2{4096};
    bool sync_on_flush{false};
    std::chrono::milliseconds initial_recovery_backoff{1000};
    std::chrono::milliseconds max_recovery_backoff{30000};
};

// Durable sink for engine events. Producers (resolver, escalation manager)
// encode a frame and push it onto a bounded ring without blocking; one
// background thread batches frames into size/time rotated files. On I/O
// failure the writer degrades: frames are dropped and counted while it retries
// the open with exponential backoff.
class JournalWriter final : public core::EngineEvents {
public:
    // Throws std::invalid_argument when ring_capacity_pow2 is not a power of two.
    JournalWriter(JournalCounters& counters, JournalConfig cfg, std::unique_ptr<IFileSink> sink = nullptr);
    ~JournalWriter() override;

    JournalWriter(const JournalWriter&) = delete;
    JournalWriter& operator=(const JournalWriter&) = delete;

    bool start();
    // Drains the ring, flushes and closes the current file.
    void stop();
    bool is_running() const noexcept { return running_.load(std::memory_order_acquire); }
    bool degraded() const noexcept { return degraded_flag_.load(std::memory_order_acquire); }

    void on_resolution(const core::ResolutionRecord& record) override;
    void on_revert(const core::ResolutionRecord& record) override;
    void on_escalation(const core::EscalationCase& escalation_case, core::EscalationEventKind kind) override;

    // Files opened so far, in order.
    std::vector<std::filesystem::path> files() const;

private:
    void enqueue(const JournalFrame& frame, bool encoded);
    void run();
    void flush_batch();
    bool ensure_file_ready(std::size_t next_record_size);
    bool open_new_file(std::chrono::steady_clock::time_point now);
    bool writev_fully(const struct iovec* iov, int iovcnt);
    void enter_degraded(const char* reason);
    void maybe_recover(std::chrono::steady_clock::time_point now);
    void drain_and_drop();
    void append(const JournalFrame& frame);

    JournalCounters& counters_;
    JournalConfig cfg_;
    std::unique_ptr<IFileSink> sink_;
    util::BoundedMpmcRing<JournalFrame> ring_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_{false};
    std::atomic<bool> degraded_flag_{false};
    std::thread thread_;

    std::vector<std::byte> staging_;
    std::size_t staging_used_{0};
    std::size_t batch_records_{0};

    std::chrono::steady_clock::time_point last_flush_time_;
    std::chrono::steady_clock::time_point last_rotate_time_;
    util::LogRateLimiter error_limiter_{};
    std::uint64_t file_seq_{0};

    bool degraded_{false};
    std::chrono::steady_clock::time_point degraded_enter_;
    std::chrono::steady_clock::time_point next_recovery_attempt_;
    std::chrono::milliseconds recovery_backoff_{1000};

    std::mutex drop_log_mutex_;
    util::LogRateLimiter drop_limiter_{};

    mutable std::mutex files_mutex_;
    std::vector<std::filesystem::path> files_;
};

} // namespace persist
