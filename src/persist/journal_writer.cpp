#include "persist/journal_writer.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "util/async_log.hpp"

namespace persist {
namespace {

constexpr std::chrono::milliseconds kIdleSleep{1};

std::string format_filename(std::chrono::system_clock::time_point tp, std::uint64_t seq) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << journal_filename_prefix();
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S") << "_seq" << std::setw(3) << std::setfill('0') << seq << ".bin";
    return oss.str();
}

} // namespace

JournalWriter::JournalWriter(JournalCounters& counters, JournalConfig cfg, std::unique_ptr<IFileSink> sink)
    : counters_(counters),
      cfg_(std::move(cfg)),
      sink_(std::move(sink)),
      staging_(std::max(cfg_.staging_buffer_bytes, record_size_from_payload(journal_max_frame)), std::byte{0}),
      recovery_backoff_(cfg_.initial_recovery_backoff) {
    if (!ring_.init(cfg_.ring_capacity_pow2)) {
        throw std::invalid_argument("journal ring capacity must be a power of two");
    }
    if (!sink_) {
        sink_ = std::make_unique<PosixFileSink>(cfg_.sync_on_flush);
    }
}

JournalWriter::~JournalWriter() { stop(); }

bool JournalWriter::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return true;
    }
    stop_.store(false, std::memory_order_release);
    last_flush_time_ = std::chrono::steady_clock::now();
    last_rotate_time_ = last_flush_time_;
    try {
        thread_ = std::thread([this] { run(); });
    } catch (const std::system_error& e) {
        util::log(util::LogLevel::Error, "JournalWriter: thread start failed: %s", e.what());
        running_.store(false, std::memory_order_release);
        return false;
    }
    return true;
}

void JournalWriter::stop() {
    stop_.store(true, std::memory_order_release);
    if (thread_.joinable()) {
        thread_.join();
    }
    running_.store(false, std::memory_order_release);
}

void JournalWriter::enqueue(const JournalFrame& frame, bool encoded) {
    if (!encoded) {
        counters_.io_errors.fetch_add(1, std::memory_order_relaxed);
        return;
    }
    if (ring_.try_push(frame)) {
        return;
    }
    counters_.drop_ring_full.fetch_add(1, std::memory_order_relaxed);
    bool log_now = false;
    {
        std::lock_guard lock(drop_log_mutex_);
        log_now = drop_limiter_.should_log(std::chrono::steady_clock::now());
    }
    if (log_now) {
        LOG_WARM_FMT(util::LogLevel::Warn, "JOURNAL", "ring full, dropped=%llu",
                     static_cast<unsigned long long>(counters_.drop_ring_full.load(std::memory_order_relaxed)));
    }
}

void JournalWriter::on_resolution(const core::ResolutionRecord& record) {
    JournalFrame frame{};
    const bool ok = encode_resolution_record(record, frame, &counters_);
    enqueue(frame, ok);
}

void JournalWriter::on_revert(const core::ResolutionRecord& record) {
    JournalFrame frame{};
    const bool ok = encode_revert_record(record, frame, &counters_);
    enqueue(frame, ok);
}

void JournalWriter::on_escalation(const core::EscalationCase& escalation_case, core::EscalationEventKind kind) {
    JournalFrame frame{};
    const bool ok = encode_escalation_record(escalation_case, kind, frame);
    enqueue(frame, ok);
}

std::vector<std::filesystem::path> JournalWriter::files() const {
    std::lock_guard lock(files_mutex_);
    return files_;
}

void JournalWriter::run() {
    if (!open_new_file(std::chrono::steady_clock::now())) {
        enter_degraded("initial open failed");
    }

    while (!(stop_.load(std::memory_order_acquire) && ring_.empty_approx())) {
        bool consumed = false;
        JournalFrame frame{};
        while (!degraded_ && ring_.try_pop(frame)) {
            append(frame);
            consumed = true;
            if (batch_records_ >= cfg_.batch_max_records || staging_used_ >= cfg_.batch_max_bytes) {
                flush_batch();
            }
        }

        const auto now = std::chrono::steady_clock::now();
        if (!degraded_) {
            if (staging_used_ > 0 && now - last_flush_time_ >= cfg_.flush_idle_timeout) {
                flush_batch();
            }
            if (now - last_rotate_time_ >= cfg_.rotate_interval && sink_->is_open()) {
                flush_batch();
                sink_->close();
                if (!degraded_ && !open_new_file(now)) {
                    enter_degraded("periodic rotate failed");
                }
            }
        } else {
            drain_and_drop();
            maybe_recover(now);
        }

        if (!consumed) {
            std::this_thread::sleep_for(kIdleSleep);
        }
    }

    if (!degraded_ && staging_used_ > 0) {
        flush_batch();
    }
    if (sink_->is_open()) {
        sink_->close();
    }
    if (degraded_) {
        counters_.degraded_mode_time_ns.fetch_add(
            static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                           std::chrono::steady_clock::now() - degraded_enter_)
                                           .count()),
            std::memory_order_relaxed);
    }
}

bool JournalWriter::open_new_file(std::chrono::steady_clock::time_point now) {
    std::error_code ec;
    std::filesystem::create_directories(cfg_.output_dir, ec);
    if (ec) {
        if (error_limiter_.should_log(std::chrono::steady_clock::now())) {
            util::log(util::LogLevel::Error, "JournalWriter: failed to create dir %s: %s",
                      cfg_.output_dir.string().c_str(), ec.message().c_str());
        }
        return false;
    }
    const auto path = cfg_.output_dir / format_filename(std::chrono::system_clock::now(), file_seq_++);
    const auto res = sink_->open(path.string());
    if (!res.ok) {
        if (error_limiter_.should_log(std::chrono::steady_clock::now())) {
            util::log(util::LogLevel::Error, "JournalWriter: open(%s) failed: %d", path.string().c_str(),
                      res.error_code);
        }
        return false;
    }
    {
        std::lock_guard lock(files_mutex_);
        files_.push_back(path);
    }
    counters_.files_opened.fetch_add(1, std::memory_order_relaxed);
    last_rotate_time_ = now;
    return true;
}

void JournalWriter::flush_batch() {
    if (!sink_->is_open() || staging_used_ == 0) {
        staging_used_ = 0;
        batch_records_ = 0;
        return;
    }

    struct iovec iov{staging_.data(), staging_used_};
    const std::size_t records = batch_records_;
    staging_used_ = 0;
    batch_records_ = 0;
    if (!writev_fully(&iov, 1)) {
        enter_degraded("write failure");
        return;
    }
    if (cfg_.sync_on_flush) {
        const auto res = sink_->sync();
        if (!res.ok) {
            counters_.io_errors.fetch_add(1, std::memory_order_relaxed);
            enter_degraded("sync failure");
            return;
        }
    }
    counters_.records_written.fetch_add(records, std::memory_order_relaxed);
    last_flush_time_ = std::chrono::steady_clock::now();
}

bool JournalWriter::writev_fully(const struct iovec* iov, int iovcnt) {
    std::array<struct iovec, 4> tmp{};
    std::vector<struct iovec> dynamic;
    struct iovec* cur = nullptr;
    int cur_cnt = iovcnt;

    if (iovcnt <= static_cast<int>(tmp.size())) {
        std::copy(iov, iov + iovcnt, tmp.begin());
        cur = tmp.data();
    } else {
        dynamic.assign(iov, iov + iovcnt);
        cur = dynamic.data();
    }

    while (cur_cnt > 0) {
        std::size_t bytes_written = 0;
        const auto res = sink_->writev(cur, cur_cnt, bytes_written);
        if (!res.ok) {
            if (res.error_code == EINTR) {
                continue;
            }
            if (error_limiter_.should_log(std::chrono::steady_clock::now())) {
                util::log(util::LogLevel::Error, "JournalWriter: writev failed err=%d", res.error_code);
            }
            counters_.io_errors.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        if (bytes_written == 0) {
            if (error_limiter_.should_log(std::chrono::steady_clock::now())) {
                util::log(util::LogLevel::Error, "JournalWriter: writev wrote 0 bytes");
            }
            counters_.io_errors.fetch_add(1, std::memory_order_relaxed);
            return false;
        }

        std::size_t remaining = bytes_written;
        while (remaining > 0 && cur_cnt > 0) {
            if (remaining < cur[0].iov_len) {
                cur[0].iov_base = static_cast<std::byte*>(cur[0].iov_base) + remaining;
                cur[0].iov_len -= remaining;
                remaining = 0;
            } else {
                remaining -= cur[0].iov_len;
                ++cur;
                --cur_cnt;
            }
        }
    }
    return true;
}

void JournalWriter::enter_degraded(const char* reason) {
    if (degraded_) {
        return;
    }
    degraded_ = true;
    degraded_flag_.store(true, std::memory_order_release);
    degraded_enter_ = std::chrono::steady_clock::now();
    recovery_backoff_ = cfg_.initial_recovery_backoff;
    next_recovery_attempt_ = degraded_enter_ + recovery_backoff_;
    counters_.io_errors.fetch_add(1, std::memory_order_relaxed);
    util::log(util::LogLevel::Error, "JournalWriter entering degraded mode: %s", reason);
    LOG_WARM_FMT(util::LogLevel::Error, "JOURNAL", "degraded: %s", reason);
    staging_used_ = 0;
    batch_records_ = 0;
    if (sink_->is_open()) {
        sink_->close();
    }
}

void JournalWriter::maybe_recover(std::chrono::steady_clock::time_point now) {
    if (!degraded_ || now < next_recovery_attempt_) {
        return;
    }
    counters_.recovery_attempts.fetch_add(1, std::memory_order_relaxed);
    if (open_new_file(now)) {
        counters_.degraded_mode_time_ns.fetch_add(
            static_cast<std::uint64_t>(
                std::chrono::duration_cast<std::chrono::nanoseconds>(now - degraded_enter_).count()),
            std::memory_order_relaxed);
        degraded_ = false;
        degraded_flag_.store(false, std::memory_order_release);
        staging_used_ = 0;
        batch_records_ = 0;
        util::log(util::LogLevel::Info, "JournalWriter recovered from degraded mode");
        return;
    }
    recovery_backoff_ = std::min(recovery_backoff_ * 2, cfg_.max_recovery_backoff);
    next_recovery_attempt_ = now + recovery_backoff_;
}

void JournalWriter::drain_and_drop() {
    JournalFrame frame{};
    while (ring_.try_pop(frame)) {
        counters_.drop_degraded.fetch_add(1, std::memory_order_relaxed);
    }
}

bool JournalWriter::ensure_file_ready(std::size_t next_record_size) {
    const auto now = std::chrono::steady_clock::now();
    if (!sink_->is_open()) {
        if (!open_new_file(now)) {
            enter_degraded("open failed");
            return false;
        }
    }
    bool need_rotate = now - last_rotate_time_ >= cfg_.rotate_interval;
    if (!need_rotate) {
        const std::uint64_t projected = sink_->current_size() + staging_used_ + next_record_size;
        need_rotate = cfg_.rotate_max_bytes > 0 && projected > cfg_.rotate_max_bytes &&
                      (sink_->current_size() + staging_used_) > 0;
    }
    if (need_rotate) {
        flush_batch();
        if (degraded_) {
            return false;
        }
        sink_->close();
        if (!open_new_file(now)) {
            enter_degraded("rotate/open failed");
            return false;
        }
    }
    return true;
}

void JournalWriter::append(const JournalFrame& frame) {
    const std::size_t record_size = frame.size;
    if (!ensure_file_ready(record_size)) {
        counters_.drop_degraded.fetch_add(1, std::memory_order_relaxed);
        return;
    }
    if (staging_used_ + record_size > staging_.size()) {
        flush_batch();
        if (degraded_) {
            counters_.drop_degraded.fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
    std::copy(frame.bytes.begin(), frame.bytes.begin() + record_size, staging_.begin() + staging_used_);
    staging_used_ += record_size;
    ++batch_records_;
}

} // namespace persist
