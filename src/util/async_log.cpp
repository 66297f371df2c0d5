#include "util/async_log.hpp"

#include <algorithm>
#include <chrono>
#include <cstdarg>
#include <cstring>
#include <functional>
#include <system_error>

namespace util {
namespace {
AsyncLogger* global_engine_logger() {
    static AsyncLogger logger;
    return &logger;
}

std::uint64_t wall_now_ns() noexcept {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}
} // namespace

AsyncLogger::~AsyncLogger() { stop(); }

bool AsyncLogger::start(const Config& cfg) noexcept {
    if (!stop_.load(std::memory_order_acquire)) {
        return true; // already running
    }
    if (!ring_.init(cfg.capacity_pow2)) {
        return false;
    }
    config_ = cfg;
    min_level_.store(static_cast<int>(cfg.min_level), std::memory_order_relaxed);

    if (!cfg.file_path.empty()) {
        sink_ = std::fopen(cfg.file_path.c_str(), "a");
        if (!sink_) {
            sink_ = stderr;
            return false;
        }
        owns_file_ = true;
    } else {
        sink_ = stderr;
        owns_file_ = false;
    }

    stop_.store(false, std::memory_order_release);
    try {
        consumer_ = std::thread([this] { consumer_loop(); });
    } catch (const std::system_error&) {
        stop_.store(true, std::memory_order_release);
        if (owns_file_ && sink_) {
            std::fclose(sink_);
        }
        owns_file_ = false;
        sink_ = stderr;
        return false;
    }
    return true;
}

void AsyncLogger::stop() noexcept {
    if (stop_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    if (consumer_.joinable()) {
        consumer_.join();
    }
    if (owns_file_ && sink_) {
        std::fclose(sink_);
    }
    sink_ = stderr;
    owns_file_ = false;
}

bool AsyncLogger::try_log(LogLevel lvl, const char* category, const char* msg, std::size_t len) noexcept {
    if (stop_.load(std::memory_order_acquire)) {
        return false;
    }
    if (static_cast<int>(lvl) < min_level_.load(std::memory_order_relaxed)) {
        filtered_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    static thread_local std::uint32_t tid_hash =
        static_cast<std::uint32_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));

    LogRecord rec{};
    rec.timestamp_ns = wall_now_ns();
    rec.level = lvl;
    rec.thread_id_hash = tid_hash;
    if (category) {
        const std::size_t cat_len = std::min<std::size_t>(std::strlen(category), sizeof(rec.category));
        std::memcpy(rec.category, category, cat_len);
    }
    rec.message_len = static_cast<std::uint16_t>(std::min<std::size_t>(sizeof(rec.message), len));
    if (rec.message_len > 0 && msg) {
        std::memcpy(rec.message, msg, rec.message_len);
    }

    if (!ring_.try_push(rec)) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    return true;
}

bool AsyncLogger::try_logf(LogLevel lvl, const char* category, const char* fmt, ...) noexcept {
    if (stop_.load(std::memory_order_acquire)) {
        return false;
    }
    if (static_cast<int>(lvl) < min_level_.load(std::memory_order_relaxed)) {
        filtered_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    char buffer[sizeof(LogRecord::message)];
    va_list args;
    va_start(args, fmt);
    const int written = std::vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);
    const std::size_t len =
        written < 0 ? 0u : std::min<std::size_t>(static_cast<std::size_t>(written), sizeof(buffer) - 1);
    return try_log(lvl, category, buffer, len);
}

void AsyncLogger::write_record(const LogRecord& rec) noexcept {
    if (!sink_) return;
    char cat[sizeof(rec.category) + 1]{};
    std::memcpy(cat, rec.category, sizeof(rec.category));
    std::fprintf(sink_, "[%llu][%s][%u][%s] ", static_cast<unsigned long long>(rec.timestamp_ns),
                 level_name(rec.level), static_cast<unsigned>(rec.thread_id_hash), cat);
    if (rec.message_len > 0) {
        std::fwrite(rec.message, 1, rec.message_len, sink_);
    }
    std::fputc('\n', sink_);
}

void AsyncLogger::consumer_loop() noexcept {
    std::size_t since_flush = 0;
    std::uint32_t idle_spins = 0;
    for (;;) {
        LogRecord rec{};
        if (ring_.try_pop(rec)) {
            write_record(rec);
            written_.fetch_add(1, std::memory_order_relaxed);
            ++since_flush;
            idle_spins = 0;
            if ((config_.flush_on_warn && rec.level >= LogLevel::Warn) ||
                (config_.flush_every > 0 && since_flush >= config_.flush_every)) {
                std::fflush(sink_);
                since_flush = 0;
            }
            continue;
        }
        if (stop_.load(std::memory_order_acquire) && ring_.empty_approx()) {
            break;
        }
        if (idle_spins < 256) {
            ++idle_spins;
            std::this_thread::yield();
        } else if (config_.consumer_sleep_ns > 0) {
            idle_spins = 0;
            if (since_flush > 0) {
                std::fflush(sink_);
                since_flush = 0;
            }
            std::this_thread::sleep_for(std::chrono::nanoseconds(config_.consumer_sleep_ns));
        } else {
            std::this_thread::yield();
        }
    }
    if (sink_) {
        std::fflush(sink_);
    }
}

AsyncLogger& engine_logger() noexcept { return *global_engine_logger(); }

bool init_engine_logger(const AsyncLogger::Config& cfg) noexcept { return global_engine_logger()->start(cfg); }

void shutdown_engine_logger() noexcept { global_engine_logger()->stop(); }

} // namespace util
