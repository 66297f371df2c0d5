#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <thread>

#include "util/log.hpp"
#include "util/mpmc_ring.hpp"

namespace util {

struct LogRecord {
    std::uint64_t timestamp_ns{0}; // wall clock, ns since epoch
    LogLevel level{LogLevel::Info};
    std::uint32_t thread_id_hash{0};
    char category[8]{};
    std::uint16_t message_len{0};
    char message[200]{};
};

// Engine-path logger: producers format into a fixed record and push it onto a
// bounded ring; a background consumer writes records to stderr or a file.
// A full ring drops the record and counts it.
class AsyncLogger {
public:
    struct Config {
        std::size_t capacity_pow2{1u << 12};
        LogLevel min_level{LogLevel::Info};
        bool flush_on_warn{true};
        std::size_t flush_every{256};
        std::string file_path{}; // optional target; stderr when empty
        std::uint64_t consumer_sleep_ns{50'000};
    };

    AsyncLogger() = default;
    ~AsyncLogger();

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    bool start(const Config& cfg) noexcept;
    void stop() noexcept;
    bool running() const noexcept { return !stop_.load(std::memory_order_acquire); }

    bool try_log(LogLevel lvl, const char* category, const char* msg, std::size_t len) noexcept;
    bool try_logf(LogLevel lvl, const char* category, const char* fmt, ...) noexcept
#if defined(__GNUC__)
        __attribute__((format(printf, 4, 5)))
#endif
        ;

    std::uint64_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }
    std::uint64_t written() const noexcept { return written_.load(std::memory_order_relaxed); }
    std::uint64_t filtered() const noexcept { return filtered_.load(std::memory_order_relaxed); }

private:
    void consumer_loop() noexcept;
    void write_record(const LogRecord& rec) noexcept;

    BoundedMpmcRing<LogRecord> ring_{};
    std::atomic<bool> stop_{true};
    std::thread consumer_{};
    Config config_{};
    std::atomic<int> min_level_{static_cast<int>(LogLevel::Info)};

    FILE* sink_{stderr};
    bool owns_file_{false};

    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<std::uint64_t> written_{0};
    std::atomic<std::uint64_t> filtered_{0};
};

// Process-wide engine logger. Records logged before init_engine_logger() (or
// after shutdown) are rejected and not counted.
AsyncLogger& engine_logger() noexcept;
bool init_engine_logger(const AsyncLogger::Config& cfg) noexcept;
void shutdown_engine_logger() noexcept;

} // namespace util

// Formatting happens on the calling thread; keep arguments cheap.
#define LOG_WARM_FMT(LVL, CAT, FMT, ...) ::util::engine_logger().try_logf((LVL), (CAT), (FMT) __VA_OPT__(, __VA_ARGS__))
