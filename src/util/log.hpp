#pragma once

#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace util {

enum class LogLevel { Trace, Debug, Info, Warn, Error, Fatal };

inline const char* level_name(LogLevel lvl) noexcept {
    switch (lvl) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Fatal: return "FATAL";
    }
    return "UNKNOWN";
}

namespace detail {
inline std::mutex& slow_log_mutex() {
    static std::mutex mtx;
    return mtx;
}

inline void write_utc_prefix(std::FILE* out) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[32];
    const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    std::fwrite(buf, 1, n, out);
    std::fputc(' ', out);
}

inline void slow_log_impl(LogLevel lvl, const char* fmt, va_list args) {
    std::lock_guard<std::mutex> lock(slow_log_mutex());
    write_utc_prefix(stderr);
    std::fprintf(stderr, "%s: ", level_name(lvl));
    std::vfprintf(stderr, fmt, args);
    std::fprintf(stderr, "\n");
}
} // namespace detail

class SyncLogger {
public:
    static void log(LogLevel lvl, const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        detail::slow_log_impl(lvl, fmt, args);
        va_end(args);
    }
};

inline void log(LogLevel lvl, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    detail::slow_log_impl(lvl, fmt, args);
    va_end(args);
}

// Suppresses repeats of the same diagnostic inside `interval`. Not thread-safe;
// each owner keeps its own instance.
class LogRateLimiter {
public:
    explicit LogRateLimiter(std::chrono::milliseconds interval = std::chrono::milliseconds{1000}) noexcept
        : interval_(interval) {}

    bool should_log(std::chrono::steady_clock::time_point now) noexcept {
        if (last_.time_since_epoch().count() == 0 || now - last_ >= interval_) {
            last_ = now;
            return true;
        }
        ++suppressed_;
        return false;
    }

    std::uint64_t suppressed() const noexcept { return suppressed_; }

private:
    std::chrono::milliseconds interval_;
    std::chrono::steady_clock::time_point last_{};
    std::uint64_t suppressed_{0};
};

} // namespace util

#define LOG_SLOW_TRACE(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Trace, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_DEBUG(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Debug, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_INFO(FMT, ...)  ::util::SyncLogger::log(::util::LogLevel::Info,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_WARN(FMT, ...)  ::util::SyncLogger::log(::util::LogLevel::Warn,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_ERROR(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Error, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_FATAL(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Fatal, (FMT) __VA_OPT__(, __VA_ARGS__))
