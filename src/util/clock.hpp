#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace util {

// Engine time source. Timestamps are nanoseconds since the Unix epoch so they
// line up with civil-day arithmetic on provisions.
class Clock {
public:
    virtual ~Clock() = default;
    virtual std::uint64_t now_ns() const noexcept = 0;
};

class SystemClock final : public Clock {
public:
    std::uint64_t now_ns() const noexcept override {
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
    }
};

// Deterministic clock for tests and replays. Safe to advance from one thread
// while others read.
class ManualClock final : public Clock {
public:
    explicit ManualClock(std::uint64_t start_ns = 0) noexcept : now_(start_ns) {}

    std::uint64_t now_ns() const noexcept override { return now_.load(std::memory_order_acquire); }
    void set(std::uint64_t ns) noexcept { now_.store(ns, std::memory_order_release); }
    void advance(std::uint64_t delta_ns) noexcept { now_.fetch_add(delta_ns, std::memory_order_acq_rel); }

private:
    std::atomic<std::uint64_t> now_;
};

// Steady source for backoff and rotation bookkeeping inside the journal writer.
class SteadyClock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~SteadyClock() = default;
    virtual time_point now() const noexcept { return std::chrono::steady_clock::now(); }
};

} // namespace util
