#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace util {

// WheelTimer provides O(1) deadline scheduling for escalation SLA windows.
//
// Design:
// - Single-level timing wheel with a power-of-two number of buckets
// - Each bucket covers tick_ns nanoseconds
// - Deadlines beyond the wheel span are parked in the furthest bucket and
//   re-checked (rescheduled) when that bucket comes due
//
// Cancellation:
// - Generation counter pattern, no explicit cancel API
// - Caller stores (key, generation) when scheduling
// - On expiry the caller compares the generation against its own record; a
//   mismatch means the timer was cancelled
//
// Thread safety: none. The owner serializes schedule() and poll_expired().
class WheelTimer {
public:
    struct Config {
        std::size_t num_buckets{512};
        std::uint64_t tick_ns{1'000'000'000ull}; // 1s
    };

    struct Entry {
        std::uint64_t key{0};
        std::uint32_t generation{0};
        std::uint64_t deadline_ns{0};
    };

    static_assert(std::is_trivially_copyable_v<Entry>, "Entry must be trivially copyable");

    struct Stats {
        std::uint64_t scheduled{0};
        std::uint64_t expired{0};
        std::uint64_t rescheduled{0};
    };

    explicit WheelTimer(std::uint64_t start_ns = 0) : WheelTimer(Config{}, start_ns) {}

    WheelTimer(const Config& cfg, std::uint64_t start_ns) : tick_ns_(cfg.tick_ns), buckets_(cfg.num_buckets) {
        if (cfg.num_buckets == 0 || (cfg.num_buckets & (cfg.num_buckets - 1)) != 0) {
            throw std::invalid_argument("WheelTimer num_buckets must be a power of two");
        }
        if (cfg.tick_ns == 0) {
            throw std::invalid_argument("WheelTimer tick_ns must be > 0");
        }
        mask_ = cfg.num_buckets - 1;
        current_tick_ = start_ns / tick_ns_;
        last_poll_ns_ = start_ns;
    }

    // Deadlines in the past land in the current bucket and fire on the next poll.
    void schedule(std::uint64_t key, std::uint32_t generation, std::uint64_t deadline_ns) {
        ++stats_.scheduled;
        insert(Entry{key, generation, deadline_ns});
    }

    // Invokes on_expired(key, generation) for every entry whose deadline is at
    // or before now_ns. Callbacks may schedule new entries; ones already due
    // fire within the same poll.
    template <typename F>
    void poll_expired(std::uint64_t now_ns, F&& on_expired) {
        const std::uint64_t now_tick = now_ns / tick_ns_;

        if (now_tick > current_tick_ + mask_) {
            // Gap longer than one revolution: sweep every bucket once.
            std::vector<Entry> all;
            for (auto& bucket : buckets_) {
                all.insert(all.end(), bucket.begin(), bucket.end());
                bucket.clear();
            }
            current_tick_ = now_tick;
            std::vector<Entry> due;
            for (const Entry& e : all) {
                if (e.deadline_ns <= now_ns) {
                    due.push_back(e);
                } else {
                    ++stats_.rescheduled;
                    insert(e);
                }
            }
            fire(due, on_expired);
        }

        for (;;) {
            auto& bucket = buckets_[current_tick_ & mask_];
            std::vector<Entry> due;
            for (std::size_t i = 0; i < bucket.size();) {
                const Entry e = bucket[i];
                if (e.deadline_ns <= now_ns) {
                    due.push_back(e);
                    bucket[i] = bucket.back();
                    bucket.pop_back();
                } else if (e.deadline_ns / tick_ns_ > current_tick_) {
                    // Parked far-future entry; move it closer.
                    bucket[i] = bucket.back();
                    bucket.pop_back();
                    ++stats_.rescheduled;
                    insert_from(e, current_tick_ + 1);
                } else {
                    ++i; // due later within this tick
                }
            }
            if (!due.empty()) {
                fire(due, on_expired);
                continue; // callbacks may have added entries to this bucket
            }
            if (current_tick_ >= now_tick) {
                break;
            }
            ++current_tick_;
        }

        last_poll_ns_ = now_ns;
    }

    [[nodiscard]] const Stats& stats() const noexcept { return stats_; }
    [[nodiscard]] std::uint64_t current_tick() const noexcept { return current_tick_; }
    [[nodiscard]] std::uint64_t tick_ns() const noexcept { return tick_ns_; }
    [[nodiscard]] std::uint64_t last_poll_ns() const noexcept { return last_poll_ns_; }

    [[nodiscard]] std::size_t total_pending() const noexcept {
        std::size_t total = 0;
        for (const auto& bucket : buckets_) {
            total += bucket.size();
        }
        return total;
    }

private:
    template <typename F>
    void fire(const std::vector<Entry>& due, F& on_expired) {
        for (const Entry& e : due) {
            ++stats_.expired;
            on_expired(e.key, e.generation);
        }
    }

    void insert(const Entry& e) { insert_from(e, current_tick_); }

    // Target tick is clamped to [base_tick, current_tick_ + mask_] so that an
    // entry never lands in the bucket being drained.
    void insert_from(const Entry& e, std::uint64_t base_tick) {
        std::uint64_t target = e.deadline_ns / tick_ns_;
        if (target < base_tick) {
            target = base_tick;
        }
        const std::uint64_t max_tick = current_tick_ + mask_;
        if (target > max_tick) {
            target = max_tick;
        }
        buckets_[target & mask_].push_back(e);
    }

    std::uint64_t tick_ns_{1};
    std::vector<std::vector<Entry>> buckets_;
    std::size_t mask_{0};
    std::uint64_t current_tick_{0};
    std::uint64_t last_poll_ns_{0};
    Stats stats_{};
};

} // namespace util
