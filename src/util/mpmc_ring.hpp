#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

namespace util {

// Bounded multi-producer ring (Vyukov sequence slots). Any number of threads may
// push; pops are expected from a single consumer thread. Capacity must be a
// power of two and is fixed by init(). Producers never block: a full ring
// rejects the push and the caller counts the drop.
template <typename T>
class BoundedMpmcRing {
public:
    BoundedMpmcRing() = default;

    BoundedMpmcRing(const BoundedMpmcRing&) = delete;
    BoundedMpmcRing& operator=(const BoundedMpmcRing&) = delete;

    static bool is_power_of_two(std::size_t v) noexcept { return v != 0 && (v & (v - 1)) == 0; }

    // Not thread-safe; call before producers start.
    bool init(std::size_t capacity_pow2) noexcept {
        if (!is_power_of_two(capacity_pow2) || capacity_pow2 < 2) {
            return false;
        }
        std::unique_ptr<Slot[]> slots(new (std::nothrow) Slot[capacity_pow2]);
        if (!slots) {
            return false;
        }
        for (std::size_t i = 0; i < capacity_pow2; ++i) {
            slots[i].sequence.store(i, std::memory_order_relaxed);
        }
        slots_ = std::move(slots);
        capacity_ = capacity_pow2;
        mask_ = capacity_pow2 - 1;
        head_.store(0, std::memory_order_relaxed);
        tail_.store(0, std::memory_order_relaxed);
        return true;
    }

    bool initialized() const noexcept { return static_cast<bool>(slots_); }

    bool try_push(const T& value) noexcept(std::is_nothrow_copy_assignable_v<T>) {
        if (!slots_) {
            return false;
        }
        std::uint64_t pos = head_.load(std::memory_order_relaxed);
        for (;;) {
            Slot& slot = slots_[pos & mask_];
            const std::uint64_t seq = slot.sequence.load(std::memory_order_acquire);
            const std::int64_t dif = static_cast<std::int64_t>(seq) - static_cast<std::int64_t>(pos);
            if (dif == 0) {
                if (head_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed, std::memory_order_relaxed)) {
                    break;
                }
            } else if (dif < 0) {
                return false; // full
            } else {
                pos = head_.load(std::memory_order_relaxed);
            }
        }
        Slot& slot = slots_[pos & mask_];
        slot.value = value;
        slot.sequence.store(pos + 1, std::memory_order_release);
        return true;
    }

    // Single consumer.
    bool try_pop(T& out) noexcept(std::is_nothrow_move_assignable_v<T>) {
        if (!slots_) {
            return false;
        }
        const std::uint64_t tail = tail_.load(std::memory_order_relaxed);
        Slot& slot = slots_[tail & mask_];
        const std::uint64_t seq = slot.sequence.load(std::memory_order_acquire);
        const std::int64_t dif = static_cast<std::int64_t>(seq) - static_cast<std::int64_t>(tail + 1);
        if (dif != 0) {
            return false;
        }
        out = std::move(slot.value);
        slot.sequence.store(tail + mask_ + 1, std::memory_order_release);
        tail_.store(tail + 1, std::memory_order_release);
        return true;
    }

    bool empty_approx() const noexcept {
        return tail_.load(std::memory_order_acquire) == head_.load(std::memory_order_acquire);
    }

    std::size_t capacity() const noexcept { return capacity_; }

private:
    struct Slot {
        std::atomic<std::uint64_t> sequence{0};
        T value{};
    };

    alignas(64) std::atomic<std::uint64_t> head_{0};
    alignas(64) std::atomic<std::uint64_t> tail_{0};
    std::size_t mask_{0};
    std::size_t capacity_{0};
    std::unique_ptr<Slot[]> slots_{};
};

} // namespace util
