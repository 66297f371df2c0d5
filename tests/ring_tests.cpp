#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <thread>
#include <vector>

#include "util/mpmc_ring.hpp"

namespace {

using Ring = util::BoundedMpmcRing<std::uint64_t>;

TEST(BoundedMpmcRingTest, RejectsNonPowerOfTwo) {
    Ring ring;
    EXPECT_FALSE(ring.init(6));
    EXPECT_FALSE(ring.init(1));
    EXPECT_FALSE(ring.initialized());
    EXPECT_FALSE(ring.try_push(1));
}

TEST(BoundedMpmcRingTest, PushPopOrder) {
    Ring ring;
    ASSERT_TRUE(ring.init(8));
    ASSERT_TRUE(ring.try_push(1));
    ASSERT_TRUE(ring.try_push(2));
    std::uint64_t out = 0;
    ASSERT_TRUE(ring.try_pop(out));
    EXPECT_EQ(out, 1u);
    ASSERT_TRUE(ring.try_pop(out));
    EXPECT_EQ(out, 2u);
    EXPECT_FALSE(ring.try_pop(out));
    EXPECT_TRUE(ring.empty_approx());
}

TEST(BoundedMpmcRingTest, FullRejectsThenRecovers) {
    Ring ring;
    ASSERT_TRUE(ring.init(4));
    for (std::uint64_t i = 0; i < 4; ++i) {
        ASSERT_TRUE(ring.try_push(i));
    }
    EXPECT_FALSE(ring.try_push(99));
    std::uint64_t out = 0;
    ASSERT_TRUE(ring.try_pop(out));
    EXPECT_TRUE(ring.try_push(4));
    std::vector<std::uint64_t> rest;
    while (ring.try_pop(out)) {
        rest.push_back(out);
    }
    EXPECT_EQ(rest, (std::vector<std::uint64_t>{1, 2, 3, 4}));
}

TEST(BoundedMpmcRingTest, ConcurrentProducersSingleConsumer) {
    Ring ring;
    ASSERT_TRUE(ring.init(1u << 10));
    constexpr int producers = 4;
    constexpr std::uint64_t per_producer = 2000;
    std::atomic<std::uint64_t> pushed{0};
    std::vector<std::thread> threads;
    for (int p = 0; p < producers; ++p) {
        threads.emplace_back([&] {
            for (std::uint64_t i = 0; i < per_producer;) {
                if (ring.try_push(i + 1)) {
                    ++i;
                    pushed.fetch_add(1, std::memory_order_relaxed);
                } else {
                    std::this_thread::yield();
                }
            }
        });
    }
    std::uint64_t popped = 0;
    std::uint64_t sum = 0;
    std::uint64_t out = 0;
    while (popped < producers * per_producer) {
        if (ring.try_pop(out)) {
            ++popped;
            sum += out;
        } else {
            std::this_thread::yield();
        }
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(pushed.load(), producers * per_producer);
    EXPECT_EQ(sum, producers * per_producer * (per_producer + 1) / 2);
}

} // namespace
