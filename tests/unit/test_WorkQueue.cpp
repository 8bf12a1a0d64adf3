#include "sync/WorkQueue.hpp"

#include <gtest/gtest.h>
#include <mutex>
#include <thread>
#include <vector>

using namespace bk::sync;

TEST(WorkQueueTest, test_SequentialClaimsThenExhausted) {
    WorkQueue q(3);
    EXPECT_EQ(q.claim().value_or(99), 0u);
    EXPECT_EQ(q.claim().value_or(99), 1u);
    EXPECT_EQ(q.claim().value_or(99), 2u);
    EXPECT_FALSE(q.claim().has_value());
    EXPECT_FALSE(q.claim().has_value());
    EXPECT_TRUE(q.exhausted());
    EXPECT_EQ(q.claimed(), 3u);
}

TEST(WorkQueueTest, test_EmptyQueueIsExhaustedImmediately) {
    WorkQueue q(0);
    EXPECT_TRUE(q.exhausted());
    EXPECT_FALSE(q.claim().has_value());
}

TEST(WorkQueueTest, test_ConcurrentClaimsAreExactlyOnce) {
    constexpr size_t kItems = 20000;
    constexpr unsigned kThreads = 8;

    WorkQueue q(kItems);
    std::vector<int> hits(kItems, 0);
    std::mutex m;

    std::vector<std::thread> threads;
    for (unsigned t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            std::vector<size_t> mine;
            while (const auto i = q.claim()) mine.push_back(*i);
            std::scoped_lock lock(m);
            for (const auto i : mine) ++hits[i];
        });
    }
    for (auto& t : threads) t.join();

    for (size_t i = 0; i < kItems; ++i) ASSERT_EQ(hits[i], 1) << "index " << i;
    EXPECT_TRUE(q.exhausted());
}
