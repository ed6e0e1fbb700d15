// SPDX-License-Identifier: MIT

// tests/blocking_queue_test.cpp
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "lib/stream/blocking_queue.hpp"

using namespace stream_sync;
using namespace std::chrono_literals;

TEST(BlockingQueueTest, PopReturnsItemsInPushOrder) {
    BlockingQueue<int> queue;
    EXPECT_TRUE(queue.Push(1));
    EXPECT_TRUE(queue.Push(2));
    EXPECT_TRUE(queue.Push(3));
    EXPECT_EQ(queue.Size(), 3u);

    EXPECT_EQ(queue.PopFor(10ms), 1);
    EXPECT_EQ(queue.PopFor(10ms), 2);
    EXPECT_EQ(queue.TryPop(), 3);
    EXPECT_EQ(queue.TryPop(), std::nullopt);
}

TEST(BlockingQueueTest, PopForTimesOutWhenEmpty) {
    BlockingQueue<int> queue;
    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(queue.PopFor(30ms), std::nullopt);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 25ms);
}

TEST(BlockingQueueTest, PopForWakesOnPush) {
    BlockingQueue<int> queue;
    std::thread producer([&] {
        std::this_thread::sleep_for(20ms);
        queue.Push(42);
    });
    EXPECT_EQ(queue.PopFor(5s), 42);
    producer.join();
}

TEST(BlockingQueueTest, CloseRejectsPushesAndWakesConsumer) {
    BlockingQueue<int> queue;
    std::thread closer([&] {
        std::this_thread::sleep_for(20ms);
        queue.Close();
    });
    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(queue.PopFor(5s), std::nullopt);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 4s);
    closer.join();

    EXPECT_TRUE(queue.IsClosed());
    EXPECT_FALSE(queue.Push(7));
    EXPECT_EQ(queue.Size(), 0u);
}

TEST(BlockingQueueTest, BoundedPushBlocksUntilRoom) {
    BlockingQueue<int> queue(1);
    EXPECT_EQ(queue.capacity(), 1u);
    ASSERT_TRUE(queue.Push(1));

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        queue.Push(2);
        pushed = true;
    });
    std::this_thread::sleep_for(30ms);
    EXPECT_FALSE(pushed.load());

    EXPECT_EQ(queue.PopFor(1s), 1);
    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(queue.PopFor(1s), 2);
}

TEST(BlockingQueueTest, CloseReleasesBlockedProducer) {
    BlockingQueue<int> queue(1);
    ASSERT_TRUE(queue.Push(1));

    std::atomic<bool> result{true};
    std::thread producer([&] { result = queue.Push(2); });
    std::this_thread::sleep_for(20ms);
    queue.Close();
    producer.join();
    EXPECT_FALSE(result.load());
}

TEST(BlockingQueueTest, PerProducerOrderIsPreserved) {
    BlockingQueue<std::pair<int, int>> queue;
    constexpr int kProducers = 4;
    constexpr int kItems = 500;

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&, p] {
            for (int i = 0; i < kItems; ++i) queue.Push({p, i});
        });
    }

    std::vector<int> next(kProducers, 0);
    for (int n = 0; n < kProducers * kItems; ++n) {
        auto item = queue.PopFor(5s);
        ASSERT_TRUE(item.has_value());
        EXPECT_EQ(item->second, next[item->first]);
        next[item->first] = item->second + 1;
    }
    for (auto& t : producers) t.join();
}
