#include <gtest/gtest.h>
#include "posture/SpscQueue.hpp"
#include <string>
#include <thread>

namespace posture {
namespace testing {

TEST(SpscQueueTest, PopsInPushOrder) {
    SpscQueue<int, 3> queue;
    EXPECT_TRUE(queue.empty());
    EXPECT_FALSE(queue.try_pop().has_value());

    EXPECT_TRUE(queue.try_push(1));
    EXPECT_TRUE(queue.try_push(2));
    EXPECT_EQ(queue.size(), 2u);

    EXPECT_EQ(queue.try_pop().value_or(-1), 1);
    EXPECT_EQ(queue.try_pop().value_or(-1), 2);
    EXPECT_TRUE(queue.empty());
}

TEST(SpscQueueTest, FullRingDropsAndCounts) {
    SpscQueue<std::string, 3> queue;
    EXPECT_EQ(queue.capacity(), 3u);

    EXPECT_TRUE(queue.try_push("a"));
    EXPECT_TRUE(queue.try_push("b"));
    EXPECT_TRUE(queue.try_push("c"));
    EXPECT_FALSE(queue.try_push("d"));
    EXPECT_FALSE(queue.try_push("e"));
    EXPECT_EQ(queue.dropped(), 2u);
    EXPECT_EQ(queue.size(), 3u);

    // The oldest items survive
    EXPECT_EQ(queue.try_pop().value_or(""), "a");
    EXPECT_TRUE(queue.try_push("f"));
    EXPECT_EQ(queue.try_pop().value_or(""), "b");
    EXPECT_EQ(queue.try_pop().value_or(""), "c");
    EXPECT_EQ(queue.try_pop().value_or(""), "f");
}

TEST(SpscQueueTest, WrapsAroundManyTimes) {
    SpscQueue<int, 2> queue;
    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(queue.try_push(i));
        ASSERT_EQ(queue.try_pop().value_or(-1), i);
    }
    EXPECT_EQ(queue.dropped(), 0u);
}

TEST(SpscQueueTest, ProducerAndConsumerThreads) {
    SpscQueue<int, 16> queue;
    constexpr int kItems = 10000;

    std::thread producer([&queue]() {
        for (int i = 0; i < kItems; ++i) {
            while (!queue.try_push(i)) {
                std::this_thread::yield();
            }
        }
    });

    int expected = 0;
    while (expected < kItems) {
        if (auto item = queue.try_pop()) {
            ASSERT_EQ(*item, expected);
            expected++;
        } else {
            std::this_thread::yield();
        }
    }
    producer.join();
    EXPECT_TRUE(queue.empty());
}

} // namespace testing
} // namespace posture
