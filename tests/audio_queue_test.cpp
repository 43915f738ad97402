// GTest
#include <gtest/gtest.h>

// standard
#include <chrono>
#include <thread>

// local
#include "audio_queue.hpp"

using namespace asrstream;
using namespace std::chrono;

TEST(AudioQueueTest, FifoOrder) {
    AudioQueue queue(4);
    EXPECT_TRUE(queue.push({1, 2}, milliseconds(10)));
    EXPECT_TRUE(queue.push({3}, milliseconds(10)));
    EXPECT_EQ(queue.size(), 2u);

    PcmBuffer out;
    EXPECT_EQ(queue.pop(out, milliseconds(10)), PopStatus::ITEM);
    EXPECT_EQ(out, (PcmBuffer{1, 2}));
    EXPECT_EQ(queue.pop(out, milliseconds(10)), PopStatus::ITEM);
    EXPECT_EQ(out, (PcmBuffer{3}));
    EXPECT_EQ(queue.pop(out, milliseconds(10)), PopStatus::TIMEOUT);
}

TEST(AudioQueueTest, FullQueueTimesOut) {
    AudioQueue queue(1);
    EXPECT_TRUE(queue.push({1}, milliseconds(10)));
    EXPECT_FALSE(queue.push({2}, milliseconds(10)));
    EXPECT_EQ(queue.size(), 1u);
}

TEST(AudioQueueTest, PushUnblocksWhenConsumerDrains) {
    AudioQueue queue(1);
    ASSERT_TRUE(queue.push({1}, milliseconds(10)));

    std::thread consumer([&] {
        std::this_thread::sleep_for(milliseconds(20));
        PcmBuffer out;
        queue.pop(out, seconds(1));
    });
    EXPECT_TRUE(queue.push({2}, seconds(5)));
    consumer.join();
}

TEST(AudioQueueTest, CloseDrainsBeforeReportingClosed) {
    AudioQueue queue(4);
    queue.push({1}, milliseconds(10));
    queue.push({2}, milliseconds(10));
    queue.close();

    EXPECT_TRUE(queue.closed());
    EXPECT_FALSE(queue.push({3}, milliseconds(10)));

    PcmBuffer out;
    EXPECT_EQ(queue.pop(out, milliseconds(10)), PopStatus::ITEM);
    EXPECT_EQ(queue.pop(out, milliseconds(10)), PopStatus::ITEM);
    EXPECT_EQ(out, (PcmBuffer{2}));
    EXPECT_EQ(queue.pop(out, milliseconds(10)), PopStatus::CLOSED);
}

TEST(AudioQueueTest, CancelDropsPendingAudio) {
    AudioQueue queue(4);
    queue.push({1}, milliseconds(10));
    queue.cancel();

    PcmBuffer out;
    EXPECT_EQ(queue.pop(out, milliseconds(10)), PopStatus::CLOSED);
    EXPECT_EQ(queue.size(), 0u);
}

TEST(AudioQueueTest, CloseWakesBlockedPop) {
    AudioQueue queue(2);
    std::thread closer([&] {
        std::this_thread::sleep_for(milliseconds(20));
        queue.close();
    });

    PcmBuffer out;
    EXPECT_EQ(queue.pop(out, seconds(5)), PopStatus::CLOSED);
    closer.join();
}
