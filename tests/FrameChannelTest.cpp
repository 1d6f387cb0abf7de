#include "picker/FrameChannel.hpp"

#include <gtest/gtest.h>
#include <thread>

TEST(FrameChannel, LatestWins) {
    CFrameChannel<int> channel;
    int                wakes = 0;
    channel.setWakeCallback([&wakes]() { wakes++; });

    channel.publish(1);
    channel.publish(2);
    channel.publish(3);

    EXPECT_EQ(channel.take(), 3);
    EXPECT_FALSE(channel.take().has_value());
    EXPECT_EQ(channel.dropped(), 2u);
    EXPECT_EQ(channel.published(), 3u);
    EXPECT_EQ(wakes, 3);
}

TEST(FrameChannel, ClearDropsTheSlot) {
    CFrameChannel<std::string> channel;
    channel.publish("stale");
    channel.clear();
    EXPECT_FALSE(channel.take().has_value());
}

TEST(FrameChannel, ProducerNeverWaits) {
    CFrameChannel<int> channel;

    std::thread        producer([&channel]() {
        for (int i = 1; i <= 1000; ++i) {
            channel.publish(int{i});
        }
    });
    producer.join();

    EXPECT_EQ(channel.take(), 1000);
    EXPECT_EQ(channel.published(), 1000u);
}
