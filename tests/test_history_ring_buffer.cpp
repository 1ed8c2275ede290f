/// @file test_history_ring_buffer.cpp
/// @brief Tests for systop::HistoryRingBuffer

#include "history_ring_buffer.hpp"

#include <gtest/gtest.h>

#include <vector>

using systop::HistoryRingBuffer;

TEST(HistoryRingBufferTest, StartsEmpty)
{
    HistoryRingBuffer<float> buffer;

    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(buffer.size(), 0u);
    EXPECT_TRUE(buffer.values().empty());
    EXPECT_EQ(HistoryRingBuffer<float>::capacity(), 60u);
}

TEST(HistoryRingBufferTest, KeepsInsertionOrderBelowCapacity)
{
    HistoryRingBuffer<int, 5> buffer;
    buffer.push(1);
    buffer.push(2);
    buffer.push(3);

    EXPECT_EQ(buffer.size(), 3u);
    EXPECT_EQ(buffer.values(), (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(buffer[0], 1);
    EXPECT_EQ(buffer.latest(), 3);
}

TEST(HistoryRingBufferTest, DropsOldestAtCapacity)
{
    HistoryRingBuffer<int, 3> buffer;
    for (int i = 1; i <= 5; ++i) {
        buffer.push(i);
    }

    EXPECT_EQ(buffer.size(), 3u);
    EXPECT_EQ(buffer.values(), (std::vector<int>{3, 4, 5}));
    EXPECT_EQ(buffer[0], 3);
    EXPECT_EQ(buffer.latest(), 5);
}

TEST(HistoryRingBufferTest, SixtyOnePushesKeepLastSixty)
{
    HistoryRingBuffer<double> buffer;
    for (int i = 0; i < 61; ++i) {
        buffer.push(static_cast<double>(i));
    }

    ASSERT_EQ(buffer.size(), 60u);
    auto values = buffer.values();
    EXPECT_DOUBLE_EQ(values.front(), 1.0);
    EXPECT_DOUBLE_EQ(values.back(), 60.0);
}

TEST(HistoryRingBufferTest, SizeNeverExceedsCapacity)
{
    HistoryRingBuffer<int, 7> buffer;
    for (int i = 0; i < 100; ++i) {
        buffer.push(i);
        EXPECT_LE(buffer.size(), 7u);
        EXPECT_EQ(buffer.latest(), i);
    }

    auto values = buffer.values();
    for (size_t i = 1; i < values.size(); ++i) {
        EXPECT_EQ(values[i], values[i - 1] + 1);
    }
}
