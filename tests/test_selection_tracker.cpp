/// @file test_selection_tracker.cpp
/// @brief Tests for systop::SelectionTracker cursor bounds

#include "selection_tracker.hpp"

#include <gtest/gtest.h>

#include <random>

using systop::SelectionTracker;

TEST(SelectionTrackerTest, StartsAtZero)
{
    SelectionTracker tracker;
    EXPECT_EQ(tracker.cursor(), 0u);
}

TEST(SelectionTrackerTest, MoveUpStopsAtZero)
{
    SelectionTracker tracker;
    tracker.move_up();
    EXPECT_EQ(tracker.cursor(), 0u);

    tracker.move_down(3);
    tracker.move_up();
    tracker.move_up();
    EXPECT_EQ(tracker.cursor(), 0u);
}

TEST(SelectionTrackerTest, MoveDownStopsAtLastRow)
{
    SelectionTracker tracker;
    for (int i = 0; i < 10; ++i) {
        tracker.move_down(3);
    }
    EXPECT_EQ(tracker.cursor(), 2u);
}

TEST(SelectionTrackerTest, MoveDownOnEmptyViewStaysAtZero)
{
    SelectionTracker tracker;
    tracker.move_down(0);
    EXPECT_EQ(tracker.cursor(), 0u);
}

TEST(SelectionTrackerTest, ClampAfterViewShrinks)
{
    SelectionTracker tracker;
    for (int i = 0; i < 4; ++i) {
        tracker.move_down(5);
    }
    ASSERT_EQ(tracker.cursor(), 4u);

    tracker.clamp(2);
    EXPECT_EQ(tracker.cursor(), 1u);
}

TEST(SelectionTrackerTest, ClampToEmptyViewGivesZero)
{
    SelectionTracker tracker;
    tracker.move_down(5);
    tracker.move_down(5);

    tracker.clamp(0);
    EXPECT_EQ(tracker.cursor(), 0u);
}

TEST(SelectionTrackerTest, MoveDownClampsAStaleCursor)
{
    SelectionTracker tracker;
    for (int i = 0; i < 8; ++i) {
        tracker.move_down(10);
    }
    ASSERT_EQ(tracker.cursor(), 8u);

    // View shrank underneath without a clamp
    tracker.move_down(3);
    EXPECT_EQ(tracker.cursor(), 2u);
}

TEST(SelectionTrackerTest, ResetReturnsToTop)
{
    SelectionTracker tracker;
    tracker.move_down(4);
    tracker.move_down(4);
    tracker.reset();
    EXPECT_EQ(tracker.cursor(), 0u);
}

// Any mix of moves and clamps against a changing view length keeps the
// cursor inside the view (or at 0 when the view is empty)
TEST(SelectionTrackerTest, CursorAlwaysWithinView)
{
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> op_dist(0, 2);
    std::uniform_int_distribution<size_t> len_dist(0, 20);

    SelectionTracker tracker;
    size_t length = 10;
    for (int step = 0; step < 2000; ++step) {
        switch (op_dist(rng)) {
            case 0:
                tracker.move_up();
                break;
            case 1:
                tracker.move_down(length);
                break;
            case 2:
                length = len_dist(rng);
                tracker.clamp(length);
                break;
        }

        if (length == 0) {
            EXPECT_EQ(tracker.cursor(), 0u);
        } else {
            EXPECT_LT(tracker.cursor(), length);
        }
    }
}
