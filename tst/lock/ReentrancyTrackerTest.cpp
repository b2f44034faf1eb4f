// SPDX-License-Identifier: AGPL-3.0-or-later
#include <gtest/gtest.h>
#include <algorithm>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include "lock/ReentrancyTracker.hpp"

using dlock::ReentrancyTracker;

TEST(ReentrancyTrackerTest, TrackStartsAtOne) {
    ReentrancyTracker<uint64_t> tracker;
    EXPECT_FALSE(tracker.holds("L"));
    EXPECT_EQ(tracker.count("L"), 0U);
    tracker.track("L", 11);
    EXPECT_TRUE(tracker.holds("L"));
    EXPECT_EQ(tracker.count("L"), 1U);
    ASSERT_NE(tracker.find("L"), nullptr);
    EXPECT_EQ(tracker.find("L")->handle, 11U);
}

TEST(ReentrancyTrackerTest, ReenterAndRelease) {
    ReentrancyTracker<uint64_t> tracker;
    tracker.track("L", 11);
    EXPECT_EQ(tracker.reenter("L"), 2U);
    EXPECT_EQ(tracker.reenter("L"), 3U);
    EXPECT_EQ(tracker.release("L"), 2U);
    EXPECT_EQ(tracker.count("L"), 2U);
    EXPECT_TRUE(tracker.holds("L"));
}

TEST(ReentrancyTrackerTest, ForgetReturnsHandle) {
    ReentrancyTracker<uint64_t> tracker;
    tracker.track("L", 11);
    tracker.track("M", 12);
    auto h = tracker.forget("L");
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ(h.value(), 11U);
    EXPECT_FALSE(tracker.holds("L"));
    EXPECT_FALSE(tracker.forget("L").has_value());
    EXPECT_EQ(tracker.size(), 1U);
    auto names = tracker.names();
    ASSERT_EQ(names.size(), 1U);
    EXPECT_EQ(names.front(), "M");
}

TEST(ReentrancyTrackerTest, MoveOnlyHandles) {
    ReentrancyTracker<std::unique_ptr<int>> tracker;
    tracker.track("L", std::make_unique<int>(5));
    EXPECT_EQ(*tracker.find("L")->handle, 5);
    auto h = tracker.forget("L");
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ(*h.value(), 5);
    EXPECT_TRUE(tracker.empty());
}

TEST(ReentrancyTrackerTest, ReenterUntrackedNameThrows) {
    ReentrancyTracker<uint64_t> tracker;
    EXPECT_THROW(tracker.reenter("L"), std::out_of_range);
}
