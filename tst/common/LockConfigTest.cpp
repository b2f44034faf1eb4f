// SPDX-License-Identifier: AGPL-3.0-or-later
#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>
#include "common/LockConfig.hpp"

using dlock::LockConfig;

TEST(LockConfigTest, Defaults) {
    const LockConfig config {};
    EXPECT_EQ(config.ttl, std::chrono::seconds{30});
    EXPECT_EQ(config.pollInterval, std::chrono::milliseconds{300});
    EXPECT_EQ(config.renewInterval(), std::chrono::seconds{20});
}

TEST(LockConfigTest, RenewIntervalFollowsRatio) {
    const LockConfig config {std::chrono::milliseconds{1000}, std::chrono::milliseconds{50}, 0.5};
    EXPECT_EQ(config.renewInterval(), std::chrono::milliseconds{500});
}

TEST(LockConfigTest, RenewIntervalIsAtLeastOneMillisecond) {
    const LockConfig config {std::chrono::milliseconds{1}, std::chrono::milliseconds{1}, 0.1};
    EXPECT_EQ(config.renewInterval(), std::chrono::milliseconds{1});
}

TEST(LockConfigTest, NonPositiveTtlThrows) {
    EXPECT_THROW(LockConfig(std::chrono::milliseconds{0}), std::invalid_argument);
    EXPECT_THROW(LockConfig(std::chrono::milliseconds{-5}), std::invalid_argument);
}

TEST(LockConfigTest, NonPositivePollIntervalThrows) {
    EXPECT_THROW(LockConfig(std::chrono::seconds{1}, std::chrono::milliseconds{0}), std::invalid_argument);
}

TEST(LockConfigTest, RatioOutsideUnitIntervalThrows) {
    EXPECT_THROW(LockConfig(std::chrono::seconds{1}, std::chrono::milliseconds{10}, 0.0), std::invalid_argument);
    EXPECT_THROW(LockConfig(std::chrono::seconds{1}, std::chrono::milliseconds{10}, 1.0), std::invalid_argument);
    EXPECT_THROW(LockConfig(std::chrono::seconds{1}, std::chrono::milliseconds{10}, 1.5), std::invalid_argument);
}
