// SPDX-License-Identifier: AGPL-3.0-or-later
#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <vector>
#include <cstddef>
#include "common/ExponentialBackoff.hpp"
#include "common/RetryPolicy.hpp"

using dlock::ExponentialBackoff;
using dlock::RetryPolicy;

class ExponentialBackoffTest : public ::testing::Test {
protected:
    RetryPolicy defaultPolicy{
        std::chrono::microseconds{100L},
        std::chrono::microseconds{1000L},
        6,
        std::chrono::milliseconds{1000L},
        std::chrono::milliseconds{200L}
    };
};

TEST_F(ExponentialBackoffTest, DelaysStayUnderDoublingCeiling) {
    const std::vector<long> ceilings = {100, 200, 400, 800, 1000};
    for (int round = 0; round < 50; ++round) {
        ExponentialBackoff backoff(defaultPolicy);
        for (auto ceiling : ceilings) {
            auto delay = backoff.nextDelay();
            ASSERT_TRUE(delay.has_value());
            EXPECT_GE(delay.value(), std::chrono::microseconds{0});
            EXPECT_LE(delay.value(), std::chrono::microseconds{ceiling});
        }
    }
}

TEST_F(ExponentialBackoffTest, DelaysAreJittered) {
    std::vector<std::chrono::microseconds> first;
    for (int round = 0; round < 50; ++round) {
        ExponentialBackoff backoff(defaultPolicy);
        first.push_back(backoff.nextDelay().value());
    }
    std::sort(first.begin(), first.end());
    EXPECT_NE(first.front(), first.back());
}

TEST_F(ExponentialBackoffTest, ReturnsNulloptAfterThreshold) {
    ExponentialBackoff backoff(defaultPolicy);
    for (int i = 0; i < defaultPolicy.failureThreshold - 1; ++i) {
        ASSERT_TRUE(backoff.nextDelay().has_value());
    }
    EXPECT_FALSE(backoff.nextDelay().has_value());
    EXPECT_EQ(backoff.attempts(), defaultPolicy.failureThreshold - 1);
}

TEST_F(ExponentialBackoffTest, ResetRestartsAttempts) {
    ExponentialBackoff backoff(defaultPolicy);
    while (backoff.nextDelay().has_value()) {}
    backoff.reset();
    EXPECT_EQ(backoff.attempts(), 0);
    auto delay = backoff.nextDelay();
    ASSERT_TRUE(delay.has_value());
    EXPECT_LE(delay.value(), defaultPolicy.baseDelay);
}

TEST_F(ExponentialBackoffTest, ZeroDelayPolicy) {
    const RetryPolicy policy{
        std::chrono::microseconds{0L},
        std::chrono::microseconds{0L},
        3,
        std::chrono::milliseconds{1000L},
        std::chrono::milliseconds{200L}
    };
    ExponentialBackoff backoff(policy);
    EXPECT_EQ(backoff.nextDelay(), std::chrono::microseconds{0});
    EXPECT_EQ(backoff.nextDelay(), std::chrono::microseconds{0});
    EXPECT_FALSE(backoff.nextDelay().has_value());
}

TEST_F(ExponentialBackoffTest, ThresholdOfOneNeverDelays) {
    const RetryPolicy policy{
        std::chrono::microseconds{100L},
        std::chrono::microseconds{1000L},
        1,
        std::chrono::milliseconds{1000L},
        std::chrono::milliseconds{200L}
    };
    ExponentialBackoff backoff(policy);
    EXPECT_FALSE(backoff.nextDelay().has_value());
}
