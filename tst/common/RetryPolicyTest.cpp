// SPDX-License-Identifier: AGPL-3.0-or-later
#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>
#include "common/RetryPolicy.hpp"

using dlock::RetryPolicy;

TEST(RetryPolicyTest, ValidConstruction) {
    const RetryPolicy policy(
        std::chrono::microseconds{100L},
        std::chrono::microseconds{1000L},
        3,
        std::chrono::milliseconds{1000L},
        std::chrono::milliseconds{200L}
    );
    EXPECT_EQ(policy.baseDelay, std::chrono::microseconds{100L});
    EXPECT_EQ(policy.maxDelay, std::chrono::microseconds{1000L});
    EXPECT_EQ(policy.failureThreshold, 3);
    EXPECT_EQ(policy.rpcTimeout, std::chrono::milliseconds{1000L});
    EXPECT_EQ(policy.channelTimeout, std::chrono::milliseconds{200L});
}

TEST(RetryPolicyTest, NegativeThresholdThrows) {
    EXPECT_THROW(
        RetryPolicy(
            std::chrono::microseconds{100L},
            std::chrono::microseconds{1000L},
            -1,
            std::chrono::milliseconds{1000L},
            std::chrono::milliseconds{200L}
        ),
        std::invalid_argument
    );
}

TEST(RetryPolicyTest, NegativeBaseDelayThrows) {
    EXPECT_THROW(
        RetryPolicy(
            std::chrono::microseconds{-100},
            std::chrono::microseconds{1000L},
            3,
            std::chrono::milliseconds{1000L},
            std::chrono::milliseconds{200L}
        ),
        std::invalid_argument
    );
}

TEST(RetryPolicyTest, MaxDelayBelowBaseDelayThrows) {
    EXPECT_THROW(
        RetryPolicy(
            std::chrono::microseconds{1000L},
            std::chrono::microseconds{100L},
            3,
            std::chrono::milliseconds{1000L},
            std::chrono::milliseconds{200L}
        ),
        std::invalid_argument
    );
}

TEST(RetryPolicyTest, ZeroRpcTimeoutThrows) {
    EXPECT_THROW(
        RetryPolicy(
            std::chrono::microseconds{100L},
            std::chrono::microseconds{1000L},
            3,
            std::chrono::milliseconds{0L},
            std::chrono::milliseconds{200L}
        ),
        std::invalid_argument
    );
}

TEST(RetryPolicyTest, NegativeChannelTimeoutThrows) {
    EXPECT_THROW(
        RetryPolicy(
            std::chrono::microseconds{100L},
            std::chrono::microseconds{1000L},
            3,
            std::chrono::milliseconds{1000L},
            std::chrono::milliseconds{-1}
        ),
        std::invalid_argument
    );
}

TEST(RetryPolicyTest, ZeroDelaysAllowed) {
    EXPECT_NO_THROW(
        RetryPolicy(
            std::chrono::microseconds{0L},
            std::chrono::microseconds{0L},
            0,
            std::chrono::milliseconds{1L},
            std::chrono::milliseconds{0L}
        )
    );
}
