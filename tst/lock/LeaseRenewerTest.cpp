// SPDX-License-Identifier: AGPL-3.0-or-later
#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include "lock/LeaseRenewer.hpp"
#include "lock/FaultyTTLStore.hpp"
#include "storage/InMemoryTTLStore.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"

using dlock::ErrorCode;
using dlock::InMemoryTTLStore;
using dlock::Key;
using dlock::LeaseRenewer;
using dlock::Value;

using namespace std::chrono_literals;

class LeaseRenewerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(store.setIfAbsent(key, token, ttl), true);
    }

    InMemoryTTLStore store;
    const Key key {"lease"};
    const Value token {"holder-token"};
    const std::chrono::milliseconds ttl {200};
    const std::chrono::milliseconds interval {60};
};

TEST_F(LeaseRenewerTest, KeepsKeyAliveBeyondTtl) {
    LeaseRenewer renewer {store, key, token, ttl, interval};
    std::this_thread::sleep_for(600ms);
    EXPECT_TRUE(store.get(key).value().has_value());
    EXPECT_GE(renewer.renewals(), 3U);
    EXPECT_FALSE(renewer.lost().has_value());
}

TEST_F(LeaseRenewerTest, CancelStopsRenewal) {
    LeaseRenewer renewer {store, key, token, ttl, interval};
    std::this_thread::sleep_for(100ms);
    renewer.cancel();
    const auto renewals = renewer.renewals();
    std::this_thread::sleep_for(400ms);
    EXPECT_EQ(renewer.renewals(), renewals);
    EXPECT_FALSE(store.get(key).value().has_value());
    renewer.cancel();
}

TEST_F(LeaseRenewerTest, ReportsLossWhenKeyIsGone) {
    LeaseRenewer renewer {store, key, token, ttl, interval};
    ASSERT_EQ(store.erase(key), true);
    std::this_thread::sleep_for(3 * interval);
    auto lost = renewer.lost();
    ASSERT_TRUE(lost.has_value());
    EXPECT_EQ(lost->code, ErrorCode::LeaseLost);
    EXPECT_EQ(lost->key, "lease");
    EXPECT_FALSE(store.get(key).value().has_value());
}

TEST_F(LeaseRenewerTest, ShortOutageIsRiddenOut) {
    FaultyTTLStore faulty {store};
    LeaseRenewer renewer {faulty, key, token, std::chrono::milliseconds{400}, interval};
    faulty.fail(true);
    std::this_thread::sleep_for(100ms);
    faulty.fail(false);
    std::this_thread::sleep_for(150ms);
    EXPECT_FALSE(renewer.lost().has_value());
    EXPECT_GE(renewer.renewals(), 1U);
}

TEST_F(LeaseRenewerTest, LongOutageLosesLease) {
    FaultyTTLStore faulty {store};
    LeaseRenewer renewer {faulty, key, token, ttl, interval};
    faulty.fail(true);
    std::this_thread::sleep_for(ttl + 3 * interval);
    auto lost = renewer.lost();
    ASSERT_TRUE(lost.has_value());
    EXPECT_EQ(lost->code, ErrorCode::LeaseLost);
    const auto calls = faulty.callCount();
    std::this_thread::sleep_for(3 * interval);
    EXPECT_EQ(faulty.callCount(), calls);
}
