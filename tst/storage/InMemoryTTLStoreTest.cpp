// SPDX-License-Identifier: AGPL-3.0-or-later
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>
#include "storage/InMemoryTTLStore.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"

using dlock::ErrorCode;
using dlock::InMemoryTTLStore;
using dlock::Key;
using dlock::Value;

using namespace std::chrono_literals;

TEST(InMemoryTTLStoreTest, SetIfAbsentOnlyOnce) {
    InMemoryTTLStore store;
    EXPECT_EQ(store.setIfAbsent(Key{"k"}, Value{"a"}, 10s), true);
    EXPECT_EQ(store.setIfAbsent(Key{"k"}, Value{"b"}, 10s), false);
    auto v = store.get(Key{"k"});
    ASSERT_TRUE(v.has_value());
    ASSERT_TRUE(v.value().has_value());
    EXPECT_EQ(v.value()->data, "a");
}

TEST(InMemoryTTLStoreTest, SetIfPresentNeverCreates) {
    InMemoryTTLStore store;
    EXPECT_EQ(store.setIfPresent(Key{"k"}, Value{"a"}, 10s), false);
    EXPECT_FALSE(store.get(Key{"k"}).value().has_value());
    EXPECT_EQ(store.size(), 0U);
}

TEST(InMemoryTTLStoreTest, SetIfPresentExtendsExpiry) {
    InMemoryTTLStore store;
    ASSERT_EQ(store.setIfAbsent(Key{"k"}, Value{"a"}, 100ms), true);
    ASSERT_EQ(store.setIfPresent(Key{"k"}, Value{"b"}, 10s), true);
    std::this_thread::sleep_for(200ms);
    auto v = store.get(Key{"k"});
    ASSERT_TRUE(v.value().has_value());
    EXPECT_EQ(v.value()->data, "b");
    auto left = store.remaining(Key{"k"});
    ASSERT_TRUE(left.has_value());
    EXPECT_GT(left.value(), 5s);
}

TEST(InMemoryTTLStoreTest, KeysExpire) {
    InMemoryTTLStore store;
    ASSERT_EQ(store.setIfAbsent(Key{"k"}, Value{"a"}, 50ms), true);
    std::this_thread::sleep_for(120ms);
    EXPECT_FALSE(store.get(Key{"k"}).value().has_value());
    EXPECT_EQ(store.setIfPresent(Key{"k"}, Value{"a"}, 50ms), false);
    EXPECT_EQ(store.setIfAbsent(Key{"k"}, Value{"c"}, 10s), true);
    EXPECT_EQ(store.get(Key{"k"}).value()->data, "c");
}

TEST(InMemoryTTLStoreTest, EraseReportsLiveKeysOnly) {
    InMemoryTTLStore store;
    EXPECT_EQ(store.erase(Key{"missing"}), false);
    ASSERT_EQ(store.setIfAbsent(Key{"k"}, Value{"a"}, 10s), true);
    EXPECT_EQ(store.erase(Key{"k"}), true);
    EXPECT_EQ(store.erase(Key{"k"}), false);
    ASSERT_EQ(store.setIfAbsent(Key{"short"}, Value{"a"}, 20ms), true);
    std::this_thread::sleep_for(60ms);
    EXPECT_EQ(store.erase(Key{"short"}), false);
}

TEST(InMemoryTTLStoreTest, RejectsEmptyKeyAndNonPositiveTtl) {
    InMemoryTTLStore store;
    auto empty = store.setIfAbsent(Key{""}, Value{"a"}, 10s);
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code, ErrorCode::InvalidArg);
    auto zero = store.setIfAbsent(Key{"k"}, Value{"a"}, 0ms);
    ASSERT_FALSE(zero.has_value());
    EXPECT_EQ(zero.error().code, ErrorCode::InvalidArg);
    auto present = store.setIfPresent(Key{"k"}, Value{"a"}, -1ms);
    ASSERT_FALSE(present.has_value());
    EXPECT_EQ(present.error().code, ErrorCode::InvalidArg);
}

TEST(InMemoryTTLStoreTest, ConcurrentSetIfAbsentHasOneWinner) {
    InMemoryTTLStore store;
    std::atomic<int> winners {0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&store, &winners, i]() {
            auto r = store.setIfAbsent(Key{"race"}, Value{std::to_string(i)}, 10s);
            if (r.has_value() && r.value()) {
                ++winners;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(store.size(), 1U);
}

TEST(InMemoryTTLStoreTest, PurgeDropsOnlyExpiredKeys) {
    InMemoryTTLStore store;
    for (int i = 0; i < 10; ++i) {
        ASSERT_EQ(store.setIfAbsent(Key{"short-" + std::to_string(i)}, Value{"a"}, 30ms), true);
    }
    ASSERT_EQ(store.setIfAbsent(Key{"long"}, Value{"b"}, 10s), true);
    std::this_thread::sleep_for(80ms);
    EXPECT_EQ(store.purgeExpired(), 10U);
    EXPECT_EQ(store.purgeExpired(), 0U);
    EXPECT_EQ(store.size(), 1U);
    EXPECT_EQ(store.get(Key{"long"}).value()->data, "b");
}

TEST(InMemoryTTLStoreTest, AbandonedKeysAreSweptByLaterAcquisitions) {
    InMemoryTTLStore store;
    for (int i = 0; i < 10; ++i) {
        ASSERT_EQ(store.setIfAbsent(Key{"abandoned-" + std::to_string(i)}, Value{"a"}, 30ms), true);
    }
    std::this_thread::sleep_for(80ms);
    for (uint64_t i = 0; i < InMemoryTTLStore::purgeInterval; ++i) {
        (void) store.setIfAbsent(Key{"busy"}, Value{"b"}, 10s);
    }
    EXPECT_EQ(store.purgeExpired(), 0U);
    EXPECT_EQ(store.size(), 1U);
}
