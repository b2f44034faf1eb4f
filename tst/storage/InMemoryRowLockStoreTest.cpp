// SPDX-License-Identifier: AGPL-3.0-or-later
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include "storage/InMemoryRowLockStore.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"

using dlock::ErrorCode;
using dlock::InMemoryRowLockStore;
using dlock::LockRecord;
using dlock::TransactionId;

using namespace std::chrono_literals;

namespace {

LockRecord makeRecord(const std::string& name, const std::string& ip, uint64_t thread, uint64_t count) {
    LockRecord r {name};
    r.ip = ip;
    r.threadId = thread;
    r.count = count;
    return r;
}

} // namespace

class InMemoryRowLockStoreTest : public ::testing::Test {
protected:
    // Creates a committed row for name.
    void seed(const std::string& name) {
        auto txn = store.openTransaction().value();
        ASSERT_TRUE(store.insert(txn, makeRecord(name, "10.0.0.1", 1, 0)).has_value());
        ASSERT_TRUE(store.commit(txn).has_value());
    }

    InMemoryRowLockStore store;
};

TEST_F(InMemoryRowLockStoreTest, TransactionsGetDistinctIds) {
    auto a = store.openTransaction();
    auto b = store.openTransaction();
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_NE(a.value(), b.value());
    EXPECT_EQ(store.openTransactions(), 2U);
    EXPECT_EQ(store.isOpen(a.value()), true);
    ASSERT_TRUE(store.commit(a.value()).has_value());
    EXPECT_EQ(store.isOpen(a.value()), false);
    EXPECT_EQ(store.openTransactions(), 1U);
}

TEST_F(InMemoryRowLockStoreTest, ReadOfMissingRowIsEmpty) {
    auto txn = store.openTransaction().value();
    auto r = store.readForUpdate(txn, "nothing");
    ASSERT_TRUE(r.has_value());
    EXPECT_FALSE(r.value().has_value());
    EXPECT_FALSE(store.owner("nothing").has_value());
}

TEST_F(InMemoryRowLockStoreTest, InsertLocksTheNewRow) {
    auto a = store.openTransaction().value();
    auto b = store.openTransaction().value();
    ASSERT_TRUE(store.insert(a, makeRecord("L", "10.0.0.1", 7, 0)).has_value());
    EXPECT_EQ(store.owner("L"), a);
    auto dup = store.insert(b, makeRecord("L", "10.0.0.2", 8, 0));
    ASSERT_FALSE(dup.has_value());
    EXPECT_EQ(dup.error().code, ErrorCode::AlreadyExists);
    auto r = store.readForUpdateNoWait(b, "L");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::Contention);
}

TEST_F(InMemoryRowLockStoreTest, StoreStampsTimes) {
    auto txn = store.openTransaction().value();
    const auto before = std::chrono::system_clock::now();
    ASSERT_TRUE(store.insert(txn, makeRecord("L", "10.0.0.1", 7, 0)).has_value());
    auto created = store.find("L").value().createdAt;
    EXPECT_GE(created, before - 1s);
    std::this_thread::sleep_for(5ms);
    ASSERT_TRUE(store.update(txn, makeRecord("L", "10.0.0.1", 7, 1)).has_value());
    auto row = store.find("L").value();
    EXPECT_EQ(row.createdAt, created);
    EXPECT_GE(row.updatedAt, created);
    EXPECT_EQ(row.count, 1U);
}

TEST_F(InMemoryRowLockStoreTest, RollbackUndoesInsertAndUpdate) {
    seed("kept");
    auto txn = store.openTransaction().value();
    ASSERT_TRUE(store.insert(txn, makeRecord("fresh", "10.0.0.1", 1, 0)).has_value());
    ASSERT_TRUE(store.readForUpdate(txn, "kept").value().has_value());
    ASSERT_TRUE(store.update(txn, makeRecord("kept", "10.0.0.9", 9, 3)).has_value());
    ASSERT_TRUE(store.rollback(txn).has_value());
    EXPECT_FALSE(store.find("fresh").has_value());
    auto kept = store.find("kept").value();
    EXPECT_EQ(kept.ip, "10.0.0.1");
    EXPECT_EQ(kept.count, 0U);
    EXPECT_FALSE(store.owner("kept").has_value());
    EXPECT_EQ(store.openTransactions(), 0U);
}

TEST_F(InMemoryRowLockStoreTest, UpdateRequiresTheRowLock) {
    seed("L");
    auto txn = store.openTransaction().value();
    auto u = store.update(txn, makeRecord("L", "10.0.0.1", 1, 1));
    ASSERT_FALSE(u.has_value());
    EXPECT_EQ(u.error().code, ErrorCode::Contention);
    auto missing = store.update(txn, makeRecord("nope", "10.0.0.1", 1, 1));
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::KeyNotFound);
}

TEST_F(InMemoryRowLockStoreTest, ClosedTransactionIsRejected) {
    auto txn = store.openTransaction().value();
    ASSERT_TRUE(store.commit(txn).has_value());
    EXPECT_EQ(store.read(txn, "L").error().code, ErrorCode::TransactionNotFound);
    EXPECT_EQ(store.readForUpdate(txn, "L").error().code, ErrorCode::TransactionNotFound);
    EXPECT_EQ(store.commit(txn).error().code, ErrorCode::TransactionNotFound);
    EXPECT_EQ(store.rollback(txn).error().code, ErrorCode::TransactionNotFound);
    EXPECT_EQ(store.rollback(12345).error().code, ErrorCode::TransactionNotFound);
}

TEST_F(InMemoryRowLockStoreTest, EmptyNameIsInvalid) {
    auto txn = store.openTransaction().value();
    EXPECT_EQ(store.readForUpdate(txn, "").error().code, ErrorCode::InvalidArg);
    EXPECT_EQ(store.insert(txn, LockRecord {""}).error().code, ErrorCode::InvalidArg);
}

TEST_F(InMemoryRowLockStoreTest, ReadForUpdateWaitsForCommit) {
    seed("L");
    auto a = store.openTransaction().value();
    ASSERT_TRUE(store.readForUpdate(a, "L").value().has_value());
    auto b = store.openTransaction().value();
    std::atomic<bool> acquired {false};
    auto waiter = std::async(std::launch::async, [this, b, &acquired]() {
        auto r = store.readForUpdate(b, "L");
        acquired = true;
        return r;
    });
    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(acquired.load());
    ASSERT_TRUE(store.update(a, makeRecord("L", "10.0.0.1", 1, 1)).has_value());
    ASSERT_TRUE(store.commit(a).has_value());
    auto r = waiter.get();
    ASSERT_TRUE(r.has_value());
    ASSERT_TRUE(r.value().has_value());
    EXPECT_EQ(r.value()->count, 1U);
    EXPECT_EQ(store.owner("L"), b);
}

TEST_F(InMemoryRowLockStoreTest, ReadForUpdateUntilTimesOut) {
    seed("L");
    auto a = store.openTransaction().value();
    ASSERT_TRUE(store.readForUpdate(a, "L").value().has_value());
    auto b = store.openTransaction().value();
    const auto start = std::chrono::steady_clock::now();
    auto r = store.readForUpdateUntil(b, "L", start + 100ms);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::Timeout);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 100ms);
    EXPECT_EQ(store.owner("L"), a);
}

TEST_F(InMemoryRowLockStoreTest, RowLockIsReentrantWithinATransaction) {
    seed("L");
    auto txn = store.openTransaction().value();
    ASSERT_TRUE(store.readForUpdateNoWait(txn, "L").has_value());
    EXPECT_TRUE(store.readForUpdateNoWait(txn, "L").has_value());
    EXPECT_TRUE(store.readForUpdate(txn, "L").has_value());
}

TEST_F(InMemoryRowLockStoreTest, PlainReadTakesNoLock) {
    seed("L");
    auto a = store.openTransaction().value();
    auto b = store.openTransaction().value();
    ASSERT_TRUE(store.read(a, "L").value().has_value());
    EXPECT_FALSE(store.owner("L").has_value());
    EXPECT_TRUE(store.readForUpdateNoWait(b, "L").has_value());
}

TEST(InMemoryRowLockStoreIdleTest, AbandonedTransactionIsRolledBack) {
    InMemoryRowLockStore store {100ms};
    auto abandoned = store.openTransaction().value();
    ASSERT_TRUE(store.insert(abandoned, makeRecord("orders", "10.0.0.1", 1, 1)).has_value());
    EXPECT_EQ(store.owner("orders"), abandoned);

    auto next = store.openTransaction().value();
    auto r = store.readForUpdateUntil(next, "orders", std::chrono::steady_clock::now() + 2s);
    // The abandoned insert is undone, so the row is gone rather than handed over.
    ASSERT_TRUE(r.has_value());
    EXPECT_FALSE(r.value().has_value());
    EXPECT_EQ(store.isOpen(abandoned), false);
    EXPECT_EQ(store.rollback(abandoned).error().code, ErrorCode::TransactionNotFound);
    EXPECT_EQ(store.isOpen(next), true);
    ASSERT_TRUE(store.commit(next).has_value());
}

TEST(InMemoryRowLockStoreIdleTest, AbandonedHolderReleasesRowToWaiter) {
    InMemoryRowLockStore store {100ms};
    auto seed = store.openTransaction().value();
    ASSERT_TRUE(store.insert(seed, makeRecord("orders", "", 0, 0)).has_value());
    ASSERT_TRUE(store.commit(seed).has_value());

    auto crashed = store.openTransaction().value();
    ASSERT_TRUE(store.readForUpdate(crashed, "orders").value().has_value());
    ASSERT_TRUE(store.update(crashed, makeRecord("orders", "10.0.0.1", 1, 1)).has_value());

    auto waiter = store.openTransaction().value();
    auto r = store.readForUpdate(waiter, "orders");
    ASSERT_TRUE(r.has_value());
    ASSERT_TRUE(r.value().has_value());
    EXPECT_EQ(r.value()->count, 0U);
    EXPECT_EQ(store.owner("orders"), waiter);
    EXPECT_EQ(store.openTransactions(), 1U);
    ASSERT_TRUE(store.commit(waiter).has_value());
}

TEST(InMemoryRowLockStoreIdleTest, UsedTransactionStaysOpen) {
    InMemoryRowLockStore store {150ms};
    auto txn = store.openTransaction().value();
    for (int i = 0; i < 6; ++i) {
        std::this_thread::sleep_for(60ms);
        ASSERT_EQ(store.isOpen(txn), true);
    }
    std::this_thread::sleep_for(400ms);
    EXPECT_EQ(store.isOpen(txn), false);
}

TEST(InMemoryRowLockStoreIdleTest, NoTimeoutNeverReaps) {
    InMemoryRowLockStore store;
    auto txn = store.openTransaction().value();
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(store.reapIdle(), 0U);
    EXPECT_EQ(store.isOpen(txn), true);
    ASSERT_TRUE(store.rollback(txn).has_value());
}

TEST(InMemoryRowLockStoreIdleTest, NegativeTimeoutIsRejected) {
    EXPECT_THROW(InMemoryRowLockStore {std::chrono::milliseconds{-1}}, std::invalid_argument);
}
