// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * DLock distributed, reentrant locks.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#ifndef IN_MEMORY_ROW_LOCK_STORE_H
#define IN_MEMORY_ROW_LOCK_STORE_H

#include <chrono>
#include <condition_variable>
#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>
#include "common/Error.hpp"
#include "common/Types.hpp"
#include "interface/RowLockStore.hpp"

namespace dlock {

// Single-node emulation of a relational lock table. Writes are applied in
// place and undone on rollback; row locks are exclusive and released only by
// commit or rollback. No gap locks: a read of a missing row locks nothing,
// uniqueness of inserts is what serialises first acquisitions.
// With a non-zero idle timeout, a transaction that sees no call for that long
// is rolled back by a background sweep, as a database would on a dropped
// connection. Zero keeps transactions open until commit or rollback.
class InMemoryRowLockStore : public RowLockStore {
public:
    explicit InMemoryRowLockStore(std::chrono::milliseconds idleTimeout = std::chrono::milliseconds{0});
    ~InMemoryRowLockStore() override;
    InMemoryRowLockStore(const InMemoryRowLockStore&) = delete;
    InMemoryRowLockStore& operator=(const InMemoryRowLockStore&) = delete;

    std::expected<TransactionId, Error> openTransaction() override;
    std::expected<std::optional<LockRecord>, Error> readForUpdate(TransactionId txn, const std::string& name) override;
    std::expected<std::optional<LockRecord>, Error> readForUpdateUntil(TransactionId txn, const std::string& name, std::chrono::steady_clock::time_point deadline) override;
    std::expected<std::optional<LockRecord>, Error> readForUpdateNoWait(TransactionId txn, const std::string& name) override;
    std::expected<std::optional<LockRecord>, Error> read(TransactionId txn, const std::string& name) override;
    std::expected<std::monostate, Error> insert(TransactionId txn, const LockRecord& record) override;
    std::expected<std::monostate, Error> update(TransactionId txn, const LockRecord& record) override;
    std::expected<std::monostate, Error> commit(TransactionId txn) override;
    std::expected<std::monostate, Error> rollback(TransactionId txn) override;
    std::expected<bool, Error> isOpen(TransactionId txn) override;

    // Committed or in-flight state of a row, outside of any transaction.
    [[nodiscard]] std::optional<LockRecord> find(const std::string& name) const;
    [[nodiscard]] std::optional<TransactionId> owner(const std::string& name) const;
    [[nodiscard]] size_t openTransactions() const;
    [[nodiscard]] size_t size() const;
    // Rolls back every transaction idle for longer than the idle timeout and
    // returns how many were reaped.
    size_t reapIdle();
private:
    struct Row {
        LockRecord record;
        std::optional<TransactionId> owner;
    };
    struct Transaction {
        // Prior image of every row written, std::nullopt for rows inserted.
        std::vector<std::pair<std::string, std::optional<LockRecord>>> undo;
        std::unordered_set<std::string> locked;
        std::chrono::steady_clock::time_point lastUsed;
        int waiting {0};
    };
    enum class Wait : char {
        Forever,
        Until,
        Never
    };

    std::expected<std::optional<LockRecord>, Error> lockRow(
        TransactionId txn,
        const std::string& name,
        Wait wait,
        std::chrono::steady_clock::time_point deadline);
    // All require m to be held. checkOpen renews the transaction's idle lease.
    std::expected<std::monostate, Error> checkOpen(TransactionId txn);
    void undo(TransactionId txn);
    void finish(TransactionId txn);

    std::unordered_map<std::string, Row> rows;
    std::unordered_map<TransactionId, Transaction> transactions;
    TransactionId nextTransaction {1};
    const std::chrono::milliseconds idleTimeout;
    mutable std::mutex m;
    std::condition_variable released;
    bool reaping;
    std::condition_variable reaperWakeup;
    std::thread reaper;
};

} // namespace dlock

#endif // IN_MEMORY_ROW_LOCK_STORE_H
