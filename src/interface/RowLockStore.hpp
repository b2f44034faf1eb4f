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
#ifndef ROW_LOCK_STORE_HPP
#define ROW_LOCK_STORE_HPP
#include "common/Types.hpp"
#include "common/Error.hpp"
#include <chrono>
#include <expected>
#include <optional>
#include <variant>

namespace dlock {

// Transactional table of LockRecord rows keyed by name, with row-level
// exclusive locks held until the owning transaction commits or rolls back.
//
// Every operation other than openTransaction fails with TransactionNotFound
// for a transaction that is not open. Reads return std::nullopt for a name
// that has no row.
class RowLockStore {
public:
    virtual ~RowLockStore() = default;

    virtual std::expected<TransactionId, Error> openTransaction() = 0;

    // SELECT ... FOR UPDATE: waits for the row lock.
    virtual std::expected<std::optional<LockRecord>, Error> readForUpdate(TransactionId txn, const std::string& name) = 0;
    // Same as readForUpdate but gives up with Timeout at the deadline.
    virtual std::expected<std::optional<LockRecord>, Error> readForUpdateUntil(TransactionId txn, const std::string& name, std::chrono::steady_clock::time_point deadline) = 0;
    // SELECT ... FOR UPDATE NOWAIT: fails with Contention when another
    // transaction holds the row.
    virtual std::expected<std::optional<LockRecord>, Error> readForUpdateNoWait(TransactionId txn, const std::string& name) = 0;
    // Plain read, takes no lock.
    virtual std::expected<std::optional<LockRecord>, Error> read(TransactionId txn, const std::string& name) = 0;

    // Fails with AlreadyExists when a row with the same name exists. The new
    // row is locked by txn.
    virtual std::expected<std::monostate, Error> insert(TransactionId txn, const LockRecord& record) = 0;
    // Requires the row lock. createdAt is kept, updatedAt is set by the store.
    virtual std::expected<std::monostate, Error> update(TransactionId txn, const LockRecord& record) = 0;

    virtual std::expected<std::monostate, Error> commit(TransactionId txn) = 0;
    virtual std::expected<std::monostate, Error> rollback(TransactionId txn) = 0;
    virtual std::expected<bool, Error> isOpen(TransactionId txn) = 0;
};

} // namespace dlock

#endif // ROW_LOCK_STORE_HPP
