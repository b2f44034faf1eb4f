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
#ifndef ROW_LOCK_HPP
#define ROW_LOCK_HPP

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <variant>
#include "common/Error.hpp"
#include "common/LockConfig.hpp"
#include "common/Types.hpp"
#include "interface/DistributedLock.hpp"
#include "interface/RowLockStore.hpp"
#include "lock/HolderIdentity.hpp"
#include "lock/ReentrancyTracker.hpp"

namespace dlock {

// Lock backed by the row lock on the name's LockRecord. The row lock is held
// by a transaction that stays open from the first acquisition until the last
// release commits it. Each holder gets its own instance over a shared store.
class RowLock : public DistributedLock {
public:
    explicit RowLock(RowLockStore& s, LockConfig c = LockConfig{}, HolderIdentity h = HolderIdentity::current());
    // Rolls back the transactions of names still held.
    ~RowLock() override;
    RowLock(const RowLock&) = delete;
    RowLock& operator=(const RowLock&) = delete;

    std::expected<std::monostate, Error> lock(const std::string& name) override;
    std::expected<bool, Error> tryLock(const std::string& name) override;
    std::expected<bool, Error> tryLock(const std::string& name, std::chrono::milliseconds timeout) override;
    std::expected<std::monostate, Error> unlock(const std::string& name) override;

    [[nodiscard]] bool holds(const std::string& name) const override;
    [[nodiscard]] uint64_t holdCount(const std::string& name) const override;
    [[nodiscard]] const HolderIdentity& holder() const override;
private:
    std::expected<bool, Error> acquire(const std::string& name, AcquireMode mode, std::chrono::milliseconds timeout);
    // Locks the name's row in txn, inserting the row first if it does not
    // exist yet.
    std::expected<Acquisition, Error> selectForUpdate(TransactionId txn, const std::string& name, AcquireMode mode);
    LockRecord record(const std::string& name, uint64_t count) const;
    void abandon(TransactionId txn, const std::string& name);

    RowLockStore& store;
    const LockConfig config;
    const HolderIdentity identity;
    ReentrancyTracker<TransactionId> tracker;
};

} // namespace dlock

#endif // ROW_LOCK_HPP
