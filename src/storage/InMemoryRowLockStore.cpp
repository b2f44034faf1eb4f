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
#include "storage/InMemoryRowLockStore.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <expected>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include <spdlog/spdlog.h>
#include "common/Error.hpp"
#include "common/Types.hpp"

namespace dlock {

InMemoryRowLockStore::InMemoryRowLockStore(std::chrono::milliseconds idle)
    : rows{}, transactions{}, idleTimeout {idle}, m{}, released{}, reaping {idle.count() > 0}, reaperWakeup{} {
    if (idleTimeout.count() < 0) {
        throw std::invalid_argument("idleTimeout must be non-negative");
    }
    if (!reaping) {
        return;
    }
    const auto sweep = std::max(idleTimeout / 4, std::chrono::milliseconds{10});
    reaper = std::thread([this, sweep]() {
        while (true) {
            {
                std::unique_lock lock {m};
                if (reaperWakeup.wait_for(lock, sweep, [this]{ return !reaping; })) break;
            }
            reapIdle();
        }
    });
}

InMemoryRowLockStore::~InMemoryRowLockStore() {
    {
        const std::lock_guard lock {m};
        reaping = false;
    }
    reaperWakeup.notify_all();
    if (reaper.joinable()) reaper.join();
}

std::expected<std::monostate, Error> InMemoryRowLockStore::checkOpen(TransactionId txn) {
    auto t = transactions.find(txn);
    if (t == transactions.end()) {
        return std::unexpected {Error {ErrorCode::TransactionNotFound, "Transaction " + std::to_string(txn) + " is not open"}};
    }
    t->second.lastUsed = std::chrono::steady_clock::now();
    return {};
}

void InMemoryRowLockStore::undo(TransactionId txn) {
    auto& log = transactions.at(txn).undo;
    for (auto u = log.rbegin(); u != log.rend(); ++u) {
        if (!u->second.has_value()) {
            rows.erase(u->first);
        } else if (auto r = rows.find(u->first); r != rows.end()) {
            r->second.record = u->second.value();
        }
    }
}

void InMemoryRowLockStore::finish(TransactionId txn) {
    auto t = transactions.find(txn);
    for (const auto& name : t->second.locked) {
        auto r = rows.find(name);
        if (r != rows.end() && r->second.owner == txn) {
            r->second.owner.reset();
        }
    }
    transactions.erase(t);
    released.notify_all();
}

std::expected<TransactionId, Error> InMemoryRowLockStore::openTransaction() {
    const std::lock_guard lock {m};
    auto txn = nextTransaction++;
    auto t = Transaction {};
    t.lastUsed = std::chrono::steady_clock::now();
    transactions.emplace(txn, std::move(t));
    return txn;
}

std::expected<std::optional<LockRecord>, Error> InMemoryRowLockStore::lockRow(
    TransactionId txn,
    const std::string& name,
    Wait wait,
    std::chrono::steady_clock::time_point deadline) {
    if (name.empty()) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "Lock name must not be empty"}};
    }
    std::unique_lock lock {m};
    while (true) {
        if (auto o = checkOpen(txn); !o.has_value()) {
            return std::unexpected {o.error()};
        }
        auto i = rows.find(name);
        if (i == rows.end()) {
            return std::nullopt;
        }
        auto& row = i->second;
        if (!row.owner.has_value() || row.owner.value() == txn) {
            row.owner = txn;
            transactions.at(txn).locked.insert(name);
            return row.record;
        }
        switch (wait) {
            case Wait::Never:
                return std::unexpected {Error {ErrorCode::Contention, "Row is locked by transaction " + std::to_string(row.owner.value()), name}};
            case Wait::Until:
                if (std::chrono::steady_clock::now() >= deadline) {
                    return std::unexpected {Error {ErrorCode::Timeout, "Timed out waiting for row lock", name}};
                }
                ++transactions.at(txn).waiting;
                released.wait_until(lock, deadline);
                break;
            case Wait::Forever:
                ++transactions.at(txn).waiting;
                released.wait(lock);
                break;
        }
        // The transaction may have been finished while we waited.
        if (auto t = transactions.find(txn); t != transactions.end()) {
            --t->second.waiting;
        }
    }
}

std::expected<std::optional<LockRecord>, Error> InMemoryRowLockStore::readForUpdate(TransactionId txn, const std::string& name) {
    return lockRow(txn, name, Wait::Forever, {});
}

std::expected<std::optional<LockRecord>, Error> InMemoryRowLockStore::readForUpdateUntil(TransactionId txn, const std::string& name, std::chrono::steady_clock::time_point deadline) {
    return lockRow(txn, name, Wait::Until, deadline);
}

std::expected<std::optional<LockRecord>, Error> InMemoryRowLockStore::readForUpdateNoWait(TransactionId txn, const std::string& name) {
    return lockRow(txn, name, Wait::Never, {});
}

std::expected<std::optional<LockRecord>, Error> InMemoryRowLockStore::read(TransactionId txn, const std::string& name) {
    const std::lock_guard lock {m};
    if (auto o = checkOpen(txn); !o.has_value()) {
        return std::unexpected {o.error()};
    }
    auto i = rows.find(name);
    if (i == rows.end()) {
        return std::nullopt;
    }
    return i->second.record;
}

std::expected<std::monostate, Error> InMemoryRowLockStore::insert(TransactionId txn, const LockRecord& record) {
    if (record.name.empty()) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "Lock name must not be empty"}};
    }
    const std::lock_guard lock {m};
    if (auto o = checkOpen(txn); !o.has_value()) {
        return o;
    }
    if (rows.contains(record.name)) {
        return std::unexpected {Error {ErrorCode::AlreadyExists, "Duplicate entry for lock", record.name}};
    }
    auto row = Row {record, txn};
    row.record.createdAt = std::chrono::system_clock::now();
    row.record.updatedAt = row.record.createdAt;
    rows.emplace(record.name, std::move(row));
    auto& t = transactions.at(txn);
    t.undo.emplace_back(record.name, std::nullopt);
    t.locked.insert(record.name);
    return {};
}

std::expected<std::monostate, Error> InMemoryRowLockStore::update(TransactionId txn, const LockRecord& record) {
    const std::lock_guard lock {m};
    if (auto o = checkOpen(txn); !o.has_value()) {
        return o;
    }
    auto i = rows.find(record.name);
    if (i == rows.end()) {
        return std::unexpected {Error {ErrorCode::KeyNotFound, "No row for lock", record.name}};
    }
    auto& row = i->second;
    if (row.owner != txn) {
        return std::unexpected {Error {ErrorCode::Contention, "Row lock is not held by transaction " + std::to_string(txn), record.name}};
    }
    transactions.at(txn).undo.emplace_back(record.name, row.record);
    row.record.ip = record.ip;
    row.record.threadId = record.threadId;
    row.record.count = record.count;
    row.record.updatedAt = std::chrono::system_clock::now();
    return {};
}

std::expected<std::monostate, Error> InMemoryRowLockStore::commit(TransactionId txn) {
    const std::lock_guard lock {m};
    if (auto o = checkOpen(txn); !o.has_value()) {
        return o;
    }
    finish(txn);
    return {};
}

std::expected<std::monostate, Error> InMemoryRowLockStore::rollback(TransactionId txn) {
    const std::lock_guard lock {m};
    if (auto o = checkOpen(txn); !o.has_value()) {
        return o;
    }
    spdlog::debug("InMemoryRowLockStore: rolled back transaction {} ({} writes)", txn, transactions.at(txn).undo.size());
    undo(txn);
    finish(txn);
    return {};
}

std::expected<bool, Error> InMemoryRowLockStore::isOpen(TransactionId txn) {
    const std::lock_guard lock {m};
    return checkOpen(txn).has_value();
}

size_t InMemoryRowLockStore::reapIdle() {
    if (idleTimeout.count() == 0) {
        return 0;
    }
    const std::lock_guard lock {m};
    const auto now = std::chrono::steady_clock::now();
    std::vector<TransactionId> idle;
    for (const auto& [txn, t] : transactions) {
        if (t.waiting == 0 && now - t.lastUsed > idleTimeout) {
            idle.push_back(txn);
        }
    }
    for (auto txn : idle) {
        spdlog::warn("InMemoryRowLockStore: transaction {} idle for over {}ms, rolling back", txn, idleTimeout.count());
        undo(txn);
        finish(txn);
    }
    return idle.size();
}

std::optional<LockRecord> InMemoryRowLockStore::find(const std::string& name) const {
    const std::lock_guard lock {m};
    auto i = rows.find(name);
    if (i == rows.end()) {
        return std::nullopt;
    }
    return i->second.record;
}

std::optional<TransactionId> InMemoryRowLockStore::owner(const std::string& name) const {
    const std::lock_guard lock {m};
    auto i = rows.find(name);
    if (i == rows.end()) {
        return std::nullopt;
    }
    return i->second.owner;
}

size_t InMemoryRowLockStore::openTransactions() const {
    const std::lock_guard lock {m};
    return transactions.size();
}

size_t InMemoryRowLockStore::size() const {
    const std::lock_guard lock {m};
    return rows.size();
}

} // namespace dlock
