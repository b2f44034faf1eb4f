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
#include "lock/RowLock.hpp"
#include <algorithm>
#include <chrono>
#include <optional>
#include <thread>
#include <utility>
#include <spdlog/spdlog.h>

namespace dlock {

RowLock::RowLock(RowLockStore& s, LockConfig c, HolderIdentity h)
    : store {s}, config {c}, identity {std::move(h)}, tracker {} {}

RowLock::~RowLock() {
    for (const auto& name : tracker.names()) {
        spdlog::warn("RowLock: {} destroyed while holding {}, rolling back", identity.toString(), name);
        auto txn = tracker.forget(name);
        abandon(txn.value(), name);
    }
}

std::expected<std::monostate, Error> RowLock::lock(const std::string& name) {
    auto r = acquire(name, AcquireMode::Blocking, std::chrono::milliseconds{0});
    if (!r.has_value()) {
        return std::unexpected {r.error()};
    }
    return {};
}

std::expected<bool, Error> RowLock::tryLock(const std::string& name) {
    return acquire(name, AcquireMode::NonBlocking, std::chrono::milliseconds{0});
}

std::expected<bool, Error> RowLock::tryLock(const std::string& name, std::chrono::milliseconds timeout) {
    return acquire(name, AcquireMode::Timed, timeout);
}

LockRecord RowLock::record(const std::string& name, uint64_t count) const {
    LockRecord r {name};
    r.ip = identity.networkAddress;
    r.threadId = identity.taskId;
    r.count = count;
    return r;
}

void RowLock::abandon(TransactionId txn, const std::string& name) {
    if (auto r = store.rollback(txn); !r.has_value()) {
        spdlog::warn("RowLock: rollback of transaction {} for {} failed: {}", txn, name, r.error().what);
    }
}

std::expected<Acquisition, Error> RowLock::selectForUpdate(TransactionId txn, const std::string& name, AcquireMode mode) {
    while (true) {
        auto r = mode == AcquireMode::Blocking
            ? store.readForUpdate(txn, name)
            : store.readForUpdateNoWait(txn, name);
        if (!r.has_value()) {
            if (r.error().code == ErrorCode::Contention) {
                spdlog::debug("RowLock: {} is held elsewhere", name);
                return Acquisition::Contended;
            }
            return std::unexpected {r.error()};
        }
        if (r.value().has_value()) {
            return Acquisition::Acquired;
        }
        auto i = store.insert(txn, record(name, 0));
        if (!i.has_value()) {
            if (i.error().code != ErrorCode::AlreadyExists) {
                return std::unexpected {i.error()};
            }
            spdlog::debug("RowLock: lost the race to create the row for {}", name);
        }
    }
}

std::expected<bool, Error> RowLock::acquire(const std::string& name, AcquireMode mode, std::chrono::milliseconds timeout) {
    if (name.empty()) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "Lock name must not be empty"}};
    }
    if (tracker.holds(name)) {
        auto count = tracker.reenter(name);
        spdlog::debug("RowLock: {} re-entered {} ({})", identity.toString(), name, count);
        return true;
    }
    auto txn = store.openTransaction();
    if (!txn.has_value()) {
        spdlog::error("RowLock: cannot open a transaction for {}: {}", name, txn.error().what);
        return std::unexpected {txn.error()};
    }
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto a = selectForUpdate(txn.value(), name, mode);
        if (!a.has_value()) {
            spdlog::error("RowLock: acquiring {} failed: {}", name, a.error().what);
            abandon(txn.value(), name);
            return std::unexpected {a.error()};
        }
        if (a.value() == Acquisition::Acquired) {
            break;
        }
        if (mode == AcquireMode::NonBlocking) {
            abandon(txn.value(), name);
            return false;
        }
        if (mode == AcquireMode::Timed) {
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                abandon(txn.value(), name);
                return false;
            }
            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(config.pollInterval, deadline - now));
        } else {
            std::this_thread::sleep_for(config.pollInterval);
        }
    }
    if (auto u = store.update(txn.value(), record(name, 1)); !u.has_value()) {
        spdlog::error("RowLock: recording the holder of {} failed: {}", name, u.error().what);
        abandon(txn.value(), name);
        return std::unexpected {u.error()};
    }
    tracker.track(name, txn.value());
    spdlog::debug("RowLock: {} acquired {} in transaction {}", identity.toString(), name, txn.value());
    return true;
}

std::expected<std::monostate, Error> RowLock::unlock(const std::string& name) {
    auto* entry = tracker.find(name);
    if (entry == nullptr) {
        spdlog::debug("RowLock: {} does not hold {}, nothing to release", identity.toString(), name);
        return {};
    }
    const auto txn = entry->handle;
    auto r = store.read(txn, name);
    if (!r.has_value()) {
        if (r.error().code == ErrorCode::TransactionNotFound) {
            spdlog::error("RowLock: transaction {} holding {} is gone", txn, name);
            tracker.forget(name);
        }
        return std::unexpected {r.error()};
    }
    if (!r.value().has_value()) {
        spdlog::warn("RowLock: no row for {}, nothing to release", name);
        return {};
    }
    const auto& persisted = r.value().value();
    if (persisted.ip != identity.networkAddress || persisted.threadId != identity.taskId) {
        spdlog::warn("RowLock: {} is recorded as held by {}:{}, not {}", name, persisted.ip, persisted.threadId, identity.toString());
        return {};
    }
    if (persisted.count == 0) {
        spdlog::warn("RowLock: {} is recorded as released already", name);
        return {};
    }
    // Re-entry is local only, so the row records a single hold until the last
    // release writes 0 in the transaction that commits.
    if (entry->count > 1) {
        auto left = tracker.release(name);
        spdlog::debug("RowLock: {} released one hold on {} ({} left)", identity.toString(), name, left);
        return {};
    }
    if (auto u = store.update(txn, record(name, 0)); !u.has_value()) {
        spdlog::error("RowLock: writing the release of {} failed: {}", name, u.error().what);
        return std::unexpected {u.error()};
    }
    tracker.forget(name);
    if (auto c = store.commit(txn); !c.has_value()) {
        spdlog::error("RowLock: commit of transaction {} for {} failed: {}", txn, name, c.error().what);
        abandon(txn, name);
        return std::unexpected {c.error()};
    }
    spdlog::debug("RowLock: {} released {}", identity.toString(), name);
    return {};
}

bool RowLock::holds(const std::string& name) const {
    return tracker.holds(name);
}

uint64_t RowLock::holdCount(const std::string& name) const {
    return tracker.count(name);
}

const HolderIdentity& RowLock::holder() const {
    return identity;
}

} // namespace dlock
