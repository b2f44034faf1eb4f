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
#include "lock/ScopedLock.hpp"
#include <utility>
#include <spdlog/spdlog.h>

namespace dlock {

ScopedLock::ScopedLock(DistributedLock& l, std::string n)
    : lock {&l}, lockName {std::move(n)} {}

std::expected<ScopedLock, Error> ScopedLock::acquire(DistributedLock& l, const std::string& name) {
    if (auto r = l.lock(name); !r.has_value()) {
        return std::unexpected {r.error()};
    }
    return ScopedLock {l, name};
}

std::expected<std::optional<ScopedLock>, Error> ScopedLock::tryAcquire(DistributedLock& l, const std::string& name) {
    auto r = l.tryLock(name);
    if (!r.has_value()) {
        return std::unexpected {r.error()};
    }
    if (!r.value()) {
        return std::nullopt;
    }
    return std::optional<ScopedLock> {ScopedLock {l, name}};
}

std::expected<std::optional<ScopedLock>, Error> ScopedLock::tryAcquire(DistributedLock& l, const std::string& name, std::chrono::milliseconds timeout) {
    auto r = l.tryLock(name, timeout);
    if (!r.has_value()) {
        return std::unexpected {r.error()};
    }
    if (!r.value()) {
        return std::nullopt;
    }
    return std::optional<ScopedLock> {ScopedLock {l, name}};
}

ScopedLock::ScopedLock(ScopedLock&& other) noexcept
    : lock {std::exchange(other.lock, nullptr)}, lockName {std::move(other.lockName)} {}

ScopedLock& ScopedLock::operator=(ScopedLock&& other) noexcept {
    if (this != &other) {
        if (lock) {
            if (auto r = lock->unlock(lockName); !r.has_value()) {
                spdlog::error("ScopedLock: releasing {} failed: {}", lockName, r.error().what);
            }
        }
        lock = std::exchange(other.lock, nullptr);
        lockName = std::move(other.lockName);
    }
    return *this;
}

ScopedLock::~ScopedLock() {
    if (lock) {
        if (auto r = lock->unlock(lockName); !r.has_value()) {
            spdlog::error("ScopedLock: releasing {} failed: {}", lockName, r.error().what);
        }
    }
}

std::expected<std::monostate, Error> ScopedLock::release() {
    if (!lock) {
        return {};
    }
    auto* l = std::exchange(lock, nullptr);
    return l->unlock(lockName);
}

bool ScopedLock::owns() const {
    return lock != nullptr;
}

const std::string& ScopedLock::name() const {
    return lockName;
}

} // namespace dlock
