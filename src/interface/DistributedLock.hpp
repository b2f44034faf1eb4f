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
#ifndef DISTRIBUTED_LOCK_HPP
#define DISTRIBUTED_LOCK_HPP
#include "common/Error.hpp"
#include "lock/HolderIdentity.hpp"
#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <variant>

namespace dlock {

// Outcome of one acquisition step against a backend.
enum class Acquisition : char {
    Acquired,
    Contended
};

enum class AcquireMode : char {
    Blocking,
    NonBlocking,
    Timed
};

// Named lock shared between processes, reentrant for the holder that owns
// the instance. An instance belongs to one holder and is not thread-safe;
// give each thread its own instance over a shared store.
class DistributedLock {
public:
    virtual ~DistributedLock() = default;

    // Returns once the lock is held, or with the backend error.
    virtual std::expected<std::monostate, Error> lock(const std::string& name) = 0;
    // Single attempt.
    virtual std::expected<bool, Error> tryLock(const std::string& name) = 0;
    // Polls until acquired or the timeout elapses.
    virtual std::expected<bool, Error> tryLock(const std::string& name, std::chrono::milliseconds timeout) = 0;
    // Releases one hold. A name this holder does not hold is a no-op.
    virtual std::expected<std::monostate, Error> unlock(const std::string& name) = 0;

    [[nodiscard]] virtual bool holds(const std::string& name) const = 0;
    [[nodiscard]] virtual uint64_t holdCount(const std::string& name) const = 0;
    [[nodiscard]] virtual const HolderIdentity& holder() const = 0;
};

} // namespace dlock

#endif // DISTRIBUTED_LOCK_HPP
