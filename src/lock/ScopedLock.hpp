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
#ifndef SCOPED_LOCK_HPP
#define SCOPED_LOCK_HPP

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <variant>
#include "common/Error.hpp"
#include "interface/DistributedLock.hpp"

namespace dlock {

// Holds one acquisition of a name for the lifetime of the object. Move only.
// Errors on release in the destructor are logged; call release() to see
// them.
class ScopedLock {
public:
    static std::expected<ScopedLock, Error> acquire(DistributedLock& l, const std::string& name);
    // std::nullopt when the name is held elsewhere.
    static std::expected<std::optional<ScopedLock>, Error> tryAcquire(DistributedLock& l, const std::string& name);
    static std::expected<std::optional<ScopedLock>, Error> tryAcquire(DistributedLock& l, const std::string& name, std::chrono::milliseconds timeout);

    ~ScopedLock();
    ScopedLock(ScopedLock&& other) noexcept;
    ScopedLock& operator=(ScopedLock&& other) noexcept;
    ScopedLock(const ScopedLock&) = delete;
    ScopedLock& operator=(const ScopedLock&) = delete;

    std::expected<std::monostate, Error> release();
    [[nodiscard]] bool owns() const;
    [[nodiscard]] const std::string& name() const;
private:
    ScopedLock(DistributedLock& l, std::string n);

    DistributedLock* lock;
    std::string lockName;
};

} // namespace dlock

#endif // SCOPED_LOCK_HPP
