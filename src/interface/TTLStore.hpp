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
#ifndef TTL_STORE_HPP
#define TTL_STORE_HPP
#include "common/Types.hpp"
#include "common/Error.hpp"
#include <chrono>
#include <expected>
#include <optional>

namespace dlock {

// Key-value store whose keys expire on the store side. Implementations must
// make setIfAbsent and setIfPresent atomic and be safe for concurrent use.
class TTLStore {
public:
    virtual ~TTLStore() = default;

    // true when the key was absent (or expired) and is now set.
    virtual std::expected<bool, Error> setIfAbsent(const Key& key, const Value& value, std::chrono::milliseconds ttl) = 0;
    // true when the key was present and its value and expiry were replaced.
    // Never creates a key.
    virtual std::expected<bool, Error> setIfPresent(const Key& key, const Value& value, std::chrono::milliseconds ttl) = 0;
    virtual std::expected<std::optional<Value>, Error> get(const Key& key) const = 0;
    // true when a live key was removed.
    virtual std::expected<bool, Error> erase(const Key& key) = 0;
};

} // namespace dlock

#endif // TTL_STORE_HPP
