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
#ifndef IN_MEMORY_TTL_STORE_H
#define IN_MEMORY_TTL_STORE_H

#include <chrono>
#include <cstdint>
#include <unordered_map>
#include <shared_mutex>
#include <expected>
#include <optional>
#include "common/Error.hpp"
#include "common/Types.hpp"
#include "interface/TTLStore.hpp"

namespace dlock {

// Expired entries are treated as absent on every access. They are dropped by
// the next write that touches them, and swept every purgeInterval calls to
// setIfAbsent so that keys of holders that went away do not pile up.
class InMemoryTTLStore : public TTLStore {
public:
    InMemoryTTLStore();
    std::expected<bool, Error> setIfAbsent(const Key& key, const Value& value, std::chrono::milliseconds ttl) override;
    std::expected<bool, Error> setIfPresent(const Key& key, const Value& value, std::chrono::milliseconds ttl) override;
    std::expected<std::optional<Value>, Error> get(const Key& key) const override;
    std::expected<bool, Error> erase(const Key& key) override;
    [[nodiscard]] std::optional<std::chrono::milliseconds> remaining(const Key& key) const;
    size_t size() const;
    // Drops every expired entry and returns how many were dropped.
    size_t purgeExpired();

    static constexpr uint64_t purgeInterval {64};
private:
    struct Entry {
        Value value;
        std::chrono::steady_clock::time_point expiresAt;
    };
    static bool live(const Entry& e, std::chrono::steady_clock::time_point now);
    // Requires m to be held exclusively.
    size_t purge(std::chrono::steady_clock::time_point now);
    std::unordered_map<Key, Entry, KeyHash> store;
    uint64_t absentWrites;
    mutable std::shared_mutex m;
};

} // namespace dlock

#endif // IN_MEMORY_TTL_STORE_H
