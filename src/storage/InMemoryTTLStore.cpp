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
#include "storage/InMemoryTTLStore.hpp"
#include <chrono>
#include <expected>
#include <optional>
#include <shared_mutex>
#include <mutex>
#include <algorithm>
#include <cstddef>
#include <variant>
#include "common/Error.hpp"
#include "common/Types.hpp"

namespace dlock {

namespace {

std::expected<std::monostate, Error> validate(const Key& key, std::chrono::milliseconds ttl) {
    if (key.data.empty()) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "Key must not be empty"}};
    }
    if (ttl <= std::chrono::milliseconds::zero()) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "TTL must be positive", key.data}};
    }
    return {};
}

} // namespace

InMemoryTTLStore::InMemoryTTLStore() : store{}, absentWrites {0}, m{} {}

size_t InMemoryTTLStore::purge(std::chrono::steady_clock::time_point now) {
    return static_cast<size_t>(std::erase_if(store, [now](const auto& p) {
        return !live(p.second, now);
    }));
}

size_t InMemoryTTLStore::purgeExpired() {
    const std::unique_lock lock {m};
    return purge(std::chrono::steady_clock::now());
}

bool InMemoryTTLStore::live(const Entry& e, std::chrono::steady_clock::time_point now) {
    return e.expiresAt > now;
}

std::expected<bool, Error> InMemoryTTLStore::setIfAbsent(const Key& key, const Value& value, std::chrono::milliseconds ttl) {
    if (auto v = validate(key, ttl); !v.has_value()) {
        return std::unexpected {v.error()};
    }
    const std::unique_lock lock {m};
    const auto now = std::chrono::steady_clock::now();
    if (++absentWrites % purgeInterval == 0) {
        purge(now);
    }
    auto i = store.find(key);
    if (i != store.end()) {
        if (live(i->second, now)) {
            return false;
        }
        i->second = Entry{value, now + ttl};
        return true;
    }
    store.emplace(key, Entry{value, now + ttl});
    return true;
}

std::expected<bool, Error> InMemoryTTLStore::setIfPresent(const Key& key, const Value& value, std::chrono::milliseconds ttl) {
    if (auto v = validate(key, ttl); !v.has_value()) {
        return std::unexpected {v.error()};
    }
    const std::unique_lock lock {m};
    const auto now = std::chrono::steady_clock::now();
    auto i = store.find(key);
    if (i == store.end()) {
        return false;
    }
    if (!live(i->second, now)) {
        store.erase(i);
        return false;
    }
    i->second = Entry{value, now + ttl};
    return true;
}

std::expected<std::optional<Value>, Error> InMemoryTTLStore::get(const Key& key) const {
    const std::shared_lock lock {m};
    auto i = store.find(key);
    if (i == store.end() || !live(i->second, std::chrono::steady_clock::now())) {
        return std::nullopt;
    }
    return i->second.value;
}

std::expected<bool, Error> InMemoryTTLStore::erase(const Key& key) {
    const std::unique_lock lock {m};
    auto i = store.find(key);
    if (i == store.end()) {
        return false;
    }
    const bool wasLive = live(i->second, std::chrono::steady_clock::now());
    store.erase(i);
    return wasLive;
}

std::optional<std::chrono::milliseconds> InMemoryTTLStore::remaining(const Key& key) const {
    const std::shared_lock lock {m};
    auto i = store.find(key);
    const auto now = std::chrono::steady_clock::now();
    if (i == store.end() || !live(i->second, now)) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(i->second.expiresAt - now);
}

size_t InMemoryTTLStore::size() const {
    const std::shared_lock lock {m};
    const auto now = std::chrono::steady_clock::now();
    return static_cast<size_t>(std::count_if(store.begin(), store.end(), [now](const auto& p) {
        return live(p.second, now);
    }));
}

} // namespace dlock
