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
#ifndef REENTRANCY_TRACKER_HPP
#define REENTRANCY_TRACKER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace dlock {

// Per-holder hold counts, with the backend handle (transaction id, renewer)
// that the first acquisition of a name produced. Not thread-safe.
template<typename Handle>
class ReentrancyTracker {
public:
    struct Entry {
        uint64_t count;
        Handle handle;
    };

    [[nodiscard]] bool holds(const std::string& name) const {
        return entries.contains(name);
    }

    Entry* find(const std::string& name) {
        auto it = entries.find(name);
        return it == entries.end() ? nullptr : &it->second;
    }

    const Entry* find(const std::string& name) const {
        auto it = entries.find(name);
        return it == entries.end() ? nullptr : &it->second;
    }

    [[nodiscard]] uint64_t count(const std::string& name) const {
        const auto* e = find(name);
        return e ? e->count : 0;
    }

    void track(const std::string& name, Handle handle) {
        entries.insert_or_assign(name, Entry {1, std::move(handle)});
    }

    // The name must be tracked. Returns the new count.
    uint64_t reenter(const std::string& name) {
        return ++entries.at(name).count;
    }

    // The name must be tracked with a count above one. Returns the count
    // left.
    uint64_t release(const std::string& name) {
        return --entries.at(name).count;
    }

    // Drops the entry and hands its backend handle back.
    std::optional<Handle> forget(const std::string& name) {
        auto it = entries.find(name);
        if (it == entries.end()) {
            return std::nullopt;
        }
        std::optional<Handle> h {std::move(it->second.handle)};
        entries.erase(it);
        return h;
    }

    [[nodiscard]] std::vector<std::string> names() const {
        std::vector<std::string> n;
        n.reserve(entries.size());
        for (const auto& e : entries) {
            n.push_back(e.first);
        }
        return n;
    }

    [[nodiscard]] size_t size() const {
        return entries.size();
    }

    [[nodiscard]] bool empty() const {
        return entries.empty();
    }
private:
    std::unordered_map<std::string, Entry> entries;
};

} // namespace dlock

#endif // REENTRANCY_TRACKER_HPP
