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
#ifndef TYPES_HPP
#define TYPES_HPP

#include <string>
#include <cstdint>
#include <chrono>
#include <functional>
#include "proto/types.pb.h"

namespace dlock {

struct Key {
    std::string data;

    Key(const std::string& d) : data(d) {}

    Key(const proto::Key& protoKey);

    bool operator==(const Key& other) const {
        return data == other.data;
    }
};

struct KeyHash {
    std::size_t operator()(const Key& key) const {
        return std::hash<std::string>()(key.data);
    }
};

struct Value {
    std::string data;

    Value(const std::string& d) : data(d) {}

    Value(const proto::Value& protoValue);

    bool operator==(const Value& other) const {
        return data == other.data;
    }
};

using TransactionId = uint64_t;

// One row of the lock table. The name is the only unique key.
struct LockRecord {
    std::string name;
    std::string ip;
    uint64_t threadId = 0;
    uint64_t count = 0;
    std::chrono::system_clock::time_point createdAt{};
    std::chrono::system_clock::time_point updatedAt{};

    explicit LockRecord(const std::string& n) : name(n) {}

    LockRecord(const proto::LockRecord& protoRecord);

    void toProto(proto::LockRecord* protoRecord) const;
};

} // namespace dlock

#endif // TYPES_HPP
