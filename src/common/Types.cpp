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
#include "common/Types.hpp"
#include "proto/types.pb.h"
#include <chrono>

namespace dlock {

namespace {

std::chrono::system_clock::time_point fromMillis(int64_t ms) {
    return std::chrono::system_clock::time_point{std::chrono::milliseconds{ms}};
}

int64_t toMillis(std::chrono::system_clock::time_point t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

} // namespace

Key::Key(const proto::Key& protoKey) : data(protoKey.data()) {}

Value::Value(const proto::Value& protoValue) : data(protoValue.data()) {}

LockRecord::LockRecord(const proto::LockRecord& protoRecord)
    : name {protoRecord.name()},
      ip {protoRecord.ip()},
      threadId {protoRecord.threadid()},
      count {protoRecord.count()},
      createdAt {fromMillis(protoRecord.createdatms())},
      updatedAt {fromMillis(protoRecord.updatedatms())} {}

void LockRecord::toProto(proto::LockRecord* protoRecord) const {
    protoRecord->set_name(name);
    protoRecord->set_ip(ip);
    protoRecord->set_threadid(threadId);
    protoRecord->set_count(count);
    protoRecord->set_createdatms(toMillis(createdAt));
    protoRecord->set_updatedatms(toMillis(updatedAt));
}

} // namespace dlock
