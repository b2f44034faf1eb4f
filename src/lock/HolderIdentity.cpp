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
#include "lock/HolderIdentity.hpp"
#include "common/Util.hpp"
#include <string>
#include <utility>
#include <ostream>

namespace dlock {

HolderIdentity::HolderIdentity(std::string address, uint64_t task)
    : networkAddress {std::move(address)}, taskId {task} {}

HolderIdentity HolderIdentity::current() {
    static const std::string address = dlock_local_network_address();
    return HolderIdentity {address, dlock_current_task_id()};
}

std::string HolderIdentity::toString() const {
    return networkAddress + ":" + std::to_string(taskId);
}

std::ostream& operator<<(std::ostream& os, const HolderIdentity& h) {
    os << h.toString();
    return os;
}

} // namespace dlock
