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
#ifndef HOLDER_IDENTITY_HPP
#define HOLDER_IDENTITY_HPP

#include <cstdint>
#include <ostream>
#include <string>

namespace dlock {

// Who holds a lock: the process's network address plus a task id local to
// that process.
struct HolderIdentity {
    std::string networkAddress;
    uint64_t taskId;

    HolderIdentity(std::string address, uint64_t task);

    // This host's address and the calling thread's id.
    static HolderIdentity current();

    bool operator==(const HolderIdentity& other) const = default;

    [[nodiscard]] std::string toString() const;
};

std::ostream& operator<<(std::ostream& os, const HolderIdentity& h);

} // namespace dlock

#endif // HOLDER_IDENTITY_HPP
