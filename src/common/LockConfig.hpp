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
#ifndef LOCK_CONFIG_H
#define LOCK_CONFIG_H

#include <chrono>

namespace dlock {

// Tunables shared by both lock backends. ttl and renewRatio only matter to
// the TTL backend.
struct LockConfig {
    LockConfig(
        std::chrono::milliseconds ttl = std::chrono::seconds{30},
        std::chrono::milliseconds poll = std::chrono::milliseconds{300},
        double ratio = 2.0 / 3.0
    );
    std::chrono::milliseconds ttl;
    std::chrono::milliseconds pollInterval;
    double renewRatio;

    [[nodiscard]] std::chrono::milliseconds renewInterval() const;
};

} // namespace dlock

#endif // LOCK_CONFIG_H
