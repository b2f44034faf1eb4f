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
#include "common/LockConfig.hpp"
#include <algorithm>
#include <stdexcept>
#include <chrono>

namespace dlock {

LockConfig::LockConfig(
    std::chrono::milliseconds t,
    std::chrono::milliseconds poll,
    double ratio)
    : ttl(t),
      pollInterval(poll),
      renewRatio(ratio) {
    if (t <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("TTL must be > zero.");
    }
    if (poll <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Poll interval must be > zero.");
    }
    if (!(ratio > 0.0 && ratio < 1.0)) {
        throw std::invalid_argument("Renew ratio must be in (0, 1).");
    }
}

std::chrono::milliseconds LockConfig::renewInterval() const {
    auto interval = std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(static_cast<double>(ttl.count()) * renewRatio)};
    return std::max(interval, std::chrono::milliseconds{1});
}

} // namespace dlock
