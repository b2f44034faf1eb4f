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
#include "common/ExponentialBackoff.hpp"
#include "common/RetryPolicy.hpp"
#include "common/Util.hpp"

#include <algorithm>
#include <optional>
#include <chrono>
#include <cstdint>
#include <random>
#include <spdlog/spdlog.h>

namespace dlock {

ExponentialBackoff::ExponentialBackoff(const RetryPolicy& p)
    : policy {p},
      rng {random_generator()} {}

std::optional<std::chrono::microseconds> ExponentialBackoff::nextDelay() {
    if (attempt >= policy.failureThreshold - 1) {
        return std::nullopt;
    }
    auto baseCount = static_cast<uint64_t>(policy.baseDelay.count());
    auto shift = std::min(attempt, 32);
    auto delay = std::min(baseCount << static_cast<unsigned int>(shift), static_cast<uint64_t>(policy.maxDelay.count()));
    attempt++;
    spdlog::debug("ExponentialBackoff: attempt {}, ceiling {}us", attempt, delay);
    return jitter(std::chrono::microseconds(delay));
}

void ExponentialBackoff::reset() {
    attempt = 0;
}

int ExponentialBackoff::attempts() const {
    return attempt;
}

std::chrono::microseconds ExponentialBackoff::jitter(std::chrono::microseconds v) {
    std::uniform_int_distribution<std::chrono::microseconds::rep> dist(0, v.count());
    return std::chrono::microseconds(dist(rng));
}

} // namespace dlock
