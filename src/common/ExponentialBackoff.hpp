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
#ifndef EXPONENTIAL_BACKOFF_H
#define EXPONENTIAL_BACKOFF_H

#include "common/RetryPolicy.hpp"
#include <optional>
#include <chrono>
#include <random>

namespace dlock {

// Capped exponential backoff with full jitter: the n-th delay is drawn
// uniformly from [0, min(maxDelay, baseDelay * 2^n)].
class ExponentialBackoff {
public:
    explicit ExponentialBackoff(const RetryPolicy& policy);
    std::optional<std::chrono::microseconds> nextDelay();
    void reset();
    [[nodiscard]] int attempts() const;
private:
    std::chrono::microseconds jitter(std::chrono::microseconds v);
    RetryPolicy policy;
    int attempt{0};
    std::mt19937 rng;
};

} // namespace dlock

#endif // EXPONENTIAL_BACKOFF_H
