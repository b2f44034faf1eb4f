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
#include "common/Repeater.hpp"
#include "common/Error.hpp"
#include "common/ErrorConverter.hpp"
#include "common/RetryPolicy.hpp"
#include <functional>
#include <thread>
#include <grpcpp/support/status.h>
#include <spdlog/spdlog.h>
#include <vector>
#include <string>

namespace dlock {

Repeater::Repeater(const RetryPolicy& p)
    : backoff {p} {}

std::vector<grpc::Status> Repeater::attempt(const std::string& op, const std::function<grpc::Status()>& rpc) {
    std::vector<grpc::Status> statuses;
    backoff.reset();
    while (true) {
        statuses.push_back(rpc());
        const auto& status = statuses.back();
        if (status.ok()) {
            return statuses;
        }
        const auto code = toError(status).code;
        if (!isRetriable(op, code)) {
            return statuses;
        }
        auto delay = backoff.nextDelay();
        if (!delay.has_value()) {
            spdlog::warn("Repeater: {} gave up after {} attempts, last error {}", op, statuses.size(), toString(code));
            return statuses;
        }
        spdlog::debug("Repeater: {} failed with {}, retrying in {}us", op, toString(code), delay->count());
        std::this_thread::sleep_for(delay.value());
    }
}

} // namespace dlock
