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
#ifndef REPEATER_H
#define REPEATER_H

#include <functional>
#include "common/RetryPolicy.hpp"
#include "common/ExponentialBackoff.hpp"
#include <grpcpp/support/status.h>
#include <vector>
#include <string>

namespace dlock {

// Replays an RPC while it fails with a code that isRetriable() accepts for
// the operation, sleeping for the backoff delay between attempts. Returns
// every status observed, the last one being the final outcome.
class Repeater {
public:
    explicit Repeater(const RetryPolicy& p);
    std::vector<grpc::Status> attempt(const std::string& op, const std::function<grpc::Status()>& rpc);
private:
    ExponentialBackoff backoff;
};

} // namespace dlock

#endif // REPEATER_H
