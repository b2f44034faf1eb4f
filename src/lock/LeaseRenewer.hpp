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
#ifndef LEASE_RENEWER_HPP
#define LEASE_RENEWER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <mutex>
#include <optional>
#include <thread>
#include "common/Error.hpp"
#include "common/Types.hpp"
#include "interface/TTLStore.hpp"

namespace dlock {

// Keeps a held TTL key alive by rewriting it every interval with
// setIfPresent. Stops on its own when the key is gone or no renewal has
// succeeded for a whole ttl, and publishes LeaseLost once. It never deletes
// the key.
class LeaseRenewer {
public:
    LeaseRenewer(
        TTLStore& s,
        Key k,
        Value t,
        std::chrono::milliseconds ttl,
        std::chrono::milliseconds interval);
    ~LeaseRenewer();
    LeaseRenewer(const LeaseRenewer&) = delete;
    LeaseRenewer& operator=(const LeaseRenewer&) = delete;
    LeaseRenewer(LeaseRenewer&&) = delete;
    LeaseRenewer& operator=(LeaseRenewer&&) = delete;

    // Stops renewing and joins the worker. No renewal is in flight once this
    // returns.
    void cancel();
    [[nodiscard]] std::optional<Error> lost() const;
    [[nodiscard]] uint64_t renewals() const;
private:
    // false once the lease is lost.
    bool renew();

    TTLStore& store;
    const Key key;
    const Value token;
    const std::chrono::milliseconds ttl;
    const std::chrono::milliseconds interval;
    std::chrono::steady_clock::time_point lastRenewal;
    std::atomic<uint64_t> renewCount;
    std::promise<Error> lostPromise;
    std::shared_future<Error> lostFuture;
    bool running;
    std::mutex mtx;
    std::condition_variable cv;
    std::thread worker;
};

} // namespace dlock

#endif // LEASE_RENEWER_HPP
