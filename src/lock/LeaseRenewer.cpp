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
#include "lock/LeaseRenewer.hpp"
#include <chrono>
#include <future>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <spdlog/spdlog.h>
#include "common/Error.hpp"

namespace dlock {

LeaseRenewer::LeaseRenewer(
    TTLStore& s,
    Key k,
    Value t,
    std::chrono::milliseconds l,
    std::chrono::milliseconds i)
    : store {s},
      key {std::move(k)},
      token {std::move(t)},
      ttl {l},
      interval {i},
      lastRenewal {std::chrono::steady_clock::now()},
      renewCount {0},
      lostPromise {},
      lostFuture {lostPromise.get_future().share()},
      running {true},
      mtx {},
      cv {} {
    worker = std::thread([this]() {
        while (true) {
            std::unique_lock<std::mutex> lock(mtx);
            if (!running) break;
            if (cv.wait_for(lock, interval, [this]{ return !running; })) break;
            lock.unlock();
            if (!renew()) break;
        }
    });
}

bool LeaseRenewer::renew() {
    auto r = store.setIfPresent(key, token, ttl);
    const auto now = std::chrono::steady_clock::now();
    if (r.has_value()) {
        if (r.value()) {
            lastRenewal = now;
            ++renewCount;
            spdlog::debug("LeaseRenewer: renewed {} for {}ms", key.data, ttl.count());
            return true;
        }
        spdlog::warn("LeaseRenewer: {} expired or was removed, lease lost", key.data);
        lostPromise.set_value(Error {ErrorCode::LeaseLost, "Lock key expired or was removed", key.data});
        return false;
    }
    if (now - lastRenewal >= ttl) {
        spdlog::warn("LeaseRenewer: no renewal of {} succeeded within {}ms, lease lost: {}", key.data, ttl.count(), r.error().what);
        lostPromise.set_value(Error {ErrorCode::LeaseLost, "Lease not renewed within ttl: " + r.error().what, key.data});
        return false;
    }
    spdlog::warn("LeaseRenewer: renewing {} failed with {}, retrying in {}ms", key.data, toString(r.error().code), interval.count());
    return true;
}

void LeaseRenewer::cancel() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        running = false;
    }
    cv.notify_all();
    if (worker.joinable()) worker.join();
}

std::optional<Error> LeaseRenewer::lost() const {
    if (lostFuture.wait_for(std::chrono::seconds{0}) == std::future_status::ready) {
        return lostFuture.get();
    }
    return std::nullopt;
}

uint64_t LeaseRenewer::renewals() const {
    return renewCount.load();
}

LeaseRenewer::~LeaseRenewer() {
    cancel();
}

} // namespace dlock
