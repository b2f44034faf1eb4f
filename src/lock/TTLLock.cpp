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
#include "lock/TTLLock.hpp"
#include <algorithm>
#include <chrono>
#include <memory>
#include <thread>
#include <utility>
#include <spdlog/spdlog.h>
#include "common/Util.hpp"

namespace dlock {

TTLLock::TTLLock(TTLStore& s, LockConfig c, HolderIdentity h)
    : store {s}, config {c}, identity {std::move(h)}, tracker {} {}

TTLLock::~TTLLock() {
    for (const auto& name : tracker.names()) {
        auto renewer = tracker.forget(name);
        renewer.value()->cancel();
        if (renewer.value()->lost().has_value()) {
            continue;
        }
        spdlog::warn("TTLLock: {} destroyed while holding {}, releasing", identity.toString(), name);
        if (auto e = store.erase(Key {name}); !e.has_value()) {
            spdlog::error("TTLLock: failed to release {}: {}, it expires in {}ms", name, e.error().what, config.ttl.count());
        }
    }
}

std::expected<std::monostate, Error> TTLLock::lock(const std::string& name) {
    auto r = acquire(name, AcquireMode::Blocking, std::chrono::milliseconds{0});
    if (!r.has_value()) {
        return std::unexpected {r.error()};
    }
    return {};
}

std::expected<bool, Error> TTLLock::tryLock(const std::string& name) {
    return acquire(name, AcquireMode::NonBlocking, std::chrono::milliseconds{0});
}

std::expected<bool, Error> TTLLock::tryLock(const std::string& name, std::chrono::milliseconds timeout) {
    return acquire(name, AcquireMode::Timed, timeout);
}

std::optional<Error> TTLLock::leaseLost(const std::string& name) {
    auto* entry = tracker.find(name);
    if (entry == nullptr) {
        return std::nullopt;
    }
    auto l = entry->handle->lost();
    if (!l.has_value()) {
        return std::nullopt;
    }
    tracker.forget(name);
    spdlog::warn("TTLLock: {} lost the lease on {}", identity.toString(), name);
    return l;
}

std::expected<Acquisition, Error> TTLLock::attempt(const std::string& name, const Value& token) {
    auto r = store.setIfAbsent(Key {name}, token, config.ttl);
    if (!r.has_value()) {
        return std::unexpected {r.error()};
    }
    if (!r.value()) {
        spdlog::debug("TTLLock: {} is held elsewhere", name);
        return Acquisition::Contended;
    }
    return Acquisition::Acquired;
}

std::expected<bool, Error> TTLLock::acquire(const std::string& name, AcquireMode mode, std::chrono::milliseconds timeout) {
    if (name.empty()) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "Lock name must not be empty"}};
    }
    if (tracker.holds(name)) {
        if (auto l = leaseLost(name); l.has_value()) {
            return std::unexpected {l.value()};
        }
        auto count = tracker.reenter(name);
        spdlog::debug("TTLLock: {} re-entered {} ({})", identity.toString(), name, count);
        return true;
    }
    const Value token {identity.toString() + ":" + dlock_generate_random_alphanumeric_string(16)};
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto a = attempt(name, token);
        if (!a.has_value()) {
            spdlog::error("TTLLock: acquiring {} failed: {}", name, a.error().what);
            return std::unexpected {a.error()};
        }
        if (a.value() == Acquisition::Acquired) {
            break;
        }
        if (mode == AcquireMode::NonBlocking) {
            return false;
        }
        if (mode == AcquireMode::Timed) {
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(config.pollInterval, deadline - now));
        } else {
            std::this_thread::sleep_for(config.pollInterval);
        }
    }
    tracker.track(name, std::make_unique<LeaseRenewer>(store, Key {name}, token, config.ttl, config.renewInterval()));
    spdlog::debug("TTLLock: {} acquired {} with token {}", identity.toString(), name, token.data);
    return true;
}

std::expected<std::monostate, Error> TTLLock::unlock(const std::string& name) {
    auto* entry = tracker.find(name);
    if (entry == nullptr) {
        spdlog::debug("TTLLock: {} does not hold {}, nothing to release", identity.toString(), name);
        return {};
    }
    if (auto l = leaseLost(name); l.has_value()) {
        return std::unexpected {l.value()};
    }
    if (entry->count > 1) {
        auto left = tracker.release(name);
        spdlog::debug("TTLLock: {} released one hold on {} ({} left)", identity.toString(), name, left);
        return {};
    }
    auto renewer = tracker.forget(name);
    renewer.value()->cancel();
    // A renewal that was in flight during cancel may have found the key gone.
    if (auto l = renewer.value()->lost(); l.has_value()) {
        spdlog::warn("TTLLock: lease on {} was lost while releasing, leaving the key alone", name);
        return std::unexpected {l.value()};
    }
    auto erased = store.erase(Key {name});
    if (!erased.has_value()) {
        spdlog::error("TTLLock: failed to delete {}: {}", name, erased.error().what);
        return std::unexpected {erased.error()};
    }
    if (!erased.value()) {
        spdlog::warn("TTLLock: {} was already gone on release", name);
    }
    spdlog::debug("TTLLock: {} released {}", identity.toString(), name);
    return {};
}

bool TTLLock::holds(const std::string& name) const {
    return tracker.holds(name);
}

uint64_t TTLLock::holdCount(const std::string& name) const {
    return tracker.count(name);
}

const HolderIdentity& TTLLock::holder() const {
    return identity;
}

} // namespace dlock
