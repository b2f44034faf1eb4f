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
#ifndef TTL_LOCK_HPP
#define TTL_LOCK_HPP

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include "common/Error.hpp"
#include "common/LockConfig.hpp"
#include "common/Types.hpp"
#include "interface/DistributedLock.hpp"
#include "interface/TTLStore.hpp"
#include "lock/HolderIdentity.hpp"
#include "lock/LeaseRenewer.hpp"
#include "lock/ReentrancyTracker.hpp"

namespace dlock {

// Lock backed by the existence of a key with a store-side ttl. The key is
// kept alive by a LeaseRenewer while held; hold counts are local only.
class TTLLock : public DistributedLock {
public:
    explicit TTLLock(TTLStore& s, LockConfig c = LockConfig{}, HolderIdentity h = HolderIdentity::current());
    ~TTLLock() override;
    TTLLock(const TTLLock&) = delete;
    TTLLock& operator=(const TTLLock&) = delete;

    std::expected<std::monostate, Error> lock(const std::string& name) override;
    std::expected<bool, Error> tryLock(const std::string& name) override;
    std::expected<bool, Error> tryLock(const std::string& name, std::chrono::milliseconds timeout) override;
    std::expected<std::monostate, Error> unlock(const std::string& name) override;

    [[nodiscard]] bool holds(const std::string& name) const override;
    [[nodiscard]] uint64_t holdCount(const std::string& name) const override;
    [[nodiscard]] const HolderIdentity& holder() const override;
private:
    std::expected<bool, Error> acquire(const std::string& name, AcquireMode mode, std::chrono::milliseconds timeout);
    std::expected<Acquisition, Error> attempt(const std::string& name, const Value& token);
    // Drops a tracked name whose renewer reported the lease lost.
    std::optional<Error> leaseLost(const std::string& name);

    TTLStore& store;
    const LockConfig config;
    const HolderIdentity identity;
    ReentrancyTracker<std::unique_ptr<LeaseRenewer>> tracker;
};

} // namespace dlock

#endif // TTL_LOCK_HPP
