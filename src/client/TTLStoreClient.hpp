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
#ifndef TTL_STORE_CLIENT_H
#define TTL_STORE_CLIENT_H

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <variant>
#include "proto/ttlStore.grpc.pb.h"
#include "common/Error.hpp"
#include "common/RetryPolicy.hpp"
#include "common/RPCService.hpp"
#include "common/Types.hpp"
#include "interface/TTLStore.hpp"

namespace dlock {

// TTLStore reached over gRPC, typically a dlockd instance.
class TTLStoreClient : public TTLStore {
public:
    TTLStoreClient(const std::string& address, const RetryPolicy& policy);
    TTLStoreClient(const TTLStoreClient&) = delete;
    TTLStoreClient& operator=(const TTLStoreClient&) = delete;

    std::expected<std::monostate, Error> connect();

    std::expected<bool, Error> setIfAbsent(const Key& key, const Value& value, std::chrono::milliseconds ttl) override;
    std::expected<bool, Error> setIfPresent(const Key& key, const Value& value, std::chrono::milliseconds ttl) override;
    std::expected<std::optional<Value>, Error> get(const Key& key) const override;
    std::expected<bool, Error> erase(const Key& key) override;
private:
    mutable RPCService<ttlStore::TTLStoreService> service;
};

} // namespace dlock

#endif // TTL_STORE_CLIENT_H
