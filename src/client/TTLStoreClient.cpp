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
#include "client/TTLStoreClient.hpp"
#include <string>
#include <chrono>
#include <expected>
#include <optional>
#include "proto/ttlStore.pb.h"
#include "proto/ttlStore.grpc.pb.h"
#include "common/Error.hpp"
#include "common/Types.hpp"

namespace dlock {

using TTLService = RPCService<ttlStore::TTLStoreService>;

TTLStoreClient::TTLStoreClient(const std::string& address, const RetryPolicy& policy)
    : service {address, policy, {
        {"setIfAbsent", TTLService::unary(&TTLService::Stub::setIfAbsent)},
        {"setIfPresent", TTLService::unary(&TTLService::Stub::setIfPresent)},
        {"get", TTLService::unary(&TTLService::Stub::get)},
        {"erase", TTLService::unary(&TTLService::Stub::erase)}
    }} {}

std::expected<std::monostate, Error> TTLStoreClient::connect() {
    return service.connect();
}

std::expected<bool, Error> TTLStoreClient::setIfAbsent(const Key& key, const Value& value, std::chrono::milliseconds ttl) {
    ttlStore::SetRequest request;
    request.mutable_key()->set_data(key.data);
    request.mutable_value()->set_data(value.data);
    request.set_ttlms(ttl.count() > 0 ? static_cast<uint64_t>(ttl.count()) : 0);
    auto t = service.call("setIfAbsent", request);
    if (t.has_value()) {
        return t.value().applied();
    }
    return std::unexpected {t.error().back()};
}

std::expected<bool, Error> TTLStoreClient::setIfPresent(const Key& key, const Value& value, std::chrono::milliseconds ttl) {
    ttlStore::SetRequest request;
    request.mutable_key()->set_data(key.data);
    request.mutable_value()->set_data(value.data);
    request.set_ttlms(ttl.count() > 0 ? static_cast<uint64_t>(ttl.count()) : 0);
    auto t = service.call("setIfPresent", request);
    if (t.has_value()) {
        return t.value().applied();
    }
    return std::unexpected {t.error().back()};
}

std::expected<std::optional<Value>, Error> TTLStoreClient::get(const Key& key) const {
    ttlStore::GetRequest request;
    request.mutable_key()->set_data(key.data);
    auto t = service.call("get", request);
    if (!t.has_value()) {
        return std::unexpected {t.error().back()};
    }
    if (!t.value().found()) {
        return std::nullopt;
    }
    return Value {t.value().value()};
}

std::expected<bool, Error> TTLStoreClient::erase(const Key& key) {
    ttlStore::EraseRequest request;
    request.mutable_key()->set_data(key.data);
    auto t = service.call("erase", request);
    if (t.has_value()) {
        return t.value().erased();
    }
    return std::unexpected {t.error().back()};
}

} // namespace dlock
