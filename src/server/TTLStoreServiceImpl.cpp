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
#include "server/TTLStoreServiceImpl.hpp"
#include "common/ErrorConverter.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"
#include <grpcpp/support/status.h>
#include <chrono>
#include <tuple>

namespace dlock {

TTLStoreServiceImpl::TTLStoreServiceImpl(TTLStore& s)
    : store {s} {}

grpc::Status TTLStoreServiceImpl::setIfAbsent(
    grpc::ServerContext* context,
    const ttlStore::SetRequest* request,
    ttlStore::SetReply* reply) {
    std::ignore = context;
    const Key key{request->key()};
    const Value value{request->value()};
    auto applied = store.setIfAbsent(key, value, std::chrono::milliseconds{static_cast<int64_t>(request->ttlms())});
    if (!applied.has_value()) {
        return toGrpcStatus(applied.error());
    }
    reply->set_applied(applied.value());
    return grpc::Status::OK;
}

grpc::Status TTLStoreServiceImpl::setIfPresent(
    grpc::ServerContext* context,
    const ttlStore::SetRequest* request,
    ttlStore::SetReply* reply) {
    std::ignore = context;
    const Key key{request->key()};
    const Value value{request->value()};
    auto applied = store.setIfPresent(key, value, std::chrono::milliseconds{static_cast<int64_t>(request->ttlms())});
    if (!applied.has_value()) {
        return toGrpcStatus(applied.error());
    }
    reply->set_applied(applied.value());
    return grpc::Status::OK;
}

grpc::Status TTLStoreServiceImpl::get(
    grpc::ServerContext* context,
    const ttlStore::GetRequest* request,
    ttlStore::GetReply* reply) {
    std::ignore = context;
    const Key key{request->key()};
    auto v = store.get(key);
    if (!v.has_value()) {
        return toGrpcStatus(v.error());
    }
    if (const auto& value = v.value(); value.has_value()) {
        reply->set_found(true);
        reply->mutable_value()->set_data(value->data);
    } else {
        reply->set_found(false);
    }
    return grpc::Status::OK;
}

grpc::Status TTLStoreServiceImpl::erase(
    grpc::ServerContext* context,
    const ttlStore::EraseRequest* request,
    ttlStore::EraseReply* reply) {
    std::ignore = context;
    const Key key{request->key()};
    auto erased = store.erase(key);
    if (!erased.has_value()) {
        return toGrpcStatus(erased.error());
    }
    reply->set_erased(erased.value());
    return grpc::Status::OK;
}

} // namespace dlock
