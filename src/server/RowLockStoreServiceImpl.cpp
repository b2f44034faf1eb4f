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
#include "server/RowLockStoreServiceImpl.hpp"
#include "common/ErrorConverter.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"
#include <grpcpp/support/status.h>
#include <algorithm>
#include <chrono>
#include <tuple>

namespace dlock {

RowLockStoreServiceImpl::RowLockStoreServiceImpl(RowLockStore& s)
    : store {s} {}

grpc::Status RowLockStoreServiceImpl::toReply(const std::expected<std::optional<LockRecord>, Error>& r, rowLockStore::ReadReply* reply) {
    if (!r.has_value()) {
        return toGrpcStatus(r.error());
    }
    if (const auto& record = r.value(); record.has_value()) {
        reply->set_found(true);
        record->toProto(reply->mutable_record());
    } else {
        reply->set_found(false);
    }
    return grpc::Status::OK;
}

grpc::Status RowLockStoreServiceImpl::openTransaction(
    grpc::ServerContext* context,
    const rowLockStore::OpenTransactionRequest* request,
    rowLockStore::OpenTransactionReply* reply) {
    std::ignore = context;
    std::ignore = request;
    auto txn = store.openTransaction();
    if (!txn.has_value()) {
        return toGrpcStatus(txn.error());
    }
    reply->set_txn(txn.value());
    return grpc::Status::OK;
}

grpc::Status RowLockStoreServiceImpl::readForUpdate(
    grpc::ServerContext* context,
    const rowLockStore::ReadRequest* request,
    rowLockStore::ReadReply* reply) {
    while (true) {
        if (context->IsCancelled()) {
            return toGrpcStatus(Error {ErrorCode::Cancelled, "Call cancelled while waiting for row lock", request->name()});
        }
        const auto now = std::chrono::system_clock::now();
        const auto callDeadline = context->deadline();
        if (callDeadline <= now) {
            return toGrpcStatus(Error {ErrorCode::Timeout, "Deadline passed while waiting for row lock", request->name()});
        }
        auto slice = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::min<std::chrono::system_clock::duration>(callDeadline - now, waitSlice));
        auto r = store.readForUpdateUntil(request->txn(), request->name(), std::chrono::steady_clock::now() + slice);
        if (!r.has_value() && r.error().code == ErrorCode::Timeout) {
            continue;
        }
        return toReply(r, reply);
    }
}

grpc::Status RowLockStoreServiceImpl::readForUpdateNoWait(
    grpc::ServerContext* context,
    const rowLockStore::ReadRequest* request,
    rowLockStore::ReadReply* reply) {
    std::ignore = context;
    return toReply(store.readForUpdateNoWait(request->txn(), request->name()), reply);
}

grpc::Status RowLockStoreServiceImpl::read(
    grpc::ServerContext* context,
    const rowLockStore::ReadRequest* request,
    rowLockStore::ReadReply* reply) {
    std::ignore = context;
    return toReply(store.read(request->txn(), request->name()), reply);
}

grpc::Status RowLockStoreServiceImpl::insert(
    grpc::ServerContext* context,
    const rowLockStore::WriteRequest* request,
    rowLockStore::WriteReply* reply) {
    std::ignore = context;
    std::ignore = reply;
    return toGrpcStatus(store.insert(request->txn(), LockRecord {request->record()}));
}

grpc::Status RowLockStoreServiceImpl::update(
    grpc::ServerContext* context,
    const rowLockStore::WriteRequest* request,
    rowLockStore::WriteReply* reply) {
    std::ignore = context;
    std::ignore = reply;
    return toGrpcStatus(store.update(request->txn(), LockRecord {request->record()}));
}

grpc::Status RowLockStoreServiceImpl::commit(
    grpc::ServerContext* context,
    const rowLockStore::TransactionRequest* request,
    rowLockStore::TransactionReply* reply) {
    std::ignore = context;
    auto r = store.commit(request->txn());
    if (!r.has_value()) {
        return toGrpcStatus(r.error());
    }
    reply->set_open(false);
    return grpc::Status::OK;
}

grpc::Status RowLockStoreServiceImpl::rollback(
    grpc::ServerContext* context,
    const rowLockStore::TransactionRequest* request,
    rowLockStore::TransactionReply* reply) {
    std::ignore = context;
    auto r = store.rollback(request->txn());
    if (!r.has_value()) {
        return toGrpcStatus(r.error());
    }
    reply->set_open(false);
    return grpc::Status::OK;
}

grpc::Status RowLockStoreServiceImpl::isOpen(
    grpc::ServerContext* context,
    const rowLockStore::TransactionRequest* request,
    rowLockStore::TransactionReply* reply) {
    std::ignore = context;
    auto open = store.isOpen(request->txn());
    if (!open.has_value()) {
        return toGrpcStatus(open.error());
    }
    reply->set_open(open.value());
    return grpc::Status::OK;
}

} // namespace dlock
