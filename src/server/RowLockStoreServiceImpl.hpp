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
#ifndef SRC_SERVER_ROWLOCKSTORESERVICEIMPL_HPP
#define SRC_SERVER_ROWLOCKSTORESERVICEIMPL_HPP

#include <chrono>
#include <expected>
#include <optional>
#include <grpcpp/grpcpp.h>
#include "server/RPCServer.hpp"
#include "proto/rowLockStore.grpc.pb.h"
#include "interface/RowLockStore.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"

namespace dlock {

class RowLockStoreServiceImpl final : public rowLockStore::RowLockStoreService::Service {
public:
    explicit RowLockStoreServiceImpl(RowLockStore& s);
    grpc::Status openTransaction(
        grpc::ServerContext* context,
        const rowLockStore::OpenTransactionRequest* request,
        rowLockStore::OpenTransactionReply* reply) override;
    grpc::Status readForUpdate(
        grpc::ServerContext* context,
        const rowLockStore::ReadRequest* request,
        rowLockStore::ReadReply* reply) override;
    grpc::Status readForUpdateNoWait(
        grpc::ServerContext* context,
        const rowLockStore::ReadRequest* request,
        rowLockStore::ReadReply* reply) override;
    grpc::Status read(
        grpc::ServerContext* context,
        const rowLockStore::ReadRequest* request,
        rowLockStore::ReadReply* reply) override;
    grpc::Status insert(
        grpc::ServerContext* context,
        const rowLockStore::WriteRequest* request,
        rowLockStore::WriteReply* reply) override;
    grpc::Status update(
        grpc::ServerContext* context,
        const rowLockStore::WriteRequest* request,
        rowLockStore::WriteReply* reply) override;
    grpc::Status commit(
        grpc::ServerContext* context,
        const rowLockStore::TransactionRequest* request,
        rowLockStore::TransactionReply* reply) override;
    grpc::Status rollback(
        grpc::ServerContext* context,
        const rowLockStore::TransactionRequest* request,
        rowLockStore::TransactionReply* reply) override;
    grpc::Status isOpen(
        grpc::ServerContext* context,
        const rowLockStore::TransactionRequest* request,
        rowLockStore::TransactionReply* reply) override;
private:
    // A blocked row lock is waited for in slices of this length so that a
    // cancelled call or a server shutdown is noticed.
    static constexpr std::chrono::milliseconds waitSlice {100};

    static grpc::Status toReply(const std::expected<std::optional<LockRecord>, Error>& r, rowLockStore::ReadReply* reply);

    RowLockStore& store;
};

using RowLockStoreServer = RPCServer<RowLockStoreServiceImpl>;

} // namespace dlock

#endif // SRC_SERVER_ROWLOCKSTORESERVICEIMPL_HPP
