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
#ifndef ROW_LOCK_STORE_CLIENT_H
#define ROW_LOCK_STORE_CLIENT_H

#include <chrono>
#include <condition_variable>
#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_set>
#include <variant>
#include <vector>
#include "proto/rowLockStore.grpc.pb.h"
#include "common/Error.hpp"
#include "common/RetryPolicy.hpp"
#include "common/RPCService.hpp"
#include "common/Types.hpp"
#include "interface/RowLockStore.hpp"

namespace dlock {

// RowLockStore reached over gRPC. Transactions live on the server, the
// client only carries their ids. Transactions opened through this client are
// touched every heartbeat interval so that the server's idle sweep leaves
// them alone while this process lives.
class RowLockStoreClient : public RowLockStore {
public:
    RowLockStoreClient(
        const std::string& address,
        const RetryPolicy& policy,
        std::chrono::milliseconds heartbeat = std::chrono::milliseconds{1000});
    ~RowLockStoreClient() override;
    RowLockStoreClient(const RowLockStoreClient&) = delete;
    RowLockStoreClient& operator=(const RowLockStoreClient&) = delete;

    std::expected<std::monostate, Error> connect();

    std::expected<TransactionId, Error> openTransaction() override;
    std::expected<std::optional<LockRecord>, Error> readForUpdate(TransactionId txn, const std::string& name) override;
    std::expected<std::optional<LockRecord>, Error> readForUpdateUntil(TransactionId txn, const std::string& name, std::chrono::steady_clock::time_point deadline) override;
    std::expected<std::optional<LockRecord>, Error> readForUpdateNoWait(TransactionId txn, const std::string& name) override;
    std::expected<std::optional<LockRecord>, Error> read(TransactionId txn, const std::string& name) override;
    std::expected<std::monostate, Error> insert(TransactionId txn, const LockRecord& record) override;
    std::expected<std::monostate, Error> update(TransactionId txn, const LockRecord& record) override;
    std::expected<std::monostate, Error> commit(TransactionId txn) override;
    std::expected<std::monostate, Error> rollback(TransactionId txn) override;
    std::expected<bool, Error> isOpen(TransactionId txn) override;
private:
    std::expected<std::optional<LockRecord>, Error> readRow(
        const std::string& op,
        TransactionId txn,
        const std::string& name,
        std::optional<std::chrono::system_clock::time_point> deadline);
    std::expected<std::monostate, Error> write(const std::string& op, TransactionId txn, const LockRecord& record);
    std::expected<std::monostate, Error> finish(const std::string& op, TransactionId txn);
    void keepAlive();

    RPCService<rowLockStore::RowLockStoreService> service;
    const std::chrono::milliseconds heartbeatInterval;
    std::unordered_set<TransactionId> opened;
    bool running;
    std::mutex mtx;
    std::condition_variable cv;
    std::thread heartbeat;
};

} // namespace dlock

#endif // ROW_LOCK_STORE_CLIENT_H
