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
#include "client/RowLockStoreClient.hpp"
#include <string>
#include <chrono>
#include <expected>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>
#include <spdlog/spdlog.h>
#include "proto/rowLockStore.pb.h"
#include "proto/rowLockStore.grpc.pb.h"
#include "common/Error.hpp"
#include "common/Types.hpp"

namespace dlock {

using RowService = RPCService<rowLockStore::RowLockStoreService>;

RowLockStoreClient::RowLockStoreClient(const std::string& address, const RetryPolicy& policy, std::chrono::milliseconds h)
    : service {address, policy, {
        {"openTransaction", RowService::unary(&RowService::Stub::openTransaction)},
        {"readForUpdate", RowService::unary(&RowService::Stub::readForUpdate)},
        {"readForUpdateNoWait", RowService::unary(&RowService::Stub::readForUpdateNoWait)},
        {"read", RowService::unary(&RowService::Stub::read)},
        {"insert", RowService::unary(&RowService::Stub::insert)},
        {"update", RowService::unary(&RowService::Stub::update)},
        {"commit", RowService::unary(&RowService::Stub::commit)},
        {"rollback", RowService::unary(&RowService::Stub::rollback)},
        {"isOpen", RowService::unary(&RowService::Stub::isOpen)}
    }},
      heartbeatInterval {h},
      opened {},
      running {true},
      mtx {},
      cv {} {
    if (heartbeatInterval.count() <= 0) {
        throw std::invalid_argument("heartbeat must be positive");
    }
    heartbeat = std::thread([this]() {
        while (true) {
            std::unique_lock<std::mutex> lock(mtx);
            if (cv.wait_for(lock, heartbeatInterval, [this]{ return !running; })) break;
            lock.unlock();
            keepAlive();
        }
    });
}

RowLockStoreClient::~RowLockStoreClient() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        running = false;
    }
    cv.notify_all();
    if (heartbeat.joinable()) heartbeat.join();
}

void RowLockStoreClient::keepAlive() {
    std::vector<TransactionId> txns;
    {
        std::lock_guard<std::mutex> lock(mtx);
        txns.assign(opened.begin(), opened.end());
    }
    for (auto txn : txns) {
        auto o = isOpen(txn);
        if (!o.has_value()) {
            spdlog::warn("RowLockStoreClient: heartbeat for transaction {} failed: {}", txn, o.error().what);
        } else if (!o.value()) {
            spdlog::warn("RowLockStoreClient: transaction {} was closed by the server", txn);
            std::lock_guard<std::mutex> lock(mtx);
            opened.erase(txn);
        }
    }
}

std::expected<std::monostate, Error> RowLockStoreClient::connect() {
    return service.connect();
}

std::expected<TransactionId, Error> RowLockStoreClient::openTransaction() {
    rowLockStore::OpenTransactionRequest request;
    auto t = service.call("openTransaction", request);
    if (t.has_value()) {
        std::lock_guard<std::mutex> lock(mtx);
        opened.insert(t.value().txn());
        return t.value().txn();
    }
    return std::unexpected {t.error().back()};
}

std::expected<std::optional<LockRecord>, Error> RowLockStoreClient::readRow(
    const std::string& op,
    TransactionId txn,
    const std::string& name,
    std::optional<std::chrono::system_clock::time_point> deadline) {
    rowLockStore::ReadRequest request;
    request.set_txn(txn);
    request.set_name(name);
    auto t = service.call(op, request, deadline);
    if (!t.has_value()) {
        return std::unexpected {t.error().back()};
    }
    if (!t.value().found()) {
        return std::nullopt;
    }
    return LockRecord {t.value().record()};
}

std::expected<std::optional<LockRecord>, Error> RowLockStoreClient::readForUpdate(TransactionId txn, const std::string& name) {
    return readRow("readForUpdate", txn, name, std::chrono::system_clock::time_point::max());
}

std::expected<std::optional<LockRecord>, Error> RowLockStoreClient::readForUpdateUntil(TransactionId txn, const std::string& name, std::chrono::steady_clock::time_point deadline) {
    const auto remaining = deadline - std::chrono::steady_clock::now();
    const auto d = std::chrono::system_clock::now() + std::chrono::duration_cast<std::chrono::system_clock::duration>(remaining);
    return readRow("readForUpdate", txn, name, d);
}

std::expected<std::optional<LockRecord>, Error> RowLockStoreClient::readForUpdateNoWait(TransactionId txn, const std::string& name) {
    return readRow("readForUpdateNoWait", txn, name, std::nullopt);
}

std::expected<std::optional<LockRecord>, Error> RowLockStoreClient::read(TransactionId txn, const std::string& name) {
    return readRow("read", txn, name, std::nullopt);
}

std::expected<std::monostate, Error> RowLockStoreClient::write(const std::string& op, TransactionId txn, const LockRecord& record) {
    rowLockStore::WriteRequest request;
    request.set_txn(txn);
    record.toProto(request.mutable_record());
    auto t = service.call(op, request);
    if (t.has_value()) {
        return {};
    }
    return std::unexpected {t.error().back()};
}

std::expected<std::monostate, Error> RowLockStoreClient::insert(TransactionId txn, const LockRecord& record) {
    return write("insert", txn, record);
}

std::expected<std::monostate, Error> RowLockStoreClient::update(TransactionId txn, const LockRecord& record) {
    return write("update", txn, record);
}

std::expected<std::monostate, Error> RowLockStoreClient::finish(const std::string& op, TransactionId txn) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        opened.erase(txn);
    }
    rowLockStore::TransactionRequest request;
    request.set_txn(txn);
    auto t = service.call(op, request);
    if (t.has_value()) {
        return {};
    }
    const auto& errors = t.error();
    // An earlier attempt may have reached the server and closed the
    // transaction before its reply was lost.
    if (errors.size() > 1 && isRetriable(op, errors.front().code) && errors.back().code == ErrorCode::TransactionNotFound) {
        spdlog::debug("RowLockStoreClient: {} of transaction {} applied by an earlier attempt", op, txn);
        return {};
    }
    return std::unexpected {errors.back()};
}

std::expected<std::monostate, Error> RowLockStoreClient::commit(TransactionId txn) {
    return finish("commit", txn);
}

std::expected<std::monostate, Error> RowLockStoreClient::rollback(TransactionId txn) {
    return finish("rollback", txn);
}

std::expected<bool, Error> RowLockStoreClient::isOpen(TransactionId txn) {
    rowLockStore::TransactionRequest request;
    request.set_txn(txn);
    auto t = service.call("isOpen", request);
    if (t.has_value()) {
        return t.value().open();
    }
    return std::unexpected {t.error().back()};
}

} // namespace dlock
