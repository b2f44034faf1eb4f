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
#ifndef SRC_SERVER_TTLSTORESERVICEIMPL_HPP
#define SRC_SERVER_TTLSTORESERVICEIMPL_HPP

#include <grpcpp/grpcpp.h>
#include "server/RPCServer.hpp"
#include "proto/ttlStore.grpc.pb.h"
#include "interface/TTLStore.hpp"

namespace dlock {

class TTLStoreServiceImpl final : public ttlStore::TTLStoreService::Service {
public:
    explicit TTLStoreServiceImpl(TTLStore& s);
    grpc::Status setIfAbsent(
        grpc::ServerContext* context,
        const ttlStore::SetRequest* request,
        ttlStore::SetReply* reply) override;
    grpc::Status setIfPresent(
        grpc::ServerContext* context,
        const ttlStore::SetRequest* request,
        ttlStore::SetReply* reply) override;
    grpc::Status get(
        grpc::ServerContext* context,
        const ttlStore::GetRequest* request,
        ttlStore::GetReply* reply) override;
    grpc::Status erase(
        grpc::ServerContext* context,
        const ttlStore::EraseRequest* request,
        ttlStore::EraseReply* reply) override;
private:
    TTLStore& store;
};

using TTLStoreServer = RPCServer<TTLStoreServiceImpl>;

} // namespace dlock

#endif // SRC_SERVER_TTLSTORESERVICEIMPL_HPP
