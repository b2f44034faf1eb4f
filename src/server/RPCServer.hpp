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
#ifndef RPC_SERVER_H
#define RPC_SERVER_H

#include <memory>
#include <grpcpp/grpcpp.h>
#include <thread>
#include <stdexcept>
#include <chrono>
#include <string>

namespace dlock {

// Hosts one or more gRPC services on a single listening address. The server
// runs on its own thread from construction until shutdown.
template<typename... Services>
class RPCServer {
public:
    explicit RPCServer(const std::string& address, Services&... s);
    ~RPCServer();
    RPCServer(const RPCServer&) = delete;
    RPCServer& operator=(const RPCServer&) = delete;
    RPCServer(RPCServer&&) = delete;
    RPCServer& operator=(RPCServer&&) = delete;
    void wait();
    void shutdown();
    [[nodiscard]] std::string address() const;
private:
    std::string addr;
    std::unique_ptr<grpc::Server> server;
    std::thread serverThread;
};

template<typename... Services>
RPCServer<Services...>::RPCServer(const std::string& address, Services&... s)
    : addr{address} {
    grpc::ServerBuilder sb{};
    sb.AddListeningPort(addr, grpc::InsecureServerCredentials());
    (sb.RegisterService(&s), ...);
    server = sb.BuildAndStart();
    if (!server) {
        throw std::runtime_error("Failed to start gRPC server on address: " + address);
    }
    serverThread = std::thread([this]() { this->wait(); });
}

template<typename... Services>
void RPCServer<Services...>::wait() {
    if (server) {
        server->Wait();
    }
}

template<typename... Services>
void RPCServer<Services...>::shutdown() {
    if (server) {
        auto deadline = std::chrono::system_clock::now() + std::chrono::milliseconds(100);
        server->Shutdown(deadline);
    }
    if (serverThread.joinable()) {
        serverThread.join();
    }
    server.reset();
}

template<typename... Services>
std::string RPCServer<Services...>::address() const {
    return addr;
}

template<typename... Services>
RPCServer<Services...>::~RPCServer() {
    shutdown();
}

} // namespace dlock

#endif // RPC_SERVER_H
