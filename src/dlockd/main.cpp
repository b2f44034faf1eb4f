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
#include <chrono>
#include <csignal>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "server/RPCServer.hpp"
#include "server/RowLockStoreServiceImpl.hpp"
#include "server/TTLStoreServiceImpl.hpp"
#include "storage/InMemoryRowLockStore.hpp"
#include "storage/InMemoryTTLStore.hpp"

using dlock::InMemoryRowLockStore;
using dlock::InMemoryTTLStore;
using dlock::RowLockStoreServiceImpl;
using dlock::TTLStoreServiceImpl;

using LockStoreServer = dlock::RPCServer<TTLStoreServiceImpl, RowLockStoreServiceImpl>;

int main(int argc, char** argv) {
    spdlog::init_thread_pool(8192, 1);
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        "logs/dlockd.txt", 1024 * 1024 * 5, 3);
    std::vector<spdlog::sink_ptr> sinks {consoleSink, fileSink};
    const auto asyncLogger = std::make_shared<spdlog::async_logger>(
        "dlockd", sinks.begin(), sinks.end(),
        spdlog::thread_pool(), spdlog::async_overflow_policy::block);
    spdlog::register_logger(asyncLogger);
    spdlog::set_default_logger(asyncLogger);

    const std::string listenAddress {argc > 1 ? argv[1] : "0.0.0.0:50051"};
    std::chrono::milliseconds idleTimeout {10000};
    if (argc > 2) {
        try {
            idleTimeout = std::chrono::milliseconds {std::stoll(argv[2])};
            if (idleTimeout.count() < 0) {
                throw std::invalid_argument("must be non-negative");
            }
        } catch (const std::exception& e) {
            spdlog::critical("dlockd: bad idle timeout {}: {}", argv[2], e.what());
            spdlog::shutdown();
            return 1;
        }
    }

    // Block the shutdown signals before any thread starts so that only the
    // sigwait below receives them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    InMemoryTTLStore ttlStore {};
    InMemoryRowLockStore rowLockStore {idleTimeout};
    TTLStoreServiceImpl ttlService {ttlStore};
    RowLockStoreServiceImpl rowLockService {rowLockStore};
    std::unique_ptr<LockStoreServer> server;
    try {
        server = std::make_unique<LockStoreServer>(listenAddress, ttlService, rowLockService);
    } catch (const std::exception& e) {
        spdlog::critical("dlockd: {}", e.what());
        spdlog::shutdown();
        return 1;
    }
    spdlog::info("dlockd: serving TTL and row lock stores on {}", server->address());

    int received = 0;
    sigwait(&signals, &received);
    spdlog::info("dlockd: received signal {}, shutting down ({} open transactions, {} ttl keys)",
        received, rowLockStore.openTransactions(), ttlStore.size());
    server->shutdown();
    spdlog::shutdown();
    return 0;
}
