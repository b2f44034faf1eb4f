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
#include "common/Util.hpp"
#include <algorithm>
#include <random>
#include <cstring>
#include <cerrno>
#include <array>
#include <string>
#include <thread>
#include <functional>
#include <netdb.h>
#include <unistd.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <spdlog/spdlog.h>

std::string dlock_generate_random_alphanumeric_string(std::size_t len) {
    static constexpr auto chars =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";
    thread_local auto rng = random_generator<>();
    auto dist = std::uniform_int_distribution{{}, std::strlen(chars) - 1};
    auto result = std::string(len, '\0');
    std::generate_n(begin(result), len, [&]() { return chars[dist(rng)]; });
    return result;
}

std::string dlock_local_network_address() {
    static const std::string loopback {"127.0.0.1"};
    std::array<char, 256> host{};
    if (gethostname(host.data(), host.size() - 1) != 0) {
        spdlog::warn("gethostname failed: {}", std::strerror(errno));
        return loopback;
    }
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* result = nullptr;
    if (const int rc = getaddrinfo(host.data(), nullptr, &hints, &result); rc != 0) {
        spdlog::warn("Could not resolve host {}: {}", host.data(), gai_strerror(rc));
        return loopback;
    }
    std::string address {loopback};
    for (auto* i = result; i != nullptr; i = i->ai_next) {
        std::array<char, INET_ADDRSTRLEN> buf{};
        const auto* in = reinterpret_cast<const sockaddr_in*>(i->ai_addr);
        if (inet_ntop(AF_INET, &in->sin_addr, buf.data(), buf.size()) != nullptr) {
            address = buf.data();
            break;
        }
    }
    freeaddrinfo(result);
    return address;
}

uint64_t dlock_current_task_id() {
    return static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
}
