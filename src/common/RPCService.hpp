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
#ifndef RPC_SERVICE_H
#define RPC_SERVICE_H

#include "common/Repeater.hpp"
#include "common/RetryPolicy.hpp"
#include "common/Error.hpp"
#include "common/ErrorConverter.hpp"
#include "common/TypesMap.hpp"
#include <grpcpp/grpcpp.h>
#include <expected>
#include <memory>
#include <functional>
#include <chrono>
#include <algorithm>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <iterator>

namespace dlock {

// Client side of one gRPC service at one address. Operations are looked up
// by name in the function table so the retry table in Error.cpp can be keyed
// by the same names. Safe for concurrent use.
template<typename Service>
class RPCService {
public:
    using Stub = typename Service::Stub;
    using function_t = std::function<grpc::Status(std::shared_ptr<Stub>, grpc::ClientContext*, const google::protobuf::Message&, google::protobuf::Message*)>;

    RPCService(const std::string& address, const RetryPolicy p, std::unordered_map<std::string, function_t> f);
    RPCService(const RPCService&) = delete;
    RPCService& operator=(const RPCService&) = delete;

    // Adapts a generated unary stub method to a function_t entry.
    template<typename Req, typename Rep>
    static function_t unary(grpc::Status (Stub::*method)(grpc::ClientContext*, const Req&, Rep*)) {
        return [method](std::shared_ptr<Stub> stub,
                        grpc::ClientContext* ctx,
                        const google::protobuf::Message& req,
                        google::protobuf::Message* resp) -> grpc::Status {
            if (!resp || req.GetDescriptor() != Req::descriptor()) {
                return {grpc::StatusCode::INVALID_ARGUMENT, "type mismatch or null resp"};
            }
            auto& r = static_cast<const Req&>(req);
            auto* p = static_cast<Rep*>(resp);
            return ((*stub).*method)(ctx, r, p);
        };
    }

    std::expected<std::monostate, Error> connect();

    // deadline defaults to now + rpcTimeout for every attempt.
    template<typename Req, typename Rep = map_to_t<Req>>
    std::expected<Rep, std::vector<Error>> call(
        const std::string& op,
        const Req& request,
        std::optional<std::chrono::system_clock::time_point> deadline = std::nullopt) {
        auto it = functions.find(op);
        if (it == functions.end() || !it->second) {
            return std::unexpected(std::vector<Error>{Error{ErrorCode::Unknown, "Unknown operation: " + op}});
        }
        const function_t& f = it->second;
        auto reply = Rep{};
        auto& reqMsg = static_cast<const google::protobuf::Message&>(request);
        auto& repMsg = static_cast<google::protobuf::Message&>(reply);
        auto bound = [this, &f, &reqMsg, &repMsg, deadline] {
            grpc::ClientContext c {};
            c.set_deadline(deadline.value_or(std::chrono::system_clock::now() + policy.rpcTimeout));
            repMsg.Clear();
            return f(stub, &c, reqMsg, &repMsg);
        };
        Repeater repeater {policy};
        auto statuses = repeater.attempt(op, bound);
        if (statuses.back().ok()) {
            return reply;
        }
        std::vector<Error> errors;
        errors.reserve(statuses.size());
        std::transform(statuses.begin(), statuses.end(), std::back_inserter(errors), [](const grpc::Status& s) {
            return toError(s);
        });
        return std::unexpected {errors};
    }

private:
    std::string addr;
    RetryPolicy policy;
    std::unordered_map<std::string, function_t> functions;
    std::shared_ptr<grpc::Channel> channel;
    std::shared_ptr<Stub> stub;
};

template<typename Service>
RPCService<Service>::RPCService(const std::string& address, const RetryPolicy p, std::unordered_map<std::string, function_t> f)
    : addr {address},
      policy {p},
      functions {std::move(f)},
      channel {grpc::CreateChannel(address, grpc::InsecureChannelCredentials())},
      stub {Service::NewStub(channel)} {}

template<typename Service>
std::expected<std::monostate, Error> RPCService<Service>::connect() {
    if (channel->WaitForConnected(std::chrono::system_clock::now() + policy.channelTimeout)) {
        return {};
    }
    return std::unexpected {Error{ErrorCode::StoreUnavailable, "Could not connect to service @" + addr}};
}

} // namespace dlock

#endif // RPC_SERVICE_H
