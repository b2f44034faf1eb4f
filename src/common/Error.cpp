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
#include "common/Error.hpp"
#include <utility>
#include <string>
#include <ostream>
#include <unordered_set>
#include <unordered_map>

namespace dlock {

std::ostream& operator<<(std::ostream& os, const ErrorCode& code) {
    os << toString(code);
    return os;
}

std::string toString(const ErrorCode& code) {
    switch (code)
    {
        case ErrorCode::OK: return "OK";
        case ErrorCode::InvalidArg: return "InvalidArgument";
        case ErrorCode::Contention: return "Contention";
        case ErrorCode::StoreUnavailable: return "StoreUnavailable";
        case ErrorCode::LeaseLost: return "LeaseLost";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::KeyNotFound: return "KeyNotFound";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::TransactionNotFound: return "TransactionNotFound";
        case ErrorCode::Internal: return "Internal";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::Unknown: return "Unknown";
    }
    std::unreachable();
}

const std::unordered_map<std::string, std::unordered_set<ErrorCode, ErrorCodeHash>> retriableErrorCodes = {
    {"setIfAbsent", {
        ErrorCode::StoreUnavailable,
    }},
    {"openTransaction", {
        ErrorCode::StoreUnavailable,
    }},
    {"insert", {
        ErrorCode::StoreUnavailable,
    }},
    {"commit", {
        ErrorCode::StoreUnavailable,
    }},
    {"rollback", {
        ErrorCode::StoreUnavailable,
    }},
    // A blocking read has no deadline of its own, a Timeout here comes from
    // the caller's deadline and must not be replayed.
    {"readForUpdate", {
        ErrorCode::StoreUnavailable,
    }},
    {"default", {
        ErrorCode::Unknown,
        ErrorCode::StoreUnavailable,
        ErrorCode::Timeout,
    }}
};

bool isRetriable(const std::string& op, const ErrorCode& code) {
    auto it = retriableErrorCodes.find(op);
    if (it != retriableErrorCodes.end()) {
        return it->second.contains(code);
    }
    auto d = retriableErrorCodes.find("default");
    return d->second.contains(code);
}

Error::Error(const ErrorCode& c, std::string w, std::string k) : code {c}, what {std::move(w)}, key {std::move(k)} {}
Error::Error(const ErrorCode& c, std::string w) : code {c}, what {std::move(w)}, key{} {}
Error::Error(const ErrorCode& c) : code {c}, what {toString(c)}, key{} {}

} // namespace dlock
