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
#ifndef DLOCK_TYPES_MAP_HPP
#define DLOCK_TYPES_MAP_HPP

#include <type_traits>
#include "proto/ttlStore.pb.h"
#include "proto/rowLockStore.pb.h"

namespace dlock {
template<class T>
struct map_to;

template<> struct map_to<ttlStore::SetRequest> { using type = ttlStore::SetReply; };
template<> struct map_to<ttlStore::GetRequest> { using type = ttlStore::GetReply; };
template<> struct map_to<ttlStore::EraseRequest> { using type = ttlStore::EraseReply; };
template<> struct map_to<rowLockStore::OpenTransactionRequest> { using type = rowLockStore::OpenTransactionReply; };
template<> struct map_to<rowLockStore::ReadRequest> { using type = rowLockStore::ReadReply; };
template<> struct map_to<rowLockStore::WriteRequest> { using type = rowLockStore::WriteReply; };
template<> struct map_to<rowLockStore::TransactionRequest> { using type = rowLockStore::TransactionReply; };

template<class T>
using map_to_t = typename map_to<T>::type;

} // namespace dlock
#endif // DLOCK_TYPES_MAP_HPP
