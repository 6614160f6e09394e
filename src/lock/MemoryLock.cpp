// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * glock a distributed lock service on top of a key-value store.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include "lock/MemoryClient.hpp"
#include "common/Types.hpp"
#include <string>

namespace glock {

MemoryLock::MemoryLock(const std::string& name, MemoryClient& c)
    : lockName {name}, ttl {0}, data {}, client {c} {}

std::string MemoryLock::key() const {
    return client.ns() + ":" + lockName;
}

std::string MemoryLock::dataKey() const {
    return key() + ":data";
}

const std::string& MemoryLock::name() const {
    return lockName;
}

void MemoryLock::setData(const std::string& d) {
    data = d;
}

std::expected<void, Error> MemoryLock::acquire(std::chrono::milliseconds t) {
    if (!validTTL(t)) {
        return std::unexpected {Error{ErrorCode::InvalidTTL, "ttl must be between 1ms and " + std::to_string(maxTTL.count()) + "ms", key()}};
    }
    auto s = client.store();
    if (!s.has_value()) {
        return std::unexpected {s.error()};
    }
    if (!s.value()->acquire(key(), dataKey(), client.id(), data, t)) {
        return std::unexpected {Error{ErrorCode::LockHeldByOtherClient, "lock is held by another client", key()}};
    }
    ttl = t;
    return {};
}

std::expected<void, Error> MemoryLock::release() {
    auto s = client.store();
    if (!s.has_value()) {
        return std::unexpected {s.error()};
    }
    if (!s.value()->release(key(), dataKey(), client.id())) {
        return std::unexpected {Error{ErrorCode::LockNotOwned, "lock is not owned by this client", key()}};
    }
    return {};
}

std::expected<void, Error> MemoryLock::refreshTTL(std::chrono::milliseconds t) {
    ttl = t;
    return refresh();
}

std::expected<void, Error> MemoryLock::refresh() {
    if (!validTTL(ttl)) {
        return std::unexpected {Error{ErrorCode::InvalidTTL, "ttl must be between 1ms and " + std::to_string(maxTTL.count()) + "ms", key()}};
    }
    auto s = client.store();
    if (!s.has_value()) {
        return std::unexpected {s.error()};
    }
    if (!s.value()->refresh(key(), dataKey(), client.id(), data, ttl)) {
        return std::unexpected {Error{ErrorCode::LockNotOwned, "lock is not owned by this client", key()}};
    }
    return {};
}

std::expected<LockInfo, Error> MemoryLock::info() {
    auto s = client.store();
    if (!s.has_value()) {
        return std::unexpected {s.error()};
    }
    auto snap = s.value()->snapshot(key(), dataKey());
    return LockInfo{
        lockName,
        snap.ttl > std::chrono::milliseconds::zero(),
        snap.owner.value_or(""),
        snap.ttl,
        snap.data.value_or("")
    };
}

} // namespace glock
