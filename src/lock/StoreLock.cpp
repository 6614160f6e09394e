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
#include "lock/StoreLock.hpp"
#include "common/Script.hpp"
#include "common/Types.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <string>
#include <variant>
#include <vector>

namespace glock {

StoreLock::StoreLock(const std::string& name, StoreClient& c)
    : lockName {name}, ttl {0}, data {}, client {c} {}

std::string StoreLock::key() const {
    return client.options().ns + ":" + lockName;
}

std::string StoreLock::dataKey() const {
    return key() + ":data";
}

const std::string& StoreLock::name() const {
    return lockName;
}

void StoreLock::setData(const std::string& d) {
    data = d;
}

std::expected<void, Error> StoreLock::acquire(std::chrono::milliseconds t) {
    if (!validTTL(t)) {
        return std::unexpected {Error{ErrorCode::InvalidTTL, "ttl must be between 1ms and " + std::to_string(maxTTL.count()) + "ms", key()}};
    }
    auto conn = client.connection();
    if (!conn.has_value()) {
        return std::unexpected {conn.error()};
    }
    auto owner = conn.value()->set(key(), client.id(), SetOptions{t, true});
    if (!owner.has_value()) {
        if (owner.error().code == ErrorCode::KeyExists) {
            return std::unexpected {Error{ErrorCode::LockHeldByOtherClient, "lock is held by another client", key()}};
        }
        return std::unexpected {toStoreError(owner.error())};
    }
    auto payload = conn.value()->set(dataKey(), data, SetOptions{});
    if (!payload.has_value()) {
        // Give the lease back rather than hold it with a stale payload.
        spdlog::warn("Acquired {} but could not write its data: {}", key(), payload.error().what);
        auto undo = conn.value()->eval(releaseScript, {key(), dataKey()}, {client.id()});
        if (!undo.has_value()) {
            spdlog::warn("Rolling back {} failed, lease expires in {}ms: {}", key(), t.count(), undo.error().what);
        }
        return std::unexpected {toStoreError(payload.error())};
    }
    ttl = t;
    spdlog::debug("{} acquired {} for {}ms", client.id(), key(), t.count());
    return {};
}

std::expected<void, Error> StoreLock::release() {
    auto conn = client.connection();
    if (!conn.has_value()) {
        return std::unexpected {conn.error()};
    }
    auto res = conn.value()->eval(releaseScript, {key(), dataKey()}, {client.id()});
    if (!res.has_value()) {
        return std::unexpected {toStoreError(res.error())};
    }
    if (res.value() == 0) {
        return std::unexpected {Error{ErrorCode::LockNotOwned, "lock is not owned by this client", key()}};
    }
    spdlog::debug("{} released {}", client.id(), key());
    return {};
}

std::expected<void, Error> StoreLock::refreshTTL(std::chrono::milliseconds t) {
    ttl = t;
    return refresh();
}

std::expected<void, Error> StoreLock::refresh() {
    if (!validTTL(ttl)) {
        return std::unexpected {Error{ErrorCode::InvalidTTL, "ttl must be between 1ms and " + std::to_string(maxTTL.count()) + "ms", key()}};
    }
    auto conn = client.connection();
    if (!conn.has_value()) {
        return std::unexpected {conn.error()};
    }
    auto res = conn.value()->eval(refreshScript, {key(), dataKey()}, {client.id(), std::to_string(ttl.count()), data});
    if (!res.has_value()) {
        return std::unexpected {toStoreError(res.error())};
    }
    if (res.value() == 0) {
        return std::unexpected {Error{ErrorCode::LockNotOwned, "lock is not owned by this client", key()}};
    }
    return {};
}

std::expected<LockInfo, Error> StoreLock::info() {
    auto conn = client.connection();
    if (!conn.has_value()) {
        return std::unexpected {conn.error()};
    }
    auto replies = conn.value()->exec({Command::get(key()), Command::pttl(key()), Command::get(dataKey())});
    if (!replies.has_value()) {
        return std::unexpected {toStoreError(replies.error())};
    }
    const auto& r = replies.value();
    const auto* owner = r.size() == 3 ? std::get_if<std::optional<std::string>>(&r[0]) : nullptr;
    const auto* remaining = r.size() == 3 ? std::get_if<std::chrono::milliseconds>(&r[1]) : nullptr;
    const auto* payload = r.size() == 3 ? std::get_if<std::optional<std::string>>(&r[2]) : nullptr;
    if (owner == nullptr || remaining == nullptr || payload == nullptr) {
        return std::unexpected {Error{ErrorCode::StoreError, "malformed info reply", key()}};
    }
    const auto left = std::max(*remaining, std::chrono::milliseconds::zero());
    return LockInfo{
        lockName,
        left > std::chrono::milliseconds::zero(),
        owner->value_or(""),
        left,
        payload->value_or("")
    };
}

} // namespace glock
