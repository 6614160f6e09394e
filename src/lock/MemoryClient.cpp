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
#include "client/Options.hpp"
#include "common/Util.hpp"
#include <algorithm>
#include <utility>

namespace glock {

const MemoryStore::Lease* MemoryStore::live(const std::string& key, clock::time_point now) const {
    auto i = owners.find(key);
    if (i == owners.end() || now >= i->second.expiresAt) {
        return nullptr;
    }
    return &i->second;
}

bool MemoryStore::acquire(const std::string& key, const std::string& dataKey, const std::string& owner,
                          const std::string& data, std::chrono::milliseconds ttl) {
    const std::lock_guard lock {m};
    const auto now = clock::now();
    if (live(key, now) != nullptr) {
        return false;
    }
    owners.insert_or_assign(key, Lease{owner, now + ttl});
    payloads.insert_or_assign(dataKey, data);
    return true;
}

bool MemoryStore::release(const std::string& key, const std::string& dataKey, const std::string& owner) {
    const std::lock_guard lock {m};
    const auto* l = live(key, clock::now());
    if (l == nullptr || l->owner != owner) {
        return false;
    }
    owners.erase(key);
    payloads.erase(dataKey);
    return true;
}

bool MemoryStore::refresh(const std::string& key, const std::string& dataKey, const std::string& owner,
                          const std::string& data, std::chrono::milliseconds ttl) {
    const std::lock_guard lock {m};
    const auto now = clock::now();
    const auto* l = live(key, now);
    if (l == nullptr || l->owner != owner) {
        return false;
    }
    owners.insert_or_assign(key, Lease{owner, now + ttl});
    payloads.insert_or_assign(dataKey, data);
    return true;
}

MemoryStore::Snapshot MemoryStore::snapshot(const std::string& key, const std::string& dataKey) {
    const std::lock_guard lock {m};
    const auto now = clock::now();
    Snapshot s {std::nullopt, std::chrono::milliseconds::zero(), std::nullopt};
    if (const auto* l = live(key, now)) {
        s.owner = l->owner;
        s.ttl = std::max(std::chrono::ceil<std::chrono::milliseconds>(l->expiresAt - now), std::chrono::milliseconds{1});
    }
    if (auto i = payloads.find(dataKey); i != payloads.end()) {
        s.data = i->second;
    }
    return s;
}

size_t MemoryStore::leases() {
    const std::lock_guard lock {m};
    const auto now = clock::now();
    return static_cast<size_t>(std::count_if(owners.begin(), owners.end(), [now](const auto& p) {
        return now < p.second.expiresAt;
    }));
}

MemoryClient::MemoryClient(MemoryOptions options) : opts {std::move(options)}, attached {} {}

std::unique_ptr<MemoryClient> MemoryClient::make(MemoryOptions options) {
    return std::unique_ptr<MemoryClient>(new MemoryClient(std::move(options)));
}

std::expected<std::unique_ptr<MemoryClient>, Error> MemoryClient::create(MemoryOptions options) {
    if (!options.store) {
        return std::unexpected {Error{ErrorCode::InvalidArg, "MemoryClient: no store provided"}};
    }
    if (options.clientID.empty()) {
        options.clientID = glock_generate_client_id();
    }
    if (options.ns.empty()) {
        options.ns = defaultNamespace;
    }
    auto c = make(std::move(options));
    if (auto r = c->reconnect(); !r.has_value()) {
        return std::unexpected {r.error()};
    }
    return c;
}

std::unique_ptr<Client> MemoryClient::clone() const {
    return make(opts);
}

void MemoryClient::close() {
    attached.reset();
}

std::expected<void, Error> MemoryClient::reconnect() {
    close();
    if (!opts.store) {
        return std::unexpected {Error{ErrorCode::ConnectionError, "no memory store to attach to"}};
    }
    attached = opts.store;
    return {};
}

void MemoryClient::setID(const std::string& id) {
    opts.clientID = id;
}

const std::string& MemoryClient::id() const {
    return opts.clientID;
}

std::unique_ptr<Lock> MemoryClient::newLock(const std::string& name) {
    return std::make_unique<MemoryLock>(name, *this);
}

std::expected<MemoryStore*, Error> MemoryClient::store() {
    if (!attached) {
        return std::unexpected {Error{ErrorCode::ConnectionError, "client " + opts.clientID + " is not connected"}};
    }
    return attached.get();
}

} // namespace glock
