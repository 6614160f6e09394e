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
#ifndef MEMORY_CLIENT_H
#define MEMORY_CLIENT_H

#include "common/Error.hpp"
#include "lock/Client.hpp"
#include "lock/Lock.hpp"
#include <chrono>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace glock {

// Process-local lock table shared by every MemoryClient attached to it. Each
// operation runs under one mutex, which gives the same atomicity as the
// store-side scripts.
class MemoryStore {
public:
    using clock = std::chrono::steady_clock;

    struct Snapshot {
        std::optional<std::string> owner;
        std::chrono::milliseconds ttl;
        std::optional<std::string> data;
    };

    bool acquire(const std::string& key, const std::string& dataKey, const std::string& owner,
                 const std::string& data, std::chrono::milliseconds ttl);
    bool release(const std::string& key, const std::string& dataKey, const std::string& owner);
    bool refresh(const std::string& key, const std::string& dataKey, const std::string& owner,
                 const std::string& data, std::chrono::milliseconds ttl);
    Snapshot snapshot(const std::string& key, const std::string& dataKey);
    // Number of unexpired leases.
    size_t leases();
private:
    struct Lease {
        std::string owner;
        clock::time_point expiresAt;
    };
    const Lease* live(const std::string& key, clock::time_point now) const;

    std::mutex m;
    std::unordered_map<std::string, Lease> owners;
    std::unordered_map<std::string, std::string> payloads;
};

struct MemoryOptions {
    // Generated when empty.
    std::string clientID;
    // "glock" when empty.
    std::string ns;
    std::shared_ptr<MemoryStore> store;
};

class MemoryClient : public Client {
public:
    // InvalidArg without a store.
    static std::expected<std::unique_ptr<MemoryClient>, Error> create(MemoryOptions options);

    MemoryClient(const MemoryClient&) = delete;
    MemoryClient& operator=(const MemoryClient&) = delete;

    [[nodiscard]] std::unique_ptr<Client> clone() const override;
    void close() override;
    std::expected<void, Error> reconnect() override;
    void setID(const std::string& id) override;
    [[nodiscard]] const std::string& id() const override;
    [[nodiscard]] std::unique_ptr<Lock> newLock(const std::string& name) override;

    [[nodiscard]] const std::string& ns() const { return opts.ns; }
    std::expected<MemoryStore*, Error> store();
private:
    explicit MemoryClient(MemoryOptions options);
    static std::unique_ptr<MemoryClient> make(MemoryOptions options);
    MemoryOptions opts;
    std::shared_ptr<MemoryStore> attached;
};

class MemoryLock : public Lock {
public:
    MemoryLock(const std::string& name, MemoryClient& c);
    std::expected<void, Error> acquire(std::chrono::milliseconds ttl) override;
    std::expected<void, Error> release() override;
    std::expected<void, Error> refresh() override;
    std::expected<void, Error> refreshTTL(std::chrono::milliseconds ttl) override;
    std::expected<LockInfo, Error> info() override;
    void setData(const std::string& data) override;
    [[nodiscard]] const std::string& name() const override;
private:
    [[nodiscard]] std::string key() const;
    [[nodiscard]] std::string dataKey() const;

    const std::string lockName;
    std::chrono::milliseconds ttl;
    std::string data;
    MemoryClient& client;
};

} // namespace glock

#endif // MEMORY_CLIENT_H
