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
#ifndef IN_MEMORY_KV_STORE_H
#define IN_MEMORY_KV_STORE_H

#include <string>
#include <unordered_map>
#include <shared_mutex>
#include <chrono>
#include <expected>
#include <optional>
#include "common/Error.hpp"
#include "storage/StorageEngine.hpp"

namespace glock {

class InMemoryKVStore : public StorageEngine {
public:
    using clock = std::chrono::steady_clock;

    InMemoryKVStore();
    std::expected<std::optional<std::string>, Error> get(const Key& key) const override;
    std::expected<void, Error> set(const Key& key, const std::string& value, const SetOptions& options) override;
    std::expected<bool, Error> erase(const Key& key) override;
    std::expected<std::chrono::milliseconds, Error> pttl(const Key& key) const override;
    std::expected<int64_t, Error> eval(
        const Script& script,
        const std::vector<std::string>& keys,
        const std::vector<std::string>& args) override;
    std::expected<std::vector<Reply>, Error> exec(const std::vector<Command>& commands) const override;
    size_t size() const override;
    // Drops every expired entry, returns how many were removed.
    size_t purgeExpired();
private:
    struct Entry {
        std::string data;
        std::optional<clock::time_point> expiresAt;

        bool live(clock::time_point now) const {
            return !expiresAt.has_value() || now < expiresAt.value();
        }
    };
    class LockedKeyspace;

    const Entry* find(const Key& key, clock::time_point now) const;
    bool put(const Key& key, const std::string& value, const SetOptions& options, clock::time_point now);
    bool remove(const Key& key, clock::time_point now);
    std::chrono::milliseconds remaining(const Key& key, clock::time_point now) const;

    std::unordered_map<Key, Entry, KeyHash> store;
    mutable std::shared_mutex m;
};

} // namespace glock

#endif // IN_MEMORY_KV_STORE_H
