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
#ifndef STORE_CONNECTION_H
#define STORE_CONNECTION_H

#include "common/Error.hpp"
#include "common/Script.hpp"
#include "common/Types.hpp"
#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace glock {

// A single session against a backing store. Not safe for concurrent use.
class StoreConnection {
public:
    virtual ~StoreConnection() = default;
    virtual std::expected<void, Error> ping() = 0;
    // nullopt when the key is absent
    virtual std::expected<std::optional<std::string>, Error> get(const std::string& key) = 0;
    // KeyExists when onlyIfAbsent rejected the write
    virtual std::expected<void, Error> set(const std::string& key, const std::string& value, const SetOptions& options) = 0;
    virtual std::expected<bool, Error> erase(const std::string& key) = 0;
    virtual std::expected<std::chrono::milliseconds, Error> pttl(const std::string& key) = 0;
    virtual std::expected<int64_t, Error> eval(
        const Script& script,
        const std::vector<std::string>& keys,
        const std::vector<std::string>& args) = 0;
    // All commands observe the same store state.
    virtual std::expected<std::vector<Reply>, Error> exec(const std::vector<Command>& commands) = 0;
    virtual void close() = 0;
};

} // namespace glock

#endif // STORE_CONNECTION_H
