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
#ifndef STORAGE_ENGINE_HPP
#define STORAGE_ENGINE_HPP

#include "common/Types.hpp"
#include "common/Error.hpp"
#include "common/Script.hpp"
#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace glock {

class StorageEngine {
public:
    virtual ~StorageEngine() = default;

    virtual std::expected<std::optional<std::string>, Error> get(const Key& key) const = 0;
    // Fails with KeyExists when onlyIfAbsent is set and the key is live.
    virtual std::expected<void, Error> set(const Key& key, const std::string& value, const SetOptions& options) = 0;
    virtual std::expected<bool, Error> erase(const Key& key) = 0;
    virtual std::expected<std::chrono::milliseconds, Error> pttl(const Key& key) const = 0;
    virtual std::expected<int64_t, Error> eval(
        const Script& script,
        const std::vector<std::string>& keys,
        const std::vector<std::string>& args) = 0;
    virtual std::expected<std::vector<Reply>, Error> exec(const std::vector<Command>& commands) const = 0;
    virtual size_t size() const = 0;
};

} // namespace glock

#endif // STORAGE_ENGINE_HPP
