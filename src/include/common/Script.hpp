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
#ifndef SCRIPT_HPP
#define SCRIPT_HPP

#include "common/Error.hpp"
#include "common/Types.hpp"
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace glock {

// Store operations visible to a running script. Implementations are only
// handed out while the store holds its exclusive lock, so a script body runs
// as one indivisible step.
class Keyspace {
public:
    virtual ~Keyspace() = default;
    virtual std::optional<std::string> get(const Key& key) = 0;
    // Returns false when onlyIfAbsent is set and the key is live.
    virtual bool set(const Key& key, const std::string& value, const SetOptions& options) = 0;
    virtual bool erase(const Key& key) = 0;
    virtual std::chrono::milliseconds pttl(const Key& key) = 0;
};

struct Script {
    using body_t = std::function<std::expected<int64_t, Error>(
        Keyspace& ks,
        const std::vector<std::string>& keys,
        const std::vector<std::string>& args)>;

    std::string name;
    std::size_t numKeys;
    std::size_t numArgs;
    body_t body;

    std::expected<int64_t, Error> run(
        Keyspace& ks,
        const std::vector<std::string>& keys,
        const std::vector<std::string>& args) const;
};

// KEYS: owner, data. ARGV: expected owner.
// Deletes both keys and returns 1 if the owner matches, else 0.
extern const Script releaseScript;

// KEYS: owner, data. ARGV: expected owner, ttl in ms, payload.
// Re-arms the owner key and overwrites the data key, returning 1 if the owner
// matches, else 0.
extern const Script refreshScript;

} // namespace glock

#endif // SCRIPT_HPP
