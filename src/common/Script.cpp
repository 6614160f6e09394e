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
#include "common/Script.hpp"
#include "common/Error.hpp"
#include <charconv>
#include <chrono>
#include <string>
#include <vector>

namespace glock {

std::expected<int64_t, Error> Script::run(
    Keyspace& ks,
    const std::vector<std::string>& keys,
    const std::vector<std::string>& args) const {
    if (keys.size() != numKeys) {
        return std::unexpected {Error{ErrorCode::InvalidArg,
            name + ": expected " + std::to_string(numKeys) + " keys but got " + std::to_string(keys.size())}};
    }
    if (args.size() != numArgs) {
        return std::unexpected {Error{ErrorCode::InvalidArg,
            name + ": expected " + std::to_string(numArgs) + " args but got " + std::to_string(args.size())}};
    }
    return body(ks, keys, args);
}

const Script releaseScript {
    "release",
    2,
    1,
    [](Keyspace& ks, const std::vector<std::string>& keys, const std::vector<std::string>& args)
        -> std::expected<int64_t, Error> {
        if (ks.get(Key{keys[0]}) != args[0]) {
            return 0;
        }
        ks.erase(Key{keys[0]});
        ks.erase(Key{keys[1]});
        return 1;
    }
};

const Script refreshScript {
    "refresh",
    2,
    3,
    [](Keyspace& ks, const std::vector<std::string>& keys, const std::vector<std::string>& args)
        -> std::expected<int64_t, Error> {
        int64_t ms = 0;
        const auto& ttl = args[1];
        auto [ptr, ec] = std::from_chars(ttl.data(), ttl.data() + ttl.size(), ms);
        if (ec != std::errc{} || ptr != ttl.data() + ttl.size() || ms <= 0 || ms > maxTTL.count()) {
            return std::unexpected {Error{ErrorCode::InvalidArg, "refresh: invalid ttl " + ttl, keys[0]}};
        }
        if (ks.get(Key{keys[0]}) != args[0]) {
            return 0;
        }
        ks.set(Key{keys[0]}, args[0], SetOptions{std::chrono::milliseconds{ms}, false});
        ks.set(Key{keys[1]}, args[2], SetOptions{});
        return 1;
    }
};

} // namespace glock
