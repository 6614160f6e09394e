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
#ifndef TYPES_HPP
#define TYPES_HPP

#include <string>
#include <chrono>
#include <optional>
#include <variant>
#include <functional>

namespace glock {

struct Key {
    std::string data;

    Key(const std::string& d) : data(d) {}
    Key(const char* d) : data(d) {}

    bool operator==(const Key& other) const {
        return data == other.data;
    }
};

struct KeyHash {
    std::size_t operator()(const Key& key) const {
        return std::hash<std::string>()(key.data);
    }
};

// pttl results for keys without a remaining lifetime
inline constexpr std::chrono::milliseconds KeyMissing {-2};
inline constexpr std::chrono::milliseconds NoExpiry {-1};

// Longest expiry a key accepts. Expiry deadlines are kept as steady_clock
// nanoseconds, which overflow past roughly 292 years.
inline constexpr std::chrono::milliseconds maxTTL {std::chrono::hours {24 * 365 * 100}};

struct SetOptions {
    std::optional<std::chrono::milliseconds> ttl;
    bool onlyIfAbsent = false;
};

// One read inside an atomic batch.
struct Command {
    enum class Op : char {
        Get,
        Pttl
    };
    Op op;
    Key key;

    static Command get(const Key& k) { return Command{Op::Get, k}; }
    static Command pttl(const Key& k) { return Command{Op::Pttl, k}; }
};

using Reply = std::variant<std::optional<std::string>, std::chrono::milliseconds>;

} // namespace glock

#endif // TYPES_HPP
