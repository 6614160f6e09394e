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
#ifndef OPTIONS_H
#define OPTIONS_H

#include "client/StoreConnection.hpp"
#include "common/Error.hpp"
#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <string>

namespace glock {

inline constexpr auto defaultNamespace = "glock";
inline constexpr auto defaultNetwork = "tcp";

struct DialOptions {
    // How long to wait for the channel to become ready.
    std::chrono::milliseconds connectTimeout {1000};
    // Deadline applied to every call on the connection.
    std::chrono::milliseconds rpcTimeout {2000};
};

std::expected<void, Error> validate(const DialOptions& options);

using DialFunc = std::function<std::expected<std::unique_ptr<StoreConnection>, Error>(
    const std::string& network,
    const std::string& address,
    const DialOptions& options)>;

struct StoreOptions {
    // "tcp" or "unix"
    std::string network;
    // host:port, or a socket path for "unix"
    std::string address;
    // Generated when empty.
    std::string clientID;
    // Prefix of every key, "glock" when empty.
    std::string ns;
    DialOptions dialOptions;
    // Defaults to dialStore.
    DialFunc dialFunc;
};

} // namespace glock

#endif // OPTIONS_H
