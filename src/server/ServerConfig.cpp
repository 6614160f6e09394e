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
#include "server/ServerConfig.hpp"
#include <charconv>
#include <string>

namespace glock {

std::expected<ServerConfig, Error> parseServerConfig(const std::vector<std::string>& args, const char* logLevelName) {
    ServerConfig config;
    if (args.size() > 3) {
        return std::unexpected {Error{ErrorCode::InvalidArg, "usage: glock-store [address] [sweep-ms]"}};
    }
    if (args.size() > 1) {
        config.listenAddress = args[1];
        if (config.listenAddress.empty()) {
            return std::unexpected {Error{ErrorCode::InvalidArg, "empty listen address"}};
        }
    }
    if (args.size() > 2) {
        const std::string& sweep = args[2];
        long long ms = 0;
        auto [ptr, ec] = std::from_chars(sweep.data(), sweep.data() + sweep.size(), ms);
        if (ec != std::errc{} || ptr != sweep.data() + sweep.size() || ms <= 0) {
            return std::unexpected {Error{ErrorCode::InvalidArg, "sweep interval must be a positive number of ms: " + sweep}};
        }
        config.sweepInterval = std::chrono::milliseconds{ms};
    }
    if (logLevelName != nullptr) {
        const std::string name {logLevelName};
        auto level = spdlog::level::from_str(name);
        // from_str falls back to off for unknown names
        if (level == spdlog::level::off && name != "off") {
            return std::unexpected {Error{ErrorCode::InvalidArg, "unknown log level: " + name}};
        }
        config.logLevel = level;
    }
    return config;
}

} // namespace glock
