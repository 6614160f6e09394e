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
#ifndef SERVER_CONFIG_H
#define SERVER_CONFIG_H

#include "common/Error.hpp"
#include <chrono>
#include <expected>
#include <vector>
#include <string>
#include <spdlog/common.h>

namespace glock {

struct ServerConfig {
    std::string listenAddress {"0.0.0.0:6380"};
    // How often expired keys are dropped from memory.
    std::chrono::milliseconds sweepInterval {1000};
    spdlog::level::level_enum logLevel {spdlog::level::info};
};

// glock-store [address] [sweep-ms]; logLevel from the value of GLOCK_LOG_LEVEL
// when logLevelName is not null.
std::expected<ServerConfig, Error> parseServerConfig(const std::vector<std::string>& args, const char* logLevelName);

} // namespace glock

#endif // SERVER_CONFIG_H
