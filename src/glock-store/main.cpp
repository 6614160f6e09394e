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
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>
#include <spdlog/spdlog.h>
#include "server/ServerConfig.hpp"
#include "server/ScriptRegistry.hpp"
#include "server/StoreServiceImpl.hpp"
#include "storage/InMemoryKVStore.hpp"

using glock::InMemoryKVStore;
using glock::ScriptRegistry;
using glock::StoreServiceImpl;
using glock::StoreServer;

namespace {

std::atomic<bool> stopRequested {false};

void onSignal(int) {
    stopRequested.store(true);
}

} // namespace

int main(int argc, char** argv) {
    const std::vector<std::string> args(argv, argv + argc);
    auto config = glock::parseServerConfig(args, std::getenv("GLOCK_LOG_LEVEL"));
    if (!config.has_value()) {
        spdlog::error("{}", config.error().what);
        return EXIT_FAILURE;
    }
    spdlog::set_level(config->logLevel);
    spdlog::info("glock store starting...");

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    InMemoryKVStore kvStore {};
    const ScriptRegistry scripts = glock::standardScripts();
    StoreServiceImpl service {kvStore, scripts};
    StoreServer server {config->listenAddress, service};

    auto lastSweep = std::chrono::steady_clock::now();
    while (!stopRequested.load()) {
        std::this_thread::sleep_for(std::min(config->sweepInterval, std::chrono::milliseconds{100}));
        if (std::chrono::steady_clock::now() - lastSweep >= config->sweepInterval) {
            if (auto n = kvStore.purgeExpired(); n > 0) {
                spdlog::debug("Dropped {} expired keys", n);
            }
            lastSweep = std::chrono::steady_clock::now();
        }
    }
    spdlog::info("glock store shutting down");
    server.shutdown();
    return EXIT_SUCCESS;
}
