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
#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <vector>
#include <spdlog/common.h>
#include "common/Error.hpp"
#include "server/ServerConfig.hpp"

using glock::ErrorCode;
using glock::parseServerConfig;
using namespace std::chrono_literals;

TEST(ServerConfigTest, Defaults) {
    auto config = parseServerConfig({"glock-store"}, nullptr);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->listenAddress, "0.0.0.0:6380");
    EXPECT_EQ(config->sweepInterval, 1000ms);
    EXPECT_EQ(config->logLevel, spdlog::level::info);
}

TEST(ServerConfigTest, AddressAndSweep) {
    auto config = parseServerConfig({"glock-store", "127.0.0.1:7000", "250"}, "debug");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->listenAddress, "127.0.0.1:7000");
    EXPECT_EQ(config->sweepInterval, 250ms);
    EXPECT_EQ(config->logLevel, spdlog::level::debug);
}

TEST(ServerConfigTest, OffIsAValidLevel) {
    auto config = parseServerConfig({"glock-store"}, "off");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->logLevel, spdlog::level::off);
}

TEST(ServerConfigTest, RejectsBadInput) {
    const std::vector<std::vector<std::string>> bad {
        {"glock-store", ""},
        {"glock-store", "localhost:1", "0"},
        {"glock-store", "localhost:1", "-10"},
        {"glock-store", "localhost:1", "fast"},
        {"glock-store", "localhost:1", "10ms"},
        {"glock-store", "localhost:1", "10", "extra"}};
    for (const auto& args : bad) {
        auto config = parseServerConfig(args, nullptr);
        ASSERT_FALSE(config.has_value()) << args.size();
        EXPECT_EQ(config.error().code, ErrorCode::InvalidArg);
    }
}

TEST(ServerConfigTest, RejectsUnknownLogLevel) {
    auto config = parseServerConfig({"glock-store"}, "chatty");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidArg);
}
