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
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "client/Options.hpp"
#include "client/RPCConnection.hpp"
#include "common/Error.hpp"
#include "common/Script.hpp"
#include "common/Types.hpp"
#include "server/ScriptRegistry.hpp"
#include "server/StoreServiceImpl.hpp"
#include "storage/InMemoryKVStore.hpp"

using glock::Command;
using glock::DialOptions;
using glock::ErrorCode;
using glock::InMemoryKVStore;
using glock::RPCConnection;
using glock::ScriptRegistry;
using glock::SetOptions;
using glock::StoreServer;
using glock::StoreServiceImpl;
using glock::dialStore;
using namespace std::chrono_literals;

class RPCConnectionTest : public ::testing::Test {
protected:
    InMemoryKVStore kv;
    ScriptRegistry scripts = glock::standardScripts();
    StoreServiceImpl service {kv, scripts};
    std::unique_ptr<StoreServer> server;
    DialOptions options {500ms, 1000ms};
    std::string address;

    void SetUp() override {
        server = std::make_unique<StoreServer>("localhost:0", service);
        address = "localhost:" + std::to_string(server->port());
    }

    void TearDown() override {
        server->shutdown();
    }
};

TEST_F(RPCConnectionTest, DialAndPing) {
    auto conn = dialStore("tcp", address, options);
    ASSERT_TRUE(conn.has_value());
    EXPECT_TRUE(conn.value()->ping().has_value());
}

TEST_F(RPCConnectionTest, GetSetEraseThroughConnection) {
    auto conn = dialStore("tcp", address, options);
    ASSERT_TRUE(conn.has_value());
    auto& c = *conn.value();
    auto missing = c.get("k");
    ASSERT_TRUE(missing.has_value());
    EXPECT_FALSE(missing->has_value());
    ASSERT_TRUE(c.set("k", "v", SetOptions{5s, true}).has_value());
    EXPECT_EQ(c.get("k").value(), "v");
    auto conflict = c.set("k", "w", SetOptions{5s, true});
    ASSERT_FALSE(conflict.has_value());
    EXPECT_EQ(conflict.error().code, ErrorCode::KeyExists);
    const auto ttl = c.pttl("k");
    ASSERT_TRUE(ttl.has_value());
    EXPECT_GT(ttl.value(), 0ms);
    EXPECT_TRUE(c.erase("k").value());
    EXPECT_EQ(c.pttl("k").value(), glock::KeyMissing);
}

TEST_F(RPCConnectionTest, EvalAndExec) {
    auto conn = dialStore("tcp", address, options);
    ASSERT_TRUE(conn.has_value());
    auto& c = *conn.value();
    ASSERT_TRUE(c.set("glock:job", "a1", SetOptions{5s, true}).has_value());
    ASSERT_TRUE(c.set("glock:job:data", "payload", SetOptions{}).has_value());
    auto replies = c.exec({Command::get("glock:job"), Command::pttl("glock:job"), Command::get("glock:job:data")});
    ASSERT_TRUE(replies.has_value());
    ASSERT_EQ(replies->size(), 3);
    EXPECT_EQ(std::get<std::optional<std::string>>(replies->at(0)), "a1");
    EXPECT_GT(std::get<std::chrono::milliseconds>(replies->at(1)), 0ms);
    EXPECT_EQ(std::get<std::optional<std::string>>(replies->at(2)), "payload");
    auto released = c.eval(glock::releaseScript, {"glock:job", "glock:job:data"}, {"a1"});
    ASSERT_TRUE(released.has_value());
    EXPECT_EQ(released.value(), 1);
    EXPECT_EQ(kv.size(), 0);
}

TEST_F(RPCConnectionTest, UnknownScriptIsNoScript) {
    auto conn = dialStore("tcp", address, options);
    ASSERT_TRUE(conn.has_value());
    const glock::Script unknown {"unlock", 1, 0, glock::releaseScript.body};
    auto result = conn.value()->eval(unknown, {"k"}, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NoScript);
}

TEST_F(RPCConnectionTest, UnsupportedNetwork) {
    auto conn = dialStore("udp", address, options);
    ASSERT_FALSE(conn.has_value());
    EXPECT_EQ(conn.error().code, ErrorCode::InvalidArg);
}

TEST_F(RPCConnectionTest, EmptyAddress) {
    auto conn = dialStore("tcp", "", options);
    ASSERT_FALSE(conn.has_value());
    EXPECT_EQ(conn.error().code, ErrorCode::InvalidArg);
}

TEST_F(RPCConnectionTest, InvalidTimeouts) {
    auto c1 = dialStore("tcp", address, DialOptions{0ms, 1000ms});
    ASSERT_FALSE(c1.has_value());
    EXPECT_EQ(c1.error().code, ErrorCode::InvalidArg);
    auto c2 = dialStore("tcp", address, DialOptions{1000ms, -1ms});
    ASSERT_FALSE(c2.has_value());
    EXPECT_EQ(c2.error().code, ErrorCode::InvalidArg);
}

TEST_F(RPCConnectionTest, ServerDownIsConnectionError) {
    server->shutdown();
    auto conn = dialStore("tcp", address, DialOptions{200ms, 200ms});
    ASSERT_FALSE(conn.has_value());
    EXPECT_EQ(conn.error().code, ErrorCode::ConnectionError);
}

TEST_F(RPCConnectionTest, CallsAfterCloseFail) {
    RPCConnection conn {address, options};
    ASSERT_TRUE(conn.connect().has_value());
    EXPECT_TRUE(conn.ping().has_value());
    conn.close();
    EXPECT_FALSE(conn.connected());
    auto ping = conn.ping();
    ASSERT_FALSE(ping.has_value());
    EXPECT_EQ(ping.error().code, ErrorCode::ConnectionError);
    auto get = conn.get("k");
    ASSERT_FALSE(get.has_value());
    EXPECT_EQ(get.error().code, ErrorCode::ConnectionError);
    conn.close();
}

TEST_F(RPCConnectionTest, CallsAfterServerStopFail) {
    auto conn = dialStore("tcp", address, DialOptions{500ms, 300ms});
    ASSERT_TRUE(conn.has_value());
    server->shutdown();
    auto ping = conn.value()->ping();
    ASSERT_FALSE(ping.has_value());
    EXPECT_TRUE(ping.error().code == ErrorCode::ConnectionError || ping.error().code == ErrorCode::Timeout)
        << ping.error();
}

TEST_F(RPCConnectionTest, AddressIsTheDialTarget) {
    RPCConnection conn {address, options};
    EXPECT_EQ(conn.address(), address);
    EXPECT_FALSE(conn.connected());
    ASSERT_TRUE(conn.connect().has_value());
    EXPECT_EQ(conn.address(), address);
}
