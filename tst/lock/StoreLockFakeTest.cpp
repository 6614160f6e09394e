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
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "client/Options.hpp"
#include "client/StoreConnection.hpp"
#include "common/Error.hpp"
#include "common/Script.hpp"
#include "common/Types.hpp"
#include "lock/StoreClient.hpp"
#include "storage/InMemoryKVStore.hpp"

using glock::Command;
using glock::DialOptions;
using glock::Error;
using glock::ErrorCode;
using glock::InMemoryKVStore;
using glock::Reply;
using glock::Script;
using glock::SetOptions;
using glock::StoreClient;
using glock::StoreConnection;
using glock::StoreOptions;
using namespace std::chrono_literals;

namespace {

// Counts every call and serves it from a local store, failing on request.
struct CallLog {
    int pings = 0;
    int sets = 0;
    int evals = 0;
    int execs = 0;
    std::vector<std::string> scripts;
    // Writes to this key fail with failure.
    std::string failKey;
    std::optional<Error> failure;
    // Every call other than ping fails with this.
    std::optional<Error> outage;

    [[nodiscard]] int storeCalls() const { return sets + evals + execs; }
};

class FakeConnection : public StoreConnection {
public:
    FakeConnection(InMemoryKVStore& s, CallLog& l) : kv {s}, log {l} {}

    std::expected<void, Error> ping() override {
        ++log.pings;
        return {};
    }
    std::expected<std::optional<std::string>, Error> get(const std::string& key) override {
        if (log.outage) {
            return std::unexpected {log.outage.value()};
        }
        return kv.get(key);
    }
    std::expected<void, Error> set(const std::string& key, const std::string& value, const SetOptions& options) override {
        ++log.sets;
        if (log.outage) {
            return std::unexpected {log.outage.value()};
        }
        if (key == log.failKey && log.failure) {
            return std::unexpected {log.failure.value()};
        }
        return kv.set(key, value, options);
    }
    std::expected<bool, Error> erase(const std::string& key) override {
        return kv.erase(key);
    }
    std::expected<std::chrono::milliseconds, Error> pttl(const std::string& key) override {
        return kv.pttl(key);
    }
    std::expected<int64_t, Error> eval(
        const Script& script,
        const std::vector<std::string>& keys,
        const std::vector<std::string>& args) override {
        ++log.evals;
        log.scripts.push_back(script.name);
        if (log.outage) {
            return std::unexpected {log.outage.value()};
        }
        return kv.eval(script, keys, args);
    }
    std::expected<std::vector<Reply>, Error> exec(const std::vector<Command>& commands) override {
        ++log.execs;
        if (log.outage) {
            return std::unexpected {log.outage.value()};
        }
        return kv.exec(commands);
    }
    void close() override {}
private:
    InMemoryKVStore& kv;
    CallLog& log;
};

} // namespace

class StoreLockFakeTest : public ::testing::Test {
protected:
    InMemoryKVStore kv;
    CallLog log;
    std::unique_ptr<StoreClient> client;

    void SetUp() override {
        StoreOptions o;
        o.address = "fake:0";
        o.clientID = "a1";
        o.dialFunc = [this](const std::string&, const std::string&, const DialOptions&)
            -> std::expected<std::unique_ptr<StoreConnection>, Error> {
            return std::make_unique<FakeConnection>(kv, log);
        };
        auto c = StoreClient::create(o);
        ASSERT_TRUE(c.has_value());
        client = std::move(c.value());
    }
};

TEST_F(StoreLockFakeTest, CreatePingsOnce) {
    EXPECT_EQ(log.pings, 1);
    EXPECT_EQ(log.storeCalls(), 0);
}

TEST_F(StoreLockFakeTest, InvalidTTLMakesNoStoreCalls) {
    auto lock = client->newLock("job-7");
    auto r = lock->acquire(0ms);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidTTL);
    auto refresh = lock->refreshTTL(0ms);
    ASSERT_FALSE(refresh.has_value());
    EXPECT_EQ(refresh.error().code, ErrorCode::InvalidTTL);
    EXPECT_EQ(log.storeCalls(), 0);
}

TEST_F(StoreLockFakeTest, AcquireWritesOwnerThenData) {
    auto lock = client->newLock("job-7");
    lock->setData("payload");
    ASSERT_TRUE(lock->acquire(5s).has_value());
    EXPECT_EQ(log.sets, 2);
    EXPECT_EQ(log.evals, 0);
    EXPECT_EQ(kv.get("glock:job-7").value(), "a1");
    EXPECT_EQ(kv.get("glock:job-7:data").value(), "payload");
}

TEST_F(StoreLockFakeTest, FailedDataWriteRollsBack) {
    log.failKey = "glock:job-7:data";
    log.failure = Error{ErrorCode::Internal, "disk full", "glock:job-7:data"};
    auto lock = client->newLock("job-7");
    auto r = lock->acquire(5s);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::StoreError);
    ASSERT_EQ(log.scripts.size(), 1);
    EXPECT_EQ(log.scripts.front(), "release");
    EXPECT_FALSE(kv.get("glock:job-7").value().has_value());
    EXPECT_EQ(kv.size(), 0);
}

TEST_F(StoreLockFakeTest, StoreFailuresBecomeStoreError) {
    auto lock = client->newLock("job-7");
    ASSERT_TRUE(lock->acquire(5s).has_value());
    log.outage = Error{ErrorCode::Timeout, "deadline exceeded"};
    for (const auto& r : {lock->release(), lock->refresh()}) {
        ASSERT_FALSE(r.has_value());
        EXPECT_EQ(r.error().code, ErrorCode::StoreError);
    }
    auto info = lock->info();
    ASSERT_FALSE(info.has_value());
    EXPECT_EQ(info.error().code, ErrorCode::StoreError);
}

TEST_F(StoreLockFakeTest, ConnectionErrorsKeepTheirKind) {
    auto lock = client->newLock("job-7");
    log.outage = Error{ErrorCode::ConnectionError, "connection reset"};
    auto r = lock->acquire(5s);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::ConnectionError);
}

TEST_F(StoreLockFakeTest, ReleaseAndRefreshUseScripts) {
    auto lock = client->newLock("job-7");
    ASSERT_TRUE(lock->acquire(5s).has_value());
    ASSERT_TRUE(lock->refresh().has_value());
    ASSERT_TRUE(lock->release().has_value());
    EXPECT_EQ(log.scripts, (std::vector<std::string>{"refresh", "release"}));
}

TEST_F(StoreLockFakeTest, InfoIsOneBatch) {
    auto lock = client->newLock("job-7");
    ASSERT_TRUE(lock->info().has_value());
    EXPECT_EQ(log.execs, 1);
    EXPECT_EQ(log.storeCalls(), 1);
}

TEST_F(StoreLockFakeTest, FailedDialIsConnectionError) {
    StoreOptions o;
    o.address = "fake:0";
    o.dialFunc = [](const std::string&, const std::string&, const DialOptions&)
        -> std::expected<std::unique_ptr<StoreConnection>, Error> {
        return std::unexpected {Error{ErrorCode::Timeout, "no answer"}};
    };
    auto c = StoreClient::create(o);
    ASSERT_FALSE(c.has_value());
    EXPECT_EQ(c.error().code, ErrorCode::ConnectionError);
}

TEST_F(StoreLockFakeTest, OversizedTTLMakesNoStoreCalls) {
    auto lock = client->newLock("job-7");
    for (const auto ttl : {std::chrono::milliseconds::max() / 2, glock::maxTTL + 1ms}) {
        auto r = lock->acquire(ttl);
        ASSERT_FALSE(r.has_value());
        EXPECT_EQ(r.error().code, ErrorCode::InvalidTTL);
        auto refresh = lock->refreshTTL(ttl);
        ASSERT_FALSE(refresh.has_value());
        EXPECT_EQ(refresh.error().code, ErrorCode::InvalidTTL);
    }
    EXPECT_EQ(log.storeCalls(), 0);
}
