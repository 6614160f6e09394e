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
#include "lock/StoreClient.hpp"
#include "lock/StoreLock.hpp"
#include "client/RPCConnection.hpp"
#include "common/Util.hpp"
#include <spdlog/spdlog.h>
#include <utility>

namespace glock {

namespace {

Error toConnectionError(const Error& e) {
    if (e.code == ErrorCode::ConnectionError || e.code == ErrorCode::InvalidArg) {
        return e;
    }
    return Error{ErrorCode::ConnectionError, toString(e.code) + ": " + e.what};
}

} // namespace

StoreClient::StoreClient(StoreOptions options) : opts {std::move(options)}, conn {} {}

std::unique_ptr<StoreClient> StoreClient::make(StoreOptions options) {
    return std::unique_ptr<StoreClient>(new StoreClient(std::move(options)));
}

StoreClient::~StoreClient() {
    close();
}

std::expected<std::unique_ptr<StoreClient>, Error> StoreClient::create(StoreOptions options) {
    if (options.clientID.empty()) {
        options.clientID = glock_generate_client_id();
    }
    if (options.network.empty()) {
        options.network = defaultNetwork;
    }
    if (options.ns.empty()) {
        options.ns = defaultNamespace;
    }
    if (!options.dialFunc) {
        options.dialFunc = dialStore;
    }
    if (auto valid = validate(options.dialOptions); !valid.has_value()) {
        return std::unexpected {valid.error()};
    }
    auto c = make(std::move(options));
    if (auto r = c->reconnect(); !r.has_value()) {
        return std::unexpected {r.error()};
    }
    spdlog::info("Client {} connected to {} (namespace {})", c->id(), c->opts.address, c->opts.ns);
    return c;
}

std::unique_ptr<Client> StoreClient::clone() const {
    return make(opts);
}

void StoreClient::close() {
    if (conn) {
        conn->close();
        conn.reset();
    }
}

std::expected<void, Error> StoreClient::reconnect() {
    close();
    auto dialed = opts.dialFunc(opts.network, opts.address, opts.dialOptions);
    if (!dialed.has_value()) {
        spdlog::warn("Client {} failed to dial {}: {}", opts.clientID, opts.address, dialed.error().what);
        return std::unexpected {toConnectionError(dialed.error())};
    }
    if (!dialed.value()) {
        return std::unexpected {Error{ErrorCode::ConnectionError, "dial returned no connection"}};
    }
    conn = std::move(dialed.value());
    if (auto p = conn->ping(); !p.has_value()) {
        spdlog::warn("Client {} ping to {} failed: {}", opts.clientID, opts.address, p.error().what);
        close();
        return std::unexpected {toConnectionError(p.error())};
    }
    return {};
}

void StoreClient::setID(const std::string& id) {
    opts.clientID = id;
}

const std::string& StoreClient::id() const {
    return opts.clientID;
}

std::unique_ptr<Lock> StoreClient::newLock(const std::string& name) {
    return std::make_unique<StoreLock>(name, *this);
}

std::expected<StoreConnection*, Error> StoreClient::connection() {
    if (!conn) {
        return std::unexpected {Error{ErrorCode::ConnectionError, "client " + opts.clientID + " is not connected"}};
    }
    return conn.get();
}

} // namespace glock
