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
#ifndef STORE_CLIENT_H
#define STORE_CLIENT_H

#include "client/Options.hpp"
#include "client/StoreConnection.hpp"
#include "common/Error.hpp"
#include "lock/Client.hpp"
#include "lock/Lock.hpp"
#include <expected>
#include <memory>
#include <string>

namespace glock {

// Client for locks kept in a remote store reached through a StoreConnection.
class StoreClient : public Client {
public:
    // Fills in defaults, connects and pings. ConnectionError when the store
    // cannot be reached.
    static std::expected<std::unique_ptr<StoreClient>, Error> create(StoreOptions options);

    StoreClient(const StoreClient&) = delete;
    StoreClient& operator=(const StoreClient&) = delete;
    ~StoreClient() override;

    [[nodiscard]] std::unique_ptr<Client> clone() const override;
    void close() override;
    std::expected<void, Error> reconnect() override;
    void setID(const std::string& id) override;
    [[nodiscard]] const std::string& id() const override;
    [[nodiscard]] std::unique_ptr<Lock> newLock(const std::string& name) override;

    [[nodiscard]] const StoreOptions& options() const { return opts; }
    [[nodiscard]] bool connected() const { return conn != nullptr; }
    // ConnectionError while disconnected.
    std::expected<StoreConnection*, Error> connection();
private:
    explicit StoreClient(StoreOptions options);
    static std::unique_ptr<StoreClient> make(StoreOptions options);
    StoreOptions opts;
    std::unique_ptr<StoreConnection> conn;
};

} // namespace glock

#endif // STORE_CLIENT_H
