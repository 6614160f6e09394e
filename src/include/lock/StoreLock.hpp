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
#ifndef STORE_LOCK_H
#define STORE_LOCK_H

#include "lock/Lock.hpp"
#include "lock/StoreClient.hpp"
#include <chrono>
#include <string>

namespace glock {

class StoreLock : public Lock {
public:
    StoreLock(const std::string& name, StoreClient& c);
    std::expected<void, Error> acquire(std::chrono::milliseconds ttl) override;
    std::expected<void, Error> release() override;
    std::expected<void, Error> refresh() override;
    std::expected<void, Error> refreshTTL(std::chrono::milliseconds ttl) override;
    std::expected<LockInfo, Error> info() override;
    void setData(const std::string& data) override;
    [[nodiscard]] const std::string& name() const override;
    [[nodiscard]] std::string key() const;
    [[nodiscard]] std::string dataKey() const;
private:
    const std::string lockName;
    std::chrono::milliseconds ttl;
    std::string data;
    StoreClient& client;
};

} // namespace glock

#endif // STORE_LOCK_H
