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
#ifndef CLIENT_H
#define CLIENT_H

#include "common/Error.hpp"
#include "lock/Lock.hpp"
#include <expected>
#include <memory>
#include <string>

namespace glock {

// A session against a lock backend and the factory for its locks.
class Client {
public:
    virtual ~Client() = default;

    // Same configuration and identity, no connection.
    [[nodiscard]] virtual std::unique_ptr<Client> clone() const = 0;
    virtual void close() = 0;
    virtual std::expected<void, Error> reconnect() = 0;
    // Locks acquired under the previous identity are not carried over.
    virtual void setID(const std::string& id) = 0;
    [[nodiscard]] virtual const std::string& id() const = 0;
    // Local only, the store is not contacted.
    [[nodiscard]] virtual std::unique_ptr<Lock> newLock(const std::string& name) = 0;
};

} // namespace glock

#endif // CLIENT_H
