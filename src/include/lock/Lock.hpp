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
#ifndef LOCK_H
#define LOCK_H

#include "common/Error.hpp"
#include "common/Types.hpp"
#include <chrono>
#include <expected>
#include <ostream>
#include <string>

namespace glock {

// Minimum lease a lock accepts.
inline constexpr std::chrono::milliseconds minTTL {1};

// A lease accepts ttl in [minTTL, maxTTL].
inline bool validTTL(std::chrono::milliseconds ttl) {
    return ttl >= minTTL && ttl <= maxTTL;
}

struct LockInfo {
    std::string name;
    bool acquired;
    std::string owner;
    std::chrono::milliseconds ttl;
    std::string data;

    bool operator==(const LockInfo& other) const = default;
};

std::ostream& operator<<(std::ostream& os, const LockInfo& info);

// A named, leasable mutual-exclusion handle bound to one Client. The lock
// keeps a reference to its client, which must outlive it.
class Lock {
public:
    virtual ~Lock() = default;

    // Takes the lock for ttl if nobody holds it. Never waits: fails with
    // LockHeldByOtherClient while another identity owns the lease.
    virtual std::expected<void, Error> acquire(std::chrono::milliseconds ttl) = 0;
    // Fails with LockNotOwned unless this client's identity holds the lease.
    virtual std::expected<void, Error> release() = 0;
    // Re-arms the lease with the current ttl and stores the current data.
    virtual std::expected<void, Error> refresh() = 0;
    // Sets the ttl used by this and subsequent refreshes.
    virtual std::expected<void, Error> refreshTTL(std::chrono::milliseconds ttl) = 0;
    virtual std::expected<LockInfo, Error> info() = 0;
    // Recorded in the store on the next successful acquire or refresh.
    virtual void setData(const std::string& data) = 0;
    [[nodiscard]] virtual const std::string& name() const = 0;
};

} // namespace glock

#endif // LOCK_H
