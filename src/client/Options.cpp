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
#include "client/Options.hpp"
#include <chrono>

namespace glock {

std::expected<void, Error> validate(const DialOptions& options) {
    if (options.connectTimeout <= std::chrono::milliseconds::zero()) {
        return std::unexpected {Error{ErrorCode::InvalidArg, "Connect timeout must be > zero."}};
    }
    if (options.rpcTimeout <= std::chrono::milliseconds::zero()) {
        return std::unexpected {Error{ErrorCode::InvalidArg, "RPC timeout must be > zero."}};
    }
    return {};
}

} // namespace glock
