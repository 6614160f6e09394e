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
#ifndef SRC_COMMON_ERROR_HPP
#define SRC_COMMON_ERROR_HPP

#include <string>
#include <ostream>
#include <proto/error.pb.h>

namespace glock {

enum class ErrorCode {
    OK = 0,
    InvalidArg = 1,
    InvalidTTL = 2,
    LockHeldByOtherClient = 3,
    LockNotOwned = 4,
    ConnectionError = 5,
    StoreError = 6,
    KeyNotFound = 7,
    KeyExists = 8,
    NoScript = 9,
    Timeout = 10,
    Internal = 11,
    Cancelled = 12,
    Unknown = 128
};

std::ostream& operator<<(std::ostream& os, const ErrorCode& code);

std::string toString(const ErrorCode& code);

struct Error {
    ErrorCode code;
    std::string what;
    std::string key;

    Error(const ErrorCode& c, std::string w);
    Error(const ErrorCode& c, std::string w, std::string k);
    explicit Error(const ErrorCode& c);
    explicit Error(const proto::ErrorDetails& error);
};

std::ostream& operator<<(std::ostream& os, const Error& error);

// Wraps a store-level failure into the StoreError kind, keeping the original
// code in the message. Connection failures keep their own kind.
Error toStoreError(const Error& error);

} // namespace glock

#endif // SRC_COMMON_ERROR_HPP
