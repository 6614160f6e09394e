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
#include "common/Error.hpp"
#include <utility>
#include <string>
#include <ostream>
#include <proto/error.pb.h>

namespace glock {

std::ostream& operator<<(std::ostream& os, const ErrorCode& code) {
    os << toString(code);
    return os;
}

std::ostream& operator<<(std::ostream& os, const Error& error) {
    os << toString(error.code) << ": " << error.what;
    if (!error.key.empty()) {
        os << " (key " << error.key << ")";
    }
    return os;
}

std::string toString(const ErrorCode& code) {
    switch (code)
    {
        case ErrorCode::OK: return "OK";
        case ErrorCode::InvalidArg: return "InvalidArgument";
        case ErrorCode::InvalidTTL: return "InvalidTTL";
        case ErrorCode::LockHeldByOtherClient: return "LockHeldByOtherClient";
        case ErrorCode::LockNotOwned: return "LockNotOwned";
        case ErrorCode::ConnectionError: return "ConnectionError";
        case ErrorCode::StoreError: return "StoreError";
        case ErrorCode::KeyNotFound: return "KeyNotFound";
        case ErrorCode::KeyExists: return "KeyExists";
        case ErrorCode::NoScript: return "NoScript";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Internal: return "Internal";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::Unknown: return "Unknown";
    }
    std::unreachable();
}

Error toStoreError(const Error& error) {
    if (error.code == ErrorCode::ConnectionError || error.code == ErrorCode::StoreError) {
        return error;
    }
    return Error{ErrorCode::StoreError, toString(error.code) + ": " + error.what, error.key};
}

Error::Error(const ErrorCode& c, std::string w, std::string k) : code {c}, what {std::move(w)}, key {std::move(k)} {}
Error::Error(const ErrorCode& c, std::string w) : code {c}, what {std::move(w)}, key {} {}
Error::Error(const ErrorCode& c) : code {c}, what {toString(c)}, key {} {}
// Codes from a newer peer are not known here.
Error::Error(const proto::ErrorDetails& error)
    : code {proto::ErrorCode_IsValid(error.code()) ? static_cast<ErrorCode>(error.code()) : ErrorCode::Unknown},
      what {error.what()},
      key {error.key()} {}

} // namespace glock
