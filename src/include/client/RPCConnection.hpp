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
#ifndef RPC_CONNECTION_H
#define RPC_CONNECTION_H

#include "client/Options.hpp"
#include "client/StoreConnection.hpp"
#include "common/Error.hpp"
#include "common/ErrorConverter.hpp"
#include <grpcpp/grpcpp.h>
#include "proto/store.grpc.pb.h"
#include <chrono>
#include <expected>
#include <memory>
#include <string>

namespace glock {

class RPCConnection : public StoreConnection {
public:
    RPCConnection(const std::string& target, const DialOptions& options);
    RPCConnection(const RPCConnection&) = delete;
    RPCConnection& operator=(const RPCConnection&) = delete;
    std::expected<void, Error> connect();
    std::expected<void, Error> ping() override;
    std::expected<std::optional<std::string>, Error> get(const std::string& key) override;
    std::expected<void, Error> set(const std::string& key, const std::string& value, const SetOptions& options) override;
    std::expected<bool, Error> erase(const std::string& key) override;
    std::expected<std::chrono::milliseconds, Error> pttl(const std::string& key) override;
    std::expected<int64_t, Error> eval(
        const Script& script,
        const std::vector<std::string>& keys,
        const std::vector<std::string>& args) override;
    std::expected<std::vector<Reply>, Error> exec(const std::vector<Command>& commands) override;
    void close() override;
    [[nodiscard]] bool connected() const;
    [[nodiscard]] const std::string& address() const;
private:
    template<typename Req, typename Rep>
    std::expected<Rep, Error> call(
        grpc::Status (store::StoreService::Stub::* f)(grpc::ClientContext*, const Req&, Rep*),
        const Req& request) {
        if (!stub) {
            return std::unexpected {Error{ErrorCode::ConnectionError, "not connected to " + target}};
        }
        Rep reply;
        grpc::ClientContext c;
        c.set_deadline(std::chrono::system_clock::now() + options.rpcTimeout);
        auto status = (stub.get()->*f)(&c, request, &reply);
        if (!status.ok()) {
            return std::unexpected {toError(status)};
        }
        return reply;
    }

    const std::string target;
    const DialOptions options;
    std::shared_ptr<grpc::Channel> channel;
    std::unique_ptr<store::StoreService::Stub> stub;
};

// Default DialFunc: opens and readies a gRPC connection to the store.
std::expected<std::unique_ptr<StoreConnection>, Error> dialStore(
    const std::string& network,
    const std::string& address,
    const DialOptions& options);

} // namespace glock

#endif // RPC_CONNECTION_H
