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
#ifndef SRC_SERVER_STORESERVICEIMPL_HPP
#define SRC_SERVER_STORESERVICEIMPL_HPP

#include <grpcpp/grpcpp.h>
#include "proto/store.grpc.pb.h"
#include "server/RPCServer.hpp"
#include "server/ScriptRegistry.hpp"
#include "storage/StorageEngine.hpp"

namespace glock {

class StoreServiceImpl final : public store::StoreService::Service {
public:
    StoreServiceImpl(StorageEngine& s, const ScriptRegistry& r);
    grpc::Status ping(
        grpc::ServerContext* context,
        const store::PingRequest* request,
        store::PingReply* reply) override;
    grpc::Status get(
        grpc::ServerContext* context,
        const store::GetRequest* request,
        store::GetReply* reply) override;
    grpc::Status set(
        grpc::ServerContext* context,
        const store::SetRequest* request,
        store::SetReply* reply) override;
    grpc::Status erase(
        grpc::ServerContext* context,
        const store::EraseRequest* request,
        store::EraseReply* reply) override;
    grpc::Status pttl(
        grpc::ServerContext* context,
        const store::PttlRequest* request,
        store::PttlReply* reply) override;
    grpc::Status eval(
        grpc::ServerContext* context,
        const store::EvalRequest* request,
        store::EvalReply* reply) override;
    grpc::Status exec(
        grpc::ServerContext* context,
        const store::ExecRequest* request,
        store::ExecReply* reply) override;
private:
    StorageEngine& storage;
    const ScriptRegistry& scripts;
};

using StoreServer = RPCServer<StoreServiceImpl>;

} // namespace glock

#endif // SRC_SERVER_STORESERVICEIMPL_HPP
