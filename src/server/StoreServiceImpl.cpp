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
#include "server/StoreServiceImpl.hpp"
#include "common/ErrorConverter.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"
#include <grpcpp/support/status.h>
#include <spdlog/spdlog.h>
#include "proto/store.pb.h"
#include <chrono>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

namespace glock {

StoreServiceImpl::StoreServiceImpl(StorageEngine& s, const ScriptRegistry& r)
    : storage {s}, scripts {r} {}

grpc::Status StoreServiceImpl::ping(
    grpc::ServerContext* context,
    const store::PingRequest* request,
    store::PingReply* reply) {
    std::ignore = context;
    std::ignore = request;
    reply->set_message("PONG");
    return grpc::Status::OK;
}

grpc::Status StoreServiceImpl::get(
    grpc::ServerContext* context,
    const store::GetRequest* request,
    store::GetReply* reply) {
    std::ignore = context;
    auto v = storage.get(Key{request->key()});
    if (!v.has_value()) {
        return toGrpcStatus(v.error());
    }
    if (!v->has_value()) {
        return toGrpcStatus(Error{ErrorCode::KeyNotFound, "key not found", request->key()});
    }
    reply->set_value(v->value());
    reply->set_found(true);
    return grpc::Status::OK;
}

grpc::Status StoreServiceImpl::set(
    grpc::ServerContext* context,
    const store::SetRequest* request,
    store::SetReply* reply) {
    std::ignore = context;
    std::ignore = reply;
    if (request->ttl() < 0) {
        return toGrpcStatus(Error{ErrorCode::InvalidArg, "ttl must not be negative", request->key()});
    }
    if (request->ttl() > maxTTL.count()) {
        return toGrpcStatus(Error{ErrorCode::InvalidArg, "ttl exceeds " + std::to_string(maxTTL.count()) + "ms", request->key()});
    }
    SetOptions options;
    options.onlyIfAbsent = request->onlyifabsent();
    if (request->ttl() > 0) {
        options.ttl = std::chrono::milliseconds{request->ttl()};
    }
    spdlog::debug("set {} ttl={}ms nx={}", request->key(), request->ttl(), options.onlyIfAbsent);
    return toGrpcStatus(storage.set(Key{request->key()}, request->value(), options));
}

grpc::Status StoreServiceImpl::erase(
    grpc::ServerContext* context,
    const store::EraseRequest* request,
    store::EraseReply* reply) {
    std::ignore = context;
    auto erased = storage.erase(Key{request->key()});
    if (!erased.has_value()) {
        return toGrpcStatus(erased.error());
    }
    reply->set_erased(erased.value());
    return grpc::Status::OK;
}

grpc::Status StoreServiceImpl::pttl(
    grpc::ServerContext* context,
    const store::PttlRequest* request,
    store::PttlReply* reply) {
    std::ignore = context;
    auto ttl = storage.pttl(Key{request->key()});
    if (!ttl.has_value()) {
        return toGrpcStatus(ttl.error());
    }
    reply->set_ttl(ttl->count());
    return grpc::Status::OK;
}

grpc::Status StoreServiceImpl::eval(
    grpc::ServerContext* context,
    const store::EvalRequest* request,
    store::EvalReply* reply) {
    std::ignore = context;
    auto script = scripts.find(request->script());
    if (!script.has_value()) {
        spdlog::warn("eval of unknown script {}", request->script());
        return toGrpcStatus(script.error());
    }
    const std::vector<std::string> keys {request->keys().begin(), request->keys().end()};
    const std::vector<std::string> args {request->args().begin(), request->args().end()};
    auto result = storage.eval(*script.value(), keys, args);
    if (!result.has_value()) {
        return toGrpcStatus(result.error());
    }
    spdlog::debug("eval {} -> {}", request->script(), result.value());
    reply->set_result(result.value());
    return grpc::Status::OK;
}

grpc::Status StoreServiceImpl::exec(
    grpc::ServerContext* context,
    const store::ExecRequest* request,
    store::ExecReply* reply) {
    std::ignore = context;
    std::vector<Command> commands;
    commands.reserve(static_cast<size_t>(request->commands_size()));
    for (const auto& c : request->commands()) {
        switch (c.op_case()) {
            case store::Command::kGet:
                commands.push_back(Command::get(Key{c.get().key()}));
                break;
            case store::Command::kPttl:
                commands.push_back(Command::pttl(Key{c.pttl().key()}));
                break;
            default:
                return toGrpcStatus(Error{ErrorCode::InvalidArg, "exec: empty command"});
        }
    }
    auto replies = storage.exec(commands);
    if (!replies.has_value()) {
        return toGrpcStatus(replies.error());
    }
    for (const auto& r : replies.value()) {
        auto* out = reply->add_replies();
        if (const auto* v = std::get_if<std::optional<std::string>>(&r)) {
            out->mutable_get()->set_found(v->has_value());
            out->mutable_get()->set_value(v->value_or(""));
        } else {
            out->mutable_pttl()->set_ttl(std::get<std::chrono::milliseconds>(r).count());
        }
    }
    return grpc::Status::OK;
}

} // namespace glock
