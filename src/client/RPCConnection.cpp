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
#include "client/RPCConnection.hpp"

#include <chrono>
#include <spdlog/spdlog.h>
#include <string>
#include <variant>
#include "common/Error.hpp"
#include <grpcpp/grpcpp.h>
#include "proto/store.grpc.pb.h"
#include <grpcpp/security/credentials.h>

namespace glock {

RPCConnection::RPCConnection(const std::string& t, const DialOptions& o)
    : target {t},
      options {o} {}

std::expected<void, Error> RPCConnection::connect() {
    channel = grpc::CreateChannel(target, grpc::InsecureChannelCredentials());
    if (!channel->WaitForConnected(std::chrono::system_clock::now() + options.connectTimeout)) {
        spdlog::warn("Could not connect to store @ {}", target);
        channel.reset();
        return std::unexpected {Error{ErrorCode::ConnectionError, "Could not connect to store @" + target}};
    }
    stub = store::StoreService::NewStub(channel);
    spdlog::info("Connected to store @ {}", target);
    return {};
}

void RPCConnection::close() {
    if (stub) {
        spdlog::debug("Closing connection to store @ {}", target);
    }
    stub.reset();
    channel.reset();
}

bool RPCConnection::connected() const {
    return channel && stub && channel->GetState(false) == grpc_connectivity_state::GRPC_CHANNEL_READY;
}

const std::string& RPCConnection::address() const {
    return target;
}

std::expected<void, Error> RPCConnection::ping() {
    store::PingRequest request;
    return call(&store::StoreService::Stub::ping, request)
        .and_then([this](const store::PingReply& reply) -> std::expected<void, Error> {
            if (reply.message() != "PONG") {
                return std::unexpected {Error{ErrorCode::ConnectionError, "unexpected ping reply from " + target}};
            }
            return {};
        });
}

std::expected<std::optional<std::string>, Error> RPCConnection::get(const std::string& key) {
    store::GetRequest request;
    request.set_key(key);
    auto t = call(&store::StoreService::Stub::get, request);
    if (!t.has_value()) {
        if (t.error().code == ErrorCode::KeyNotFound) {
            return std::nullopt;
        }
        return std::unexpected {t.error()};
    }
    return t.value().value();
}

std::expected<void, Error> RPCConnection::set(const std::string& key, const std::string& value, const SetOptions& o) {
    store::SetRequest request;
    request.set_key(key);
    request.set_value(value);
    if (o.ttl.has_value()) {
        request.set_ttl(o.ttl->count());
    }
    request.set_onlyifabsent(o.onlyIfAbsent);
    auto t = call(&store::StoreService::Stub::set, request);
    if (!t.has_value()) {
        return std::unexpected {t.error()};
    }
    return {};
}

std::expected<bool, Error> RPCConnection::erase(const std::string& key) {
    store::EraseRequest request;
    request.set_key(key);
    return call(&store::StoreService::Stub::erase, request)
        .transform([](const store::EraseReply& reply) { return reply.erased(); });
}

std::expected<std::chrono::milliseconds, Error> RPCConnection::pttl(const std::string& key) {
    store::PttlRequest request;
    request.set_key(key);
    return call(&store::StoreService::Stub::pttl, request)
        .transform([](const store::PttlReply& reply) { return std::chrono::milliseconds{reply.ttl()}; });
}

std::expected<int64_t, Error> RPCConnection::eval(
    const Script& script,
    const std::vector<std::string>& keys,
    const std::vector<std::string>& args) {
    store::EvalRequest request;
    request.set_script(script.name);
    for (const auto& k : keys) {
        request.add_keys(k);
    }
    for (const auto& a : args) {
        request.add_args(a);
    }
    return call(&store::StoreService::Stub::eval, request)
        .transform([](const store::EvalReply& reply) { return static_cast<int64_t>(reply.result()); });
}

std::expected<std::vector<Reply>, Error> RPCConnection::exec(const std::vector<Command>& commands) {
    store::ExecRequest request;
    for (const auto& c : commands) {
        auto* cmd = request.add_commands();
        switch (c.op) {
            case Command::Op::Get:
                cmd->mutable_get()->set_key(c.key.data);
                break;
            case Command::Op::Pttl:
                cmd->mutable_pttl()->set_key(c.key.data);
                break;
        }
    }
    auto t = call(&store::StoreService::Stub::exec, request);
    if (!t.has_value()) {
        return std::unexpected {t.error()};
    }
    if (t->replies_size() != static_cast<int>(commands.size())) {
        return std::unexpected {Error{ErrorCode::Internal, "exec: reply count does not match command count"}};
    }
    std::vector<Reply> replies;
    replies.reserve(commands.size());
    for (const auto& r : t->replies()) {
        switch (r.reply_case()) {
            case store::CommandReply::kGet:
                if (r.get().found()) {
                    replies.emplace_back(std::optional<std::string>{r.get().value()});
                } else {
                    replies.emplace_back(std::optional<std::string>{});
                }
                break;
            case store::CommandReply::kPttl:
                replies.emplace_back(std::chrono::milliseconds{r.pttl().ttl()});
                break;
            default:
                return std::unexpected {Error{ErrorCode::Internal, "exec: empty reply"}};
        }
    }
    return replies;
}

std::expected<std::unique_ptr<StoreConnection>, Error> dialStore(
    const std::string& network,
    const std::string& address,
    const DialOptions& options) {
    if (auto valid = validate(options); !valid.has_value()) {
        return std::unexpected {valid.error()};
    }
    std::string target;
    if (network == "tcp") {
        target = address;
    } else if (network == "unix") {
        target = "unix:" + address;
    } else {
        return std::unexpected {Error{ErrorCode::InvalidArg, "unsupported network: " + network}};
    }
    if (address.empty()) {
        return std::unexpected {Error{ErrorCode::InvalidArg, "empty store address"}};
    }
    auto conn = std::make_unique<RPCConnection>(target, options);
    spdlog::debug("Dialing store @ {} over {}", conn->address(), network);
    if (auto c = conn->connect(); !c.has_value()) {
        return std::unexpected {c.error()};
    }
    return conn;
}

} // namespace glock
