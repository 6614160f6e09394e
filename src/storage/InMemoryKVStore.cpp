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
#include "storage/InMemoryKVStore.hpp"
#include <algorithm>
#include <expected>
#include <string>
#include <shared_mutex>
#include <mutex>
#include <cstddef>
#include <variant>
#include "common/Error.hpp"
#include "common/Types.hpp"

namespace glock {

class InMemoryKVStore::LockedKeyspace : public Keyspace {
public:
    LockedKeyspace(InMemoryKVStore& s, clock::time_point t) : kv {s}, now {t} {}
    std::optional<std::string> get(const Key& key) override {
        const auto* e = kv.find(key, now);
        if (e == nullptr) {
            return std::nullopt;
        }
        return e->data;
    }
    bool set(const Key& key, const std::string& value, const SetOptions& options) override {
        return kv.put(key, value, options, now);
    }
    bool erase(const Key& key) override {
        return kv.remove(key, now);
    }
    std::chrono::milliseconds pttl(const Key& key) override {
        return kv.remaining(key, now);
    }
private:
    InMemoryKVStore& kv;
    const clock::time_point now;
};

InMemoryKVStore::InMemoryKVStore() : store{}, m{} {}

const InMemoryKVStore::Entry* InMemoryKVStore::find(const Key& key, clock::time_point now) const {
    auto i = store.find(key);
    if (i == store.end() || !i->second.live(now)) {
        return nullptr;
    }
    return &i->second;
}

bool InMemoryKVStore::put(const Key& key, const std::string& value, const SetOptions& options, clock::time_point now) {
    if (options.onlyIfAbsent && find(key, now) != nullptr) {
        return false;
    }
    Entry e {value, std::nullopt};
    if (options.ttl.has_value()) {
        e.expiresAt = now + options.ttl.value();
    }
    store.insert_or_assign(key, std::move(e));
    return true;
}

bool InMemoryKVStore::remove(const Key& key, clock::time_point now) {
    auto i = store.find(key);
    if (i == store.end()) {
        return false;
    }
    const bool wasLive = i->second.live(now);
    store.erase(i);
    return wasLive;
}

std::chrono::milliseconds InMemoryKVStore::remaining(const Key& key, clock::time_point now) const {
    const auto* e = find(key, now);
    if (e == nullptr) {
        return KeyMissing;
    }
    if (!e->expiresAt.has_value()) {
        return NoExpiry;
    }
    // Round up so a live key never reports 0.
    auto left = std::chrono::ceil<std::chrono::milliseconds>(e->expiresAt.value() - now);
    return std::max(left, std::chrono::milliseconds{1});
}

std::expected<std::optional<std::string>, Error> InMemoryKVStore::get(const Key& key) const {
    const std::shared_lock lock {m};
    const auto* e = find(key, clock::now());
    if (e == nullptr) {
        return std::nullopt;
    }
    return e->data;
}

std::expected<void, Error> InMemoryKVStore::set(const Key& key, const std::string& value, const SetOptions& options) {
    if (options.ttl.has_value() && options.ttl.value() <= std::chrono::milliseconds::zero()) {
        return std::unexpected {Error{ErrorCode::InvalidArg, "ttl must be positive", key.data}};
    }
    if (options.ttl.has_value() && options.ttl.value() > maxTTL) {
        return std::unexpected {Error{ErrorCode::InvalidArg, "ttl exceeds " + std::to_string(maxTTL.count()) + "ms", key.data}};
    }
    const std::unique_lock lock {m};
    if (!put(key, value, options, clock::now())) {
        return std::unexpected {Error{ErrorCode::KeyExists, "key already exists", key.data}};
    }
    return {};
}

std::expected<bool, Error> InMemoryKVStore::erase(const Key& key) {
    const std::unique_lock lock {m};
    return remove(key, clock::now());
}

std::expected<std::chrono::milliseconds, Error> InMemoryKVStore::pttl(const Key& key) const {
    const std::shared_lock lock {m};
    return remaining(key, clock::now());
}

std::expected<int64_t, Error> InMemoryKVStore::eval(
    const Script& script,
    const std::vector<std::string>& keys,
    const std::vector<std::string>& args) {
    const std::unique_lock lock {m};
    LockedKeyspace ks {*this, clock::now()};
    return script.run(ks, keys, args);
}

std::expected<std::vector<Reply>, Error> InMemoryKVStore::exec(const std::vector<Command>& commands) const {
    const std::shared_lock lock {m};
    const auto now = clock::now();
    std::vector<Reply> replies;
    replies.reserve(commands.size());
    for (const auto& c : commands) {
        switch (c.op) {
            case Command::Op::Get:
            {
                const auto* e = find(c.key, now);
                replies.emplace_back(e == nullptr ? std::optional<std::string>{} : std::optional<std::string>{e->data});
                break;
            }
            case Command::Op::Pttl:
                replies.emplace_back(remaining(c.key, now));
                break;
        }
    }
    return replies;
}

size_t InMemoryKVStore::size() const {
    const std::shared_lock lock {m};
    const auto now = clock::now();
    return static_cast<size_t>(std::count_if(store.begin(), store.end(), [now](const auto& p) {
        return p.second.live(now);
    }));
}

size_t InMemoryKVStore::purgeExpired() {
    const std::unique_lock lock {m};
    return std::erase_if(store, [now = clock::now()](const auto& p) {
        return !p.second.live(now);
    });
}

} // namespace glock
