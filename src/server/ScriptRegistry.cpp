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
#include "server/ScriptRegistry.hpp"
#include <stdexcept>

namespace glock {

ScriptRegistry::ScriptRegistry(std::initializer_list<const Script*> s) {
    for (const auto* script : s) {
        if (script == nullptr || !script->body) {
            throw std::invalid_argument("ScriptRegistry: script without a body");
        }
        if (!scripts.emplace(script->name, script).second) {
            throw std::invalid_argument("ScriptRegistry: duplicate script " + script->name);
        }
    }
}

std::expected<const Script*, Error> ScriptRegistry::find(const std::string& name) const {
    auto i = scripts.find(name);
    if (i == scripts.end()) {
        return std::unexpected {Error{ErrorCode::NoScript, "no such script: " + name}};
    }
    return i->second;
}

ScriptRegistry standardScripts() {
    return ScriptRegistry{&releaseScript, &refreshScript};
}

} // namespace glock
