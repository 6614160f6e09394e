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
#ifndef SCRIPT_REGISTRY_HPP
#define SCRIPT_REGISTRY_HPP

#include "common/Error.hpp"
#include "common/Script.hpp"
#include <expected>
#include <initializer_list>
#include <string>
#include <unordered_map>

namespace glock {

// Scripts a store accepts by name. Holds non-owning pointers to immutable
// script constants.
class ScriptRegistry {
public:
    ScriptRegistry(std::initializer_list<const Script*> scripts);
    std::expected<const Script*, Error> find(const std::string& name) const;
    [[nodiscard]] size_t size() const { return scripts.size(); }
private:
    std::unordered_map<std::string, const Script*> scripts;
};

// releaseScript and refreshScript
ScriptRegistry standardScripts();

} // namespace glock

#endif // SCRIPT_REGISTRY_HPP
