// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Relata - Relation mapping and lifecycle hooks for record stores
 * Copyright (C) 2024 Max Qian
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#ifndef RELATA_HOOKS_OPERATION_CONTEXT_HPP
#define RELATA_HOOKS_OPERATION_CONTEXT_HPP

#include <nlohmann/json.hpp>

namespace relata::hooks {

using json = nlohmann::json;

/**
 * @brief Per-write context handed from the persistence engine to every
 * write hook.
 */
struct OperationContext {
    bool skipTouch = false;            ///< Leave audit timestamps untouched.
    json properties = json::object();  ///< Free-form values for custom hooks.

    [[nodiscard]] static OperationContext withoutTouch() {
        OperationContext context;
        context.skipTouch = true;
        return context;
    }
};

}  // namespace relata::hooks

#endif  // RELATA_HOOKS_OPERATION_CONTEXT_HPP
