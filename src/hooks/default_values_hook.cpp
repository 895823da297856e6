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

#include "default_values_hook.hpp"

namespace relata::hooks {

void DefaultValuesHook::beforeInsert(model::Record& record,
                                     const OperationContext& /*context*/) {
    for (const auto& [column, value] : record.kind().defaults().items()) {
        if (!record.has(column)) {
            record.set(column, value);
        }
    }
}

}  // namespace relata::hooks
