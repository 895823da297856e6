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

#include "column_ref.hpp"

#include "types.hpp"

namespace relata::core {

ColumnRef ColumnRef::parse(std::string_view qualified) {
    const auto dot = qualified.rfind('.');
    if (dot == std::string_view::npos) {
        THROW_INVALID_JOIN_SPEC_ERROR("Column reference '" +
                                      std::string(qualified) +
                                      "' is not of the form table.column");
    }

    ColumnRef ref{std::string(qualified.substr(0, dot)),
                  std::string(qualified.substr(dot + 1))};
    if (ref.empty()) {
        THROW_INVALID_JOIN_SPEC_ERROR("Column reference '" +
                                      std::string(qualified) +
                                      "' has an empty table or column");
    }
    return ref;
}

std::string ColumnRef::toString() const { return table + "." + column; }

}  // namespace relata::core
