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

#ifndef RELATA_CORE_COLUMN_REF_HPP
#define RELATA_CORE_COLUMN_REF_HPP

#include <string>
#include <string_view>

namespace relata::core {

/**
 * @brief A fully qualified column reference, rendered as "table.column".
 */
struct ColumnRef {
    std::string table;   ///< Table the column lives on.
    std::string column;  ///< Column name within the table.

    /**
     * @brief Parses a "table.column" reference.
     *
     * The column is everything after the last dot, so schema-qualified
     * tables ("main.Person.id") keep their qualifier in the table part.
     *
     * @param qualified The qualified reference.
     * @return The parsed reference.
     * @throws InvalidJoinSpecError if either part is missing or empty
     */
    [[nodiscard]] static ColumnRef parse(std::string_view qualified);

    /**
     * @brief Renders the reference as "table.column".
     */
    [[nodiscard]] std::string toString() const;

    [[nodiscard]] bool empty() const noexcept {
        return table.empty() || column.empty();
    }

    bool operator==(const ColumnRef& other) const = default;
};

}  // namespace relata::core

#endif  // RELATA_CORE_COLUMN_REF_HPP
