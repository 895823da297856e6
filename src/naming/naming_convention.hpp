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

#ifndef RELATA_NAMING_NAMING_CONVENTION_HPP
#define RELATA_NAMING_NAMING_CONVENTION_HPP

#include <string>
#include <string_view>

namespace relata::naming {

/// Separator placed between owner and target names in derived join tables.
inline constexpr std::string_view JOIN_TABLE_SEPARATOR = "_";

/**
 * @brief Rejects empty names and names without a single alphanumeric
 * character.
 *
 * @param name The record-kind or column name to check.
 * @param what Human-readable description used in the error message.
 * @throws InvalidNameError if the name is malformed
 */
void validateName(std::string_view name, std::string_view what);

/**
 * @brief Default table name of a record-kind: the record-kind name itself.
 * @throws InvalidNameError if the name is malformed
 */
[[nodiscard]] std::string tableNameOf(std::string_view recordKindName);

/**
 * @brief Foreign-key column that points at an owner's primary key.
 *
 * lowerCamel(ownerName) followed by upperFirst(idColumnName):
 * ("Person", "id") -> "personId".
 *
 * @throws InvalidNameError if either name is malformed
 */
[[nodiscard]] std::string foreignKeyColumnOf(std::string_view ownerName,
                                             std::string_view idColumnName);

/**
 * @brief Default name of a to-one relation ("PetOwner" -> "petOwner").
 * @throws InvalidNameError if the name is malformed
 */
[[nodiscard]] std::string relationNameSingular(std::string_view targetName);

/**
 * @brief Default name of a to-many relation ("Pet" -> "pets").
 * @throws InvalidNameError if the name is malformed
 */
[[nodiscard]] std::string relationNamePlural(std::string_view targetName);

/**
 * @brief Default join table of a many-to-many relation, owner first
 * ("Person", "Pet") -> "Person_Pet".
 * @throws InvalidNameError if either name is malformed
 */
[[nodiscard]] std::string joinTableNameOf(std::string_view ownerName,
                                          std::string_view targetName);

}  // namespace relata::naming

#endif  // RELATA_NAMING_NAMING_CONVENTION_HPP
