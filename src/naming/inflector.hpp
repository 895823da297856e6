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

#ifndef RELATA_NAMING_INFLECTOR_HPP
#define RELATA_NAMING_INFLECTOR_HPP

#include <string>
#include <string_view>
#include <vector>

namespace relata::naming::inflector {

/**
 * @brief Splits an identifier into words.
 *
 * Words are separated by any non-alphanumeric character and by case
 * boundaries: "PetOwner" -> {"Pet", "Owner"}, "HTTPRequest" ->
 * {"HTTP", "Request"}, "pet_owner" -> {"pet", "owner"}. Digits stay
 * attached to the word they follow.
 */
[[nodiscard]] std::vector<std::string> splitWords(std::string_view text);

/**
 * @brief Converts an identifier to lowerCamelCase ("PetOwner" -> "petOwner").
 */
[[nodiscard]] std::string camelCase(std::string_view text);

/**
 * @brief Upper-cases the first character only ("id" -> "Id").
 */
[[nodiscard]] std::string upperFirst(std::string_view text);

/**
 * @brief Lower-cases the first character only ("Id" -> "id").
 */
[[nodiscard]] std::string lowerFirst(std::string_view text);

/**
 * @brief Best-effort English pluralization.
 *
 * Applies the regular suffix rules only: consonant + "y" becomes "ies",
 * words ending in s, x, z, ch or sh take "es", everything else takes "s".
 * Irregular nouns are not special-cased ("person" -> "persons").
 */
[[nodiscard]] std::string plural(std::string_view word);

}  // namespace relata::naming::inflector

#endif  // RELATA_NAMING_INFLECTOR_HPP
