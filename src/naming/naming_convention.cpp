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

#include "naming_convention.hpp"

#include <algorithm>
#include <cctype>

#include "core/types.hpp"
#include "inflector.hpp"

namespace relata::naming {

void validateName(std::string_view name, std::string_view what) {
    if (name.empty()) {
        THROW_INVALID_NAME_ERROR(std::string(what) + " cannot be empty");
    }
    const bool hasWordChar =
        std::any_of(name.begin(), name.end(), [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) != 0;
        });
    if (!hasWordChar) {
        THROW_INVALID_NAME_ERROR(std::string(what) + " '" + std::string(name) +
                                 "' has no alphanumeric characters");
    }
}

std::string tableNameOf(std::string_view recordKindName) {
    validateName(recordKindName, "Record-kind name");
    return std::string(recordKindName);
}

std::string foreignKeyColumnOf(std::string_view ownerName,
                               std::string_view idColumnName) {
    validateName(ownerName, "Owner name");
    validateName(idColumnName, "Id column name");
    return inflector::camelCase(ownerName) +
           inflector::upperFirst(idColumnName);
}

std::string relationNameSingular(std::string_view targetName) {
    validateName(targetName, "Target name");
    return inflector::camelCase(targetName);
}

std::string relationNamePlural(std::string_view targetName) {
    return inflector::plural(relationNameSingular(targetName));
}

std::string joinTableNameOf(std::string_view ownerName,
                            std::string_view targetName) {
    validateName(ownerName, "Owner name");
    validateName(targetName, "Target name");
    return std::string(ownerName) + std::string(JOIN_TABLE_SEPARATOR) +
           std::string(targetName);
}

}  // namespace relata::naming
