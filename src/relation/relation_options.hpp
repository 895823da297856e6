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

#ifndef RELATA_RELATION_RELATION_OPTIONS_HPP
#define RELATA_RELATION_RELATION_OPTIONS_HPP

#include <optional>
#include <string>
#include <vector>

#include "relation_mapping.hpp"
#include "resolver/record_kind_resolver.hpp"

namespace relata::relation {

/**
 * @brief Caller overrides of a relation declaration. Unset fields take the
 * naming convention default.
 */
struct RelationOptions {
    std::optional<std::string> name;      ///< Relation name.
    std::optional<std::string> joinFrom;  ///< "table.column"
    std::optional<std::string> joinTo;    ///< "table.column"
    RelationFilter filter;
};

/**
 * @brief Overrides of the join table of a many-to-many relation.
 */
struct ThroughOptions {
    std::optional<resolver::TargetRef> model;  ///< Join table record-kind.
    std::optional<std::string> table;          ///< Join table name.
    std::optional<std::string> from;           ///< "table.column"
    std::optional<std::string> to;             ///< "table.column"
    std::vector<std::string> extra;            ///< Extra join table columns.
    RelationFilter filter;
};

struct ThroughRelationOptions : RelationOptions {
    ThroughOptions through;
};

}  // namespace relata::relation

#endif  // RELATA_RELATION_RELATION_OPTIONS_HPP
