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

#ifndef RELATA_ENGINE_JOIN_PLANNER_HPP
#define RELATA_ENGINE_JOIN_PLANNER_HPP

#include "core/column_ref.hpp"
#include "model/record.hpp"
#include "query/query_builder.hpp"
#include "relation/relation_mapping.hpp"

namespace relata::engine {

/**
 * @brief Translates a relation mapping into the SELECT that loads the
 * related records of one owner.
 *
 * The owner side of the join is the column living on the owner's table.
 * Each relation kind has a preferred side (to for ReferenceToOne and
 * OwnsMany, from for OwnsOne and OwnsManyThroughJoin); when that side
 * names another table the opposite side is used instead.
 */
class JoinPlanner {
public:
    /**
     * @brief Picks the join column that belongs to the owner.
     * @throws InvalidJoinSpecError if neither side is on the owner's table
     */
    [[nodiscard]] static core::ColumnRef ownerColumn(
        const relation::RelationMapping& mapping,
        const model::RecordKind& owner);

    /**
     * @brief Picks the join column compared against the owner's value.
     */
    [[nodiscard]] static core::ColumnRef targetColumn(
        const relation::RelationMapping& mapping,
        const model::RecordKind& owner);

    /**
     * @brief Builds the query; the owner's join value is its only parameter
     * before any filter runs.
     *
     * @throws InvalidJoinSpecError if the join does not touch the owner
     */
    [[nodiscard]] static query::QueryBuilder plan(
        const model::Record& owner, const relation::RelationMapping& mapping);
};

}  // namespace relata::engine

#endif  // RELATA_ENGINE_JOIN_PLANNER_HPP
