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

#include "join_planner.hpp"

#include "core/types.hpp"

namespace relata::engine {

using relation::RelationKind;

namespace {

bool prefersToSide(RelationKind kind) {
    return kind == RelationKind::ReferenceToOne ||
           kind == RelationKind::OwnsMany;
}

bool ownerOnToSide(const relation::RelationMapping& mapping,
                   const model::RecordKind& owner) {
    const auto table = owner.tableName();
    const bool toMatches = mapping.join.to.table == table;
    const bool fromMatches = mapping.join.from.table == table;

    if (!toMatches && !fromMatches) {
        THROW_INVALID_JOIN_SPEC_ERROR(
            "Relation " + mapping.name + " joins " +
            mapping.join.from.toString() + " = " + mapping.join.to.toString() +
            ", neither of which is on table " + table);
    }
    if (toMatches && fromMatches) {
        return prefersToSide(mapping.kind);
    }
    return toMatches;
}

}  // namespace

core::ColumnRef JoinPlanner::ownerColumn(
    const relation::RelationMapping& mapping, const model::RecordKind& owner) {
    return ownerOnToSide(mapping, owner) ? mapping.join.to : mapping.join.from;
}

core::ColumnRef JoinPlanner::targetColumn(
    const relation::RelationMapping& mapping, const model::RecordKind& owner) {
    return ownerOnToSide(mapping, owner) ? mapping.join.from : mapping.join.to;
}

query::QueryBuilder JoinPlanner::plan(const model::Record& owner,
                                      const relation::RelationMapping& mapping) {
    if (mapping.target == nullptr) {
        THROW_INVALID_JOIN_SPEC_ERROR("Relation " + mapping.name +
                                      " has no target");
    }

    const auto ownerSide = ownerColumn(mapping, owner.kind());
    const auto value = owner.get(ownerSide.column);
    const auto targetTable = mapping.target->tableName();

    query::QueryBuilder builder(targetTable);
    builder.select({targetTable + ".*"});

    std::string ownerCondition;
    if (mapping.join.through) {
        const auto& through = *mapping.join.through;
        const auto targetSide = targetColumn(mapping, owner.kind());

        builder.join(through.joinTableName,
                     through.to.toString() + " = " + targetSide.toString());
        for (const auto& column : through.extraColumns) {
            builder.addSelect(through.joinTableName + "." + column);
        }
        ownerCondition = through.from.toString() + " = ?";
        if (through.filter) {
            through.filter(builder);
        }
    } else {
        ownerCondition = targetColumn(mapping, owner.kind()).toString() + " = ?";
    }

    if (mapping.filter) {
        mapping.filter(builder);
    }
    // Filter conditions are grouped behind the owner condition.
    builder.scopeBy(ownerCondition, {value});

    if (!mapping.isToMany()) {
        builder.limit(1);
    }
    return builder;
}

}  // namespace relata::engine
