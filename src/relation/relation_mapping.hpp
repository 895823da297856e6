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

#ifndef RELATA_RELATION_RELATION_MAPPING_HPP
#define RELATA_RELATION_RELATION_MAPPING_HPP

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/column_ref.hpp"

namespace relata::model {
class RecordKind;
}  // namespace relata::model

namespace relata::query {
class QueryBuilder;
}  // namespace relata::query

namespace relata::relation {

using json = nlohmann::json;
using core::ColumnRef;

enum class RelationKind {
    ReferenceToOne,      ///< Owner belongs to target.
    OwnsOne,             ///< Owner has one target.
    OwnsMany,            ///< Owner has many targets.
    OwnsManyThroughJoin  ///< Owner has many targets through a join table.
};

[[nodiscard]] std::string_view relationKindToString(RelationKind kind) noexcept;

/// Narrows the query scope of a relation (or of its join table).
using RelationFilter = std::function<void(query::QueryBuilder&)>;

/**
 * @brief Join table part of a many-to-many relation.
 */
struct ThroughSpec {
    std::string joinTableName;
    ColumnRef from;  ///< Join table column pointing at the owner.
    ColumnRef to;    ///< Join table column pointing at the target.
    std::vector<std::string> extraColumns;  ///< Join table columns to load.
    RelationFilter filter;
    const model::RecordKind* throughTarget = nullptr;  ///< Join table model.
};

struct JoinSpec {
    ColumnRef from;
    ColumnRef to;
    std::optional<ThroughSpec> through;  ///< Set for OwnsManyThroughJoin.
};

/**
 * @brief Resolved metadata describing how two record-kinds join.
 *
 * Mappings are immutable once their owner's relation graph is installed.
 */
struct RelationMapping {
    RelationKind kind = RelationKind::ReferenceToOne;
    std::string name;
    const model::RecordKind* target = nullptr;
    RelationFilter filter;
    JoinSpec join;

    [[nodiscard]] bool isToMany() const noexcept {
        return kind == RelationKind::OwnsMany ||
               kind == RelationKind::OwnsManyThroughJoin;
    }

    /**
     * @brief Diagnostic rendering; filters are reported as present or not.
     */
    [[nodiscard]] json toJson() const;
};

/// Relation mappings of one record-kind, keyed by relation name.
using RelationGraph = std::map<std::string, RelationMapping, std::less<>>;

[[nodiscard]] json toJson(const RelationGraph& graph);

}  // namespace relata::relation

#endif  // RELATA_RELATION_RELATION_MAPPING_HPP
