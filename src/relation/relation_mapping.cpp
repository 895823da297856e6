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

#include "relation_mapping.hpp"

#include "model/record_kind.hpp"

namespace relata::relation {

std::string_view relationKindToString(RelationKind kind) noexcept {
    switch (kind) {
        case RelationKind::ReferenceToOne:
            return "ReferenceToOne";
        case RelationKind::OwnsOne:
            return "OwnsOne";
        case RelationKind::OwnsMany:
            return "OwnsMany";
        case RelationKind::OwnsManyThroughJoin:
            return "OwnsManyThroughJoin";
    }
    return "Unknown";
}

json RelationMapping::toJson() const {
    json result{{"kind", relationKindToString(kind)},
                {"name", name},
                {"target", target ? json(target->name()) : json(nullptr)},
                {"filter", static_cast<bool>(filter)},
                {"join", {{"from", join.from.toString()},
                          {"to", join.to.toString()}}}};

    if (join.through) {
        const auto& through = *join.through;
        result["join"]["through"] = {
            {"table", through.joinTableName},
            {"from", through.from.toString()},
            {"to", through.to.toString()},
            {"extra", through.extraColumns},
            {"filter", static_cast<bool>(through.filter)},
            {"model", through.throughTarget
                          ? json(through.throughTarget->name())
                          : json(nullptr)}};
    }
    return result;
}

json toJson(const RelationGraph& graph) {
    json result = json::object();
    for (const auto& [name, mapping] : graph) {
        result[name] = mapping.toJson();
    }
    return result;
}

}  // namespace relata::relation
