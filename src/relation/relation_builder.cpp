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

#include "relation_builder.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "core/types.hpp"
#include "model/record_kind.hpp"
#include "naming/naming_convention.hpp"

namespace relata::relation {

RelationBuilder::RelationBuilder(const model::RecordKind& owner,
                                 const resolver::RecordKindResolver& resolver)
    : owner_(owner), resolver_(resolver) {}

RelationBuilder& RelationBuilder::belongsTo(const resolver::TargetRef& target,
                                            const RelationOptions& options) {
    const auto& targetKind = resolver_.resolve(target);

    // Pet.belongsTo(Person): Person.petId = Pet.id, reachable as pet.person
    RelationMapping mapping;
    mapping.kind = RelationKind::ReferenceToOne;
    mapping.target = &targetKind;
    mapping.filter = options.filter;
    mapping.name = relationName(
        options.name, naming::relationNameSingular(targetKind.name()));
    mapping.join.from = columnRef(
        options.joinFrom, "joinFrom",
        {targetKind.tableName(),
         naming::foreignKeyColumnOf(owner_.name(), owner_.idColumn())});
    mapping.join.to = columnRef(options.joinTo, "joinTo",
                                {owner_.tableName(), owner_.idColumn()});

    store(std::move(mapping));
    return *this;
}

RelationBuilder& RelationBuilder::hasOne(const resolver::TargetRef& target,
                                         const RelationOptions& options) {
    const auto& targetKind = resolver_.resolve(target);

    // Person.hasOne(Pet): Person.petId = Pet.id, reachable as person.pet
    RelationMapping mapping;
    mapping.kind = RelationKind::OwnsOne;
    mapping.target = &targetKind;
    mapping.filter = options.filter;
    mapping.name = relationName(
        options.name, naming::relationNameSingular(targetKind.name()));
    mapping.join.from = columnRef(
        options.joinFrom, "joinFrom",
        {owner_.tableName(), naming::foreignKeyColumnOf(
                                 targetKind.name(), targetKind.idColumn())});
    mapping.join.to =
        columnRef(options.joinTo, "joinTo",
                  {targetKind.tableName(), targetKind.idColumn()});

    store(std::move(mapping));
    return *this;
}

RelationBuilder& RelationBuilder::hasMany(const resolver::TargetRef& target,
                                          const RelationOptions& options) {
    const auto& targetKind = resolver_.resolve(target);

    // Person.hasMany(Pet): Pet.personId = Person.id, reachable as person.pets
    RelationMapping mapping;
    mapping.kind = RelationKind::OwnsMany;
    mapping.target = &targetKind;
    mapping.filter = options.filter;
    mapping.name = relationName(
        options.name, naming::relationNamePlural(targetKind.name()));
    mapping.join.from = columnRef(
        options.joinFrom, "joinFrom",
        {targetKind.tableName(),
         naming::foreignKeyColumnOf(owner_.name(), owner_.idColumn())});
    mapping.join.to = columnRef(options.joinTo, "joinTo",
                                {owner_.tableName(), owner_.idColumn()});

    store(std::move(mapping));
    return *this;
}

RelationBuilder& RelationBuilder::hasManyThrough(
    const resolver::TargetRef& target, const ThroughRelationOptions& options) {
    const auto& targetKind = resolver_.resolve(target);
    const auto& through = options.through;

    // Person.hasManyThrough(Pet): Person_Pet.personId = Person.id and
    // Person_Pet.petId = Pet.id, reachable as person.pets
    RelationMapping mapping;
    mapping.kind = RelationKind::OwnsManyThroughJoin;
    mapping.target = &targetKind;
    mapping.filter = options.filter;
    mapping.name = relationName(
        options.name, naming::relationNamePlural(targetKind.name()));
    mapping.join.from = columnRef(options.joinFrom, "joinFrom",
                                  {owner_.tableName(), owner_.idColumn()});
    mapping.join.to =
        columnRef(options.joinTo, "joinTo",
                  {targetKind.tableName(), targetKind.idColumn()});

    ThroughSpec joinSpec;
    if (through.model) {
        joinSpec.throughTarget = &resolver_.resolve(*through.model);
    }
    if (through.table) {
        if (through.table->empty()) {
            THROW_INVALID_JOIN_SPEC_ERROR("Join table override of relation " +
                                          mapping.name + " on " +
                                          owner_.name() + " is empty");
        }
        joinSpec.joinTableName = *through.table;
    } else if (joinSpec.throughTarget != nullptr) {
        joinSpec.joinTableName = joinSpec.throughTarget->tableName();
    } else {
        joinSpec.joinTableName =
            naming::joinTableNameOf(owner_.name(), targetKind.name());
    }

    joinSpec.from = columnRef(
        through.from, "through.from",
        {joinSpec.joinTableName,
         naming::foreignKeyColumnOf(owner_.name(), owner_.idColumn())});
    joinSpec.to = columnRef(
        through.to, "through.to",
        {joinSpec.joinTableName, naming::foreignKeyColumnOf(
                                 targetKind.name(), targetKind.idColumn())});

    for (const auto& column : through.extra) {
        if (column.empty()) {
            THROW_INVALID_JOIN_SPEC_ERROR("Relation " + mapping.name + " on " +
                                          owner_.name() +
                                          " lists an empty extra column");
        }
    }
    joinSpec.extraColumns = through.extra;
    joinSpec.filter = through.filter;
    mapping.join.through = std::move(joinSpec);

    store(std::move(mapping));
    return *this;
}

RelationBuilder& RelationBuilder::inheritFrom(const model::RecordKind& other) {
    if (&other == &owner_ ||
        std::find(replaying_.begin(), replaying_.end(), &other) !=
            replaying_.end()) {
        THROW_INVALID_ARGUMENT("Cyclic relation inheritance: " + owner_.name() +
                               " already replays " + other.name());
    }

    spdlog::debug("Replaying relations of {} for {}", other.name(),
                  owner_.name());
    replaying_.push_back(&other);
    try {
        other.declareRelations(*this);
    } catch (...) {
        replaying_.pop_back();
        throw;
    }
    replaying_.pop_back();
    return *this;
}

RelationGraph RelationBuilder::take() {
    RelationGraph result = std::move(mappings_);
    mappings_.clear();
    return result;
}

void RelationBuilder::store(RelationMapping mapping) {
    spdlog::debug("{}.{} ({}) -> {}: {} = {}", owner_.name(), mapping.name,
                  relationKindToString(mapping.kind), mapping.target->name(),
                  mapping.join.from.toString(), mapping.join.to.toString());

    auto name = mapping.name;
    auto [it, inserted] =
        mappings_.insert_or_assign(std::move(name), std::move(mapping));
    if (!inserted) {
        spdlog::debug("Relation {} on {} replaced an earlier declaration",
                      it->first, owner_.name());
    }
}

std::string RelationBuilder::relationName(
    const std::optional<std::string>& override, std::string fallback) {
    if (!override) {
        return fallback;
    }
    if (override->empty()) {
        THROW_INVALID_JOIN_SPEC_ERROR("Relation name override is empty");
    }
    return *override;
}

ColumnRef RelationBuilder::columnRef(const std::optional<std::string>& override,
                                     std::string_view what,
                                     ColumnRef fallback) {
    if (!override) {
        return fallback;
    }
    if (override->empty()) {
        THROW_INVALID_JOIN_SPEC_ERROR("Override " + std::string(what) +
                                      " is empty");
    }
    return ColumnRef::parse(*override);
}

}  // namespace relata::relation
