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

#ifndef RELATA_RELATION_RELATION_BUILDER_HPP
#define RELATA_RELATION_RELATION_BUILDER_HPP

#include <string>
#include <vector>

#include "relation_mapping.hpp"
#include "relation_options.hpp"

namespace relata::relation {

/**
 * @brief Turns relation declarations into fully resolved mappings.
 *
 * One builder collects the relation graph of one owner record-kind during
 * a single declareRelations() call. Every declaration resolves its target
 * immediately, fills unset overrides from the naming conventions and stores
 * the mapping under its name; a later declaration with the same name
 * replaces the earlier one.
 *
 * Default join columns:
 * | declaration                | from         | to        |
 * |----------------------------|--------------|-----------|
 * | Pet.belongsTo(Person)      | Person.petId | Pet.id    |
 * | Person.hasOne(Pet)         | Person.petId | Pet.id    |
 * | Person.hasMany(Pet)        | Pet.personId | Person.id |
 * | Person.hasManyThrough(Pet) | Person.id    | Pet.id    |
 * hasManyThrough additionally joins Person_Pet.personId / Person_Pet.petId.
 */
class RelationBuilder {
public:
    /**
     * @param owner The record-kind whose relations are being declared.
     * @param resolver Resolves declaration targets.
     */
    RelationBuilder(const model::RecordKind& owner,
                    const resolver::RecordKindResolver& resolver);

    RelationBuilder(const RelationBuilder&) = delete;
    RelationBuilder& operator=(const RelationBuilder&) = delete;

    /**
     * @brief Declares that the owner belongs to the target
     * (RelationKind::ReferenceToOne).
     *
     * @throws UnresolvedRecordKindError if the target cannot be resolved
     * @throws InvalidJoinSpecError if an override is empty or malformed
     * @throws InvalidNameError if a name feeding a convention is malformed
     */
    RelationBuilder& belongsTo(const resolver::TargetRef& target,
                               const RelationOptions& options = {});

    /**
     * @brief Declares that the owner has one target (RelationKind::OwnsOne).
     */
    RelationBuilder& hasOne(const resolver::TargetRef& target,
                            const RelationOptions& options = {});

    /**
     * @brief Declares that the owner has many targets
     * (RelationKind::OwnsMany).
     */
    RelationBuilder& hasMany(const resolver::TargetRef& target,
                             const RelationOptions& options = {});

    /**
     * @brief Declares that the owner has many targets through a join table
     * (RelationKind::OwnsManyThroughJoin).
     *
     * The join table is the explicit table override, else the through
     * model's table, else "<Owner>_<Target>".
     */
    RelationBuilder& hasManyThrough(const resolver::TargetRef& target,
                                    const ThroughRelationOptions& options = {});

    /**
     * @brief Replays another record-kind's declarations with this builder's
     * owner, so every default is derived from the owner's own name.
     *
     * @throws atom::error::InvalidArgument on a cyclic replay
     */
    RelationBuilder& inheritFrom(const model::RecordKind& other);

    [[nodiscard]] const model::RecordKind& owner() const noexcept {
        return owner_;
    }

    [[nodiscard]] const RelationGraph& mappings() const noexcept {
        return mappings_;
    }

    /**
     * @brief Hands over the collected graph, leaving the builder empty.
     */
    [[nodiscard]] RelationGraph take();

private:
    const model::RecordKind& owner_;
    const resolver::RecordKindResolver& resolver_;
    RelationGraph mappings_;
    std::vector<const model::RecordKind*> replaying_;

    void store(RelationMapping mapping);

    [[nodiscard]] static std::string relationName(
        const std::optional<std::string>& override, std::string fallback);

    [[nodiscard]] static ColumnRef columnRef(
        const std::optional<std::string>& override, std::string_view what,
        ColumnRef fallback);
};

}  // namespace relata::relation

#endif  // RELATA_RELATION_RELATION_BUILDER_HPP
