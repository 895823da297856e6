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

/*
 * test_relation_builder.cpp
 *
 * Tests for RelationBuilder
 * - Convention defaults of every relation kind
 * - Overrides of names, join columns and join tables
 * - Declaration-time errors
 * - Replaying another kind's declarations
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>

#include "core/types.hpp"
#include "model/record_kind.hpp"
#include "query/query_builder.hpp"
#include "relation/relation_builder.hpp"
#include "resolver/kind_registry.hpp"
#include "resolver/record_kind_resolver.hpp"

using namespace relata;
using namespace relata::relation;
using relata::core::ColumnRef;
using relata::core::InvalidJoinSpecError;
using relata::core::UnresolvedRecordKindError;

class RelationBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto modelsDir = std::filesystem::current_path() / "models";
        registry = std::make_shared<resolver::KindRegistry>(modelsDir);
        resolver =
            std::make_unique<resolver::RecordKindResolver>(registry, modelsDir);
        registry->add(person);
        registry->add(pet);
        registry->add(membership);
    }

    std::shared_ptr<resolver::KindRegistry> registry;
    std::unique_ptr<resolver::RecordKindResolver> resolver;

    model::RecordKind person{"Person"};
    model::RecordKind pet{"Pet"};
    model::RecordKind membership{"Membership"};
};

// ==================== Convention defaults ====================

TEST_F(RelationBuilderTest, BelongsToDefaults) {
    RelationBuilder builder(pet, *resolver);
    builder.belongsTo("Person");

    const auto& graph = builder.mappings();
    ASSERT_EQ(graph.size(), 1u);
    const auto& mapping = graph.at("person");
    EXPECT_EQ(mapping.kind, RelationKind::ReferenceToOne);
    EXPECT_EQ(mapping.target, &person);
    EXPECT_EQ(mapping.join.from, (ColumnRef{"Person", "petId"}));
    EXPECT_EQ(mapping.join.to, (ColumnRef{"Pet", "id"}));
    EXPECT_FALSE(mapping.join.through);
    EXPECT_FALSE(mapping.isToMany());
}

TEST_F(RelationBuilderTest, HasOneDefaults) {
    RelationBuilder builder(person, *resolver);
    builder.hasOne(pet);

    const auto& mapping = builder.mappings().at("pet");
    EXPECT_EQ(mapping.kind, RelationKind::OwnsOne);
    EXPECT_EQ(mapping.target, &pet);
    EXPECT_EQ(mapping.join.from, (ColumnRef{"Person", "petId"}));
    EXPECT_EQ(mapping.join.to, (ColumnRef{"Pet", "id"}));
}

TEST_F(RelationBuilderTest, HasManyDefaults) {
    RelationBuilder builder(person, *resolver);
    builder.hasMany("Pet");

    const auto& mapping = builder.mappings().at("pets");
    EXPECT_EQ(mapping.kind, RelationKind::OwnsMany);
    EXPECT_EQ(mapping.target, &pet);
    EXPECT_EQ(mapping.join.from, (ColumnRef{"Pet", "personId"}));
    EXPECT_EQ(mapping.join.to, (ColumnRef{"Person", "id"}));
    EXPECT_TRUE(mapping.isToMany());
}

TEST_F(RelationBuilderTest, HasManyThroughDefaults) {
    RelationBuilder builder(person, *resolver);
    builder.hasManyThrough("Pet");

    const auto& mapping = builder.mappings().at("pets");
    EXPECT_EQ(mapping.kind, RelationKind::OwnsManyThroughJoin);
    EXPECT_EQ(mapping.join.from, (ColumnRef{"Person", "id"}));
    EXPECT_EQ(mapping.join.to, (ColumnRef{"Pet", "id"}));

    ASSERT_TRUE(mapping.join.through);
    const auto& through = *mapping.join.through;
    EXPECT_EQ(through.joinTableName, "Person_Pet");
    EXPECT_EQ(through.from, (ColumnRef{"Person_Pet", "personId"}));
    EXPECT_EQ(through.to, (ColumnRef{"Person_Pet", "petId"}));
    EXPECT_TRUE(through.extraColumns.empty());
    EXPECT_EQ(through.throughTarget, nullptr);
}

TEST_F(RelationBuilderTest, DefaultsFollowIdColumnAndTableOverrides) {
    model::RecordKindOptions options;
    options.tableName = "people";
    options.idColumn = "key";
    model::RecordKind owner("Owner", options);

    RelationBuilder builder(owner, *resolver);
    builder.hasMany(pet);

    const auto& mapping = builder.mappings().at("pets");
    EXPECT_EQ(mapping.join.from, (ColumnRef{"Pet", "ownerKey"}));
    EXPECT_EQ(mapping.join.to, (ColumnRef{"people", "key"}));
}

TEST_F(RelationBuilderTest, SelfRelation) {
    RelationBuilder builder(person, *resolver);
    builder.hasMany(person, {.name = "children"});

    const auto& mapping = builder.mappings().at("children");
    EXPECT_EQ(mapping.target, &person);
    EXPECT_EQ(mapping.join.from, (ColumnRef{"Person", "personId"}));
    EXPECT_EQ(mapping.join.to, (ColumnRef{"Person", "id"}));
}

// ==================== Overrides ====================

TEST_F(RelationBuilderTest, NameAndJoinOverrides) {
    RelationBuilder builder(pet, *resolver);
    builder.belongsTo("Person", {.name = "owner",
                                 .joinFrom = "Pet.ownerId",
                                 .joinTo = "Person.id"});

    const auto& mapping = builder.mappings().at("owner");
    EXPECT_EQ(mapping.name, "owner");
    EXPECT_EQ(mapping.join.from, (ColumnRef{"Pet", "ownerId"}));
    EXPECT_EQ(mapping.join.to, (ColumnRef{"Person", "id"}));
    EXPECT_EQ(builder.mappings().count("person"), 0u);
}

TEST_F(RelationBuilderTest, FilterIsKept) {
    RelationBuilder builder(person, *resolver);
    builder.hasMany("Pet", {.filter = [](query::QueryBuilder& q) {
                        q.andWhere("Pet.species = 'dog'");
                    }});

    const auto& mapping = builder.mappings().at("pets");
    ASSERT_TRUE(mapping.filter);
    query::QueryBuilder query("Pet");
    mapping.filter(query);
    EXPECT_NE(query.build().find("species = 'dog'"), std::string::npos);
}

TEST_F(RelationBuilderTest, ThroughModelSuppliesJoinTable) {
    ThroughRelationOptions options;
    options.through.model = resolver::TargetRef("Membership");

    RelationBuilder builder(person, *resolver);
    builder.hasManyThrough("Pet", options);

    const auto& through = *builder.mappings().at("pets").join.through;
    EXPECT_EQ(through.joinTableName, "Membership");
    EXPECT_EQ(through.throughTarget, &membership);
    EXPECT_EQ(through.from, (ColumnRef{"Membership", "personId"}));
    EXPECT_EQ(through.to, (ColumnRef{"Membership", "petId"}));
}

TEST_F(RelationBuilderTest, ExplicitJoinTableWinsOverThroughModel) {
    ThroughRelationOptions options;
    options.through.model = resolver::TargetRef(membership);
    options.through.table = "adoptions";
    options.through.from = "adoptions.adopterId";
    options.through.extra = {"adoptedOn"};

    RelationBuilder builder(person, *resolver);
    builder.hasManyThrough(pet, options);

    const auto& through = *builder.mappings().at("pets").join.through;
    EXPECT_EQ(through.joinTableName, "adoptions");
    EXPECT_EQ(through.from, (ColumnRef{"adoptions", "adopterId"}));
    EXPECT_EQ(through.to, (ColumnRef{"adoptions", "petId"}));
    EXPECT_EQ(through.extraColumns, std::vector<std::string>{"adoptedOn"});
}

TEST_F(RelationBuilderTest, LaterDeclarationReplacesEarlier) {
    RelationBuilder builder(person, *resolver);
    builder.hasMany("Pet").hasManyThrough("Pet");

    ASSERT_EQ(builder.mappings().size(), 1u);
    EXPECT_EQ(builder.mappings().at("pets").kind,
              RelationKind::OwnsManyThroughJoin);
}

TEST_F(RelationBuilderTest, TakeEmptiesBuilder) {
    RelationBuilder builder(person, *resolver);
    builder.hasMany("Pet").hasOne("Membership");

    auto graph = builder.take();
    EXPECT_EQ(graph.size(), 2u);
    EXPECT_TRUE(builder.mappings().empty());
}

// ==================== Errors ====================

TEST_F(RelationBuilderTest, UnresolvedTargetFails) {
    RelationBuilder builder(person, *resolver);
    EXPECT_THROW(builder.hasMany("Ghost"), UnresolvedRecordKindError);
    EXPECT_THROW(builder.belongsTo("./nowhere/Ghost"),
                 UnresolvedRecordKindError);
    EXPECT_TRUE(builder.mappings().empty());
}

TEST_F(RelationBuilderTest, MalformedOverridesFail) {
    RelationBuilder builder(person, *resolver);
    EXPECT_THROW(builder.hasMany("Pet", {.name = ""}), InvalidJoinSpecError);
    EXPECT_THROW(builder.hasMany("Pet", {.joinFrom = ""}),
                 InvalidJoinSpecError);
    EXPECT_THROW(builder.hasMany("Pet", {.joinTo = "personId"}),
                 InvalidJoinSpecError);

    ThroughRelationOptions emptyTable;
    emptyTable.through.table = "";
    EXPECT_THROW(builder.hasManyThrough("Pet", emptyTable),
                 InvalidJoinSpecError);

    ThroughRelationOptions emptyExtra;
    emptyExtra.through.extra = {"since", ""};
    EXPECT_THROW(builder.hasManyThrough("Pet", emptyExtra),
                 InvalidJoinSpecError);

    EXPECT_TRUE(builder.mappings().empty());
}

// ==================== Replaying declarations ====================

TEST_F(RelationBuilderTest, InheritFromRederivesDefaultsForOwner) {
    model::RecordKindOptions parentOptions;
    parentOptions.relations = [](RelationBuilder& r) { r.hasMany("Pet"); };
    model::RecordKind base("Person", parentOptions);

    model::RecordKind employee("Employee", base);
    RelationBuilder builder(employee, *resolver);
    builder.inheritFrom(base);

    const auto& mapping = builder.mappings().at("pets");
    EXPECT_EQ(mapping.join.from, (ColumnRef{"Pet", "employeeId"}));
    EXPECT_EQ(mapping.join.to, (ColumnRef{"Employee", "id"}));
    EXPECT_EQ(&builder.owner(), &employee);
}

TEST_F(RelationBuilderTest, InheritFromCycleFails) {
    model::RecordKind selfish("Selfish");

    RelationBuilder builder(selfish, *resolver);
    EXPECT_THROW(builder.inheritFrom(selfish), atom::error::InvalidArgument);
}

TEST_F(RelationBuilderTest, MutualInheritanceFails) {
    model::RecordKind* second = nullptr;
    model::RecordKindOptions firstOptions;
    firstOptions.relations = [&second](RelationBuilder& r) {
        r.inheritFrom(*second);
    };
    model::RecordKind first("First", firstOptions);

    model::RecordKindOptions secondOptions;
    secondOptions.relations = [&first](RelationBuilder& r) {
        r.inheritFrom(first);
    };
    model::RecordKind secondKind("Second", secondOptions);
    second = &secondKind;

    RelationBuilder builder(first, *resolver);
    EXPECT_THROW(first.declareRelations(builder), atom::error::InvalidArgument);

    // A failed replay leaves the builder usable
    EXPECT_NO_THROW(builder.hasMany("Pet"));
    EXPECT_EQ(builder.mappings().size(), 1u);
}
