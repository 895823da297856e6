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
 * test_join_planner.cpp
 *
 * Tests for JoinPlanner
 * - Owner-side column selection for every relation kind
 * - Generated SQL and bound owner value
 * - Through-table joins, extra columns and filters
 * - Joins that do not touch the owner
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <functional>
#include <memory>

#include "core/types.hpp"
#include "engine/join_planner.hpp"
#include "relation/relation_builder.hpp"
#include "resolver/kind_registry.hpp"

using namespace relata;
using namespace relata::engine;
using relata::core::ColumnRef;
using relata::core::InvalidJoinSpecError;
using json = nlohmann::json;

class JoinPlannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto modelsDir = std::filesystem::current_path() / "models";
        registry = std::make_shared<resolver::KindRegistry>(modelsDir);
        resolver =
            std::make_unique<resolver::RecordKindResolver>(registry, modelsDir);
        registry->add(person);
        registry->add(pet);
    }

    relation::RelationMapping declare(
        const model::RecordKind& owner,
        const std::function<void(relation::RelationBuilder&)>& declaration,
        const std::string& name) {
        relation::RelationBuilder builder(owner, *resolver);
        declaration(builder);
        return builder.mappings().at(name);
    }

    std::shared_ptr<resolver::KindRegistry> registry;
    std::unique_ptr<resolver::RecordKindResolver> resolver;

    model::RecordKind person{"Person"};
    model::RecordKind pet{"Pet"};
};

TEST_F(JoinPlannerTest, ReferenceToOne) {
    auto mapping = declare(
        pet, [](auto& r) { r.belongsTo("Person"); }, "person");
    model::Record rex(pet, {{"id", 3}});

    EXPECT_EQ(JoinPlanner::ownerColumn(mapping, pet), (ColumnRef{"Pet", "id"}));
    auto query = JoinPlanner::plan(rex, mapping);
    EXPECT_EQ(query.build(),
              "SELECT Person.* FROM Person WHERE (Person.petId = ?) LIMIT 1");
    ASSERT_EQ(query.getParamCount(), 1u);
    EXPECT_EQ(query.getParamValues()[0], 3);
}

TEST_F(JoinPlannerTest, OwnsOne) {
    auto mapping = declare(
        person, [](auto& r) { r.hasOne("Pet"); }, "pet");
    model::Record alice(person, {{"id", 1}, {"petId", 9}});

    EXPECT_EQ(JoinPlanner::ownerColumn(mapping, person),
              (ColumnRef{"Person", "petId"}));
    auto query = JoinPlanner::plan(alice, mapping);
    EXPECT_EQ(query.build(),
              "SELECT Pet.* FROM Pet WHERE (Pet.id = ?) LIMIT 1");
    EXPECT_EQ(query.getParamValues()[0], 9);
}

TEST_F(JoinPlannerTest, OwnsMany) {
    auto mapping = declare(
        person, [](auto& r) { r.hasMany("Pet"); }, "pets");
    model::Record alice(person, {{"id", 1}});

    auto query = JoinPlanner::plan(alice, mapping);
    EXPECT_EQ(query.build(), "SELECT Pet.* FROM Pet WHERE (Pet.personId = ?)");
    EXPECT_EQ(query.getParamValues()[0], 1);
}

TEST_F(JoinPlannerTest, OwnsManyThroughJoin) {
    auto mapping = declare(
        person,
        [](auto& r) {
            relation::ThroughRelationOptions options;
            options.through.extra = {"since"};
            r.hasManyThrough("Pet", options);
        },
        "pets");
    model::Record alice(person, {{"id", 1}});

    EXPECT_EQ(JoinPlanner::ownerColumn(mapping, person),
              (ColumnRef{"Person", "id"}));
    auto query = JoinPlanner::plan(alice, mapping);
    EXPECT_EQ(query.build(),
              "SELECT Pet.*, Person_Pet.since FROM Pet INNER JOIN Person_Pet "
              "ON Person_Pet.petId = Pet.id WHERE (Person_Pet.personId = ?)");
    EXPECT_EQ(query.getParamValues()[0], 1);
}

TEST_F(JoinPlannerTest, FiltersNarrowTheQuery) {
    auto mapping = declare(
        person,
        [](auto& r) {
            relation::ThroughRelationOptions options;
            options.filter = [](query::QueryBuilder& q) {
                q.orderBy("Pet.name");
            };
            options.through.filter = [](query::QueryBuilder& q) {
                q.where("Person_Pet.since > ?", {json(2020)});
            };
            r.hasManyThrough("Pet", options);
        },
        "pets");
    model::Record alice(person, {{"id", 1}});

    auto query = JoinPlanner::plan(alice, mapping);
    EXPECT_EQ(query.build(),
              "SELECT Pet.* FROM Pet INNER JOIN Person_Pet ON Person_Pet.petId "
              "= Pet.id WHERE (Person_Pet.personId = ?) AND (Person_Pet.since "
              "> ?) ORDER BY Pet.name ASC");
    ASSERT_EQ(query.getParamCount(), 2u);
    EXPECT_EQ(query.getParamValues()[1], 2020);
}

TEST_F(JoinPlannerTest, OrFilterStaysWithinOwnerScope) {
    auto mapping = declare(
        person,
        [](auto& r) {
            r.hasMany("Pet", {.filter = [](query::QueryBuilder& q) {
                                  q.where("Pet.name = ?", {json("Rex")})
                                      .orWhere("Pet.name = 'Tom'");
                              }});
        },
        "pets");
    model::Record alice(person, {{"id", 1}});

    auto query = JoinPlanner::plan(alice, mapping);
    EXPECT_EQ(query.build(),
              "SELECT Pet.* FROM Pet WHERE (Pet.personId = ?) AND "
              "((Pet.name = ?) OR (Pet.name = 'Tom'))");
    ASSERT_EQ(query.getParamCount(), 2u);
    EXPECT_EQ(query.getParamValues()[0], 1);
    EXPECT_EQ(query.getParamValues()[1], "Rex");
}

TEST_F(JoinPlannerTest, SelfRelationUsesPreferredSide) {
    auto mapping = declare(
        person, [this](auto& r) { r.hasMany(person, {.name = "children"}); },
        "children");
    model::Record alice(person, {{"id", 1}});

    auto query = JoinPlanner::plan(alice, mapping);
    EXPECT_EQ(query.build(),
              "SELECT Person.* FROM Person WHERE (Person.personId = ?)");
}

TEST_F(JoinPlannerTest, SidesAreMatchedByTableWhenOverridesSwapThem) {
    auto mapping = declare(
        person,
        [](auto& r) {
            r.hasMany("Pet",
                      {.joinFrom = "Person.id", .joinTo = "Pet.personId"});
        },
        "pets");
    model::Record alice(person, {{"id", 1}});

    EXPECT_EQ(JoinPlanner::ownerColumn(mapping, person),
              (ColumnRef{"Person", "id"}));
    EXPECT_EQ(JoinPlanner::targetColumn(mapping, person),
              (ColumnRef{"Pet", "personId"}));
}

TEST_F(JoinPlannerTest, JoinNotTouchingOwnerFails) {
    auto mapping = declare(
        person,
        [](auto& r) {
            r.hasMany("Pet", {.joinFrom = "Pet.ownerId", .joinTo = "Owner.id"});
        },
        "pets");
    model::Record alice(person, {{"id", 1}});

    EXPECT_THROW((void)JoinPlanner::ownerColumn(mapping, person),
                 InvalidJoinSpecError);
    EXPECT_THROW((void)JoinPlanner::plan(alice, mapping),
                 InvalidJoinSpecError);
}
