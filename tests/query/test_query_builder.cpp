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
 * test_query_builder.cpp
 *
 * Tests for QueryBuilder
 * - Select lists
 * - WHERE conditions, connectives and bound parameters
 * - Joins, ordering and pagination
 * - COUNT queries
 * - Validation errors
 */

#include <gtest/gtest.h>

#include "atom/error/exception.hpp"
#include "query/query_builder.hpp"

using namespace relata::query;
using json = nlohmann::json;

TEST(QueryBuilderTest, SelectAllByDefault) {
    QueryBuilder builder("Person");
    EXPECT_EQ(builder.build(), "SELECT * FROM Person");
    EXPECT_EQ(builder.getTableName(), "Person");
}

TEST(QueryBuilderTest, SelectColumns) {
    QueryBuilder builder("Person");
    builder.select({"id", "name"}).addSelect("age");
    EXPECT_EQ(builder.build(), "SELECT id, name, age FROM Person");
}

TEST(QueryBuilderTest, EmptySelectKeepsCurrentColumns) {
    QueryBuilder builder("Person");
    builder.select({});
    EXPECT_EQ(builder.build(), "SELECT * FROM Person");
}

TEST(QueryBuilderTest, WhereConditionsAreParenthesized) {
    QueryBuilder builder("Person");
    builder.where("age > ?", {json(18)})
        .andWhere("active = 1")
        .orWhere("name = 'root'");
    EXPECT_EQ(builder.build(),
              "SELECT * FROM Person WHERE (age > ?) AND (active = 1) OR "
              "(name = 'root')");
}

TEST(QueryBuilderTest, ScopeByGroupsExistingConditions) {
    QueryBuilder builder("Pet");
    builder.where("name = ?", {json("Rex")}).orWhere("name = 'Tom'");
    builder.scopeBy("personId = ?", {json(1)});

    EXPECT_EQ(builder.build(),
              "SELECT * FROM Pet WHERE (personId = ?) AND ((name = ?) OR "
              "(name = 'Tom'))");
    ASSERT_EQ(builder.getParamCount(), 2u);
    EXPECT_EQ(builder.getParamValues()[0], 1);
    EXPECT_EQ(builder.getParamValues()[1], "Rex");
}

TEST(QueryBuilderTest, ScopeByWithSingleOrNoCondition) {
    QueryBuilder single("Pet");
    single.where("species = ?", {json("cat")}).scopeBy("personId = ?",
                                                      {json(1)});
    EXPECT_EQ(single.build(),
              "SELECT * FROM Pet WHERE (personId = ?) AND (species = ?)");

    QueryBuilder bare("Pet");
    bare.scopeBy("personId = ?", {json(1)});
    EXPECT_EQ(bare.build(), "SELECT * FROM Pet WHERE (personId = ?)");
    EXPECT_EQ(bare.getParamCount(), 1u);
}

TEST(QueryBuilderTest, ParametersAccumulateInOrder) {
    QueryBuilder builder("Pet");
    builder.where("personId = ?", {json(7)})
        .where("species IN (?, ?)", {json("cat"), json("dog")});

    ASSERT_EQ(builder.getParamCount(), 3u);
    EXPECT_EQ(builder.getParamValues()[0], 7);
    EXPECT_EQ(builder.getParamValues()[1], "cat");
    EXPECT_EQ(builder.getParamValues()[2], "dog");
}

TEST(QueryBuilderTest, EmptyConditionIsIgnored) {
    QueryBuilder builder("Pet");
    builder.where("", {json(1)}).andWhere("").orWhere("");
    EXPECT_EQ(builder.build(), "SELECT * FROM Pet");
    EXPECT_EQ(builder.getParamCount(), 0u);
}

TEST(QueryBuilderTest, Joins) {
    QueryBuilder builder("Pet");
    builder.join("Person_Pet", "Person_Pet.petId = Pet.id")
        .join("Person", "Person.id = Person_Pet.personId", "LEFT");
    EXPECT_EQ(builder.build(),
              "SELECT * FROM Pet INNER JOIN Person_Pet ON Person_Pet.petId = "
              "Pet.id LEFT JOIN Person ON Person.id = Person_Pet.personId");
}

TEST(QueryBuilderTest, OrderLimitOffset) {
    QueryBuilder builder("Pet");
    builder.orderBy("name").limit(10).offset(20);
    EXPECT_EQ(builder.build(),
              "SELECT * FROM Pet ORDER BY name ASC LIMIT 10 OFFSET 20");

    builder.orderBy("createdAt", false);
    EXPECT_NE(builder.build().find("ORDER BY createdAt DESC"),
              std::string::npos);
}

TEST(QueryBuilderTest, NegativeLimitAndOffsetAreIgnored) {
    QueryBuilder builder("Pet");
    builder.limit(-1).offset(-5);
    EXPECT_EQ(builder.build(), "SELECT * FROM Pet");
}

TEST(QueryBuilderTest, OffsetWithoutLimitThrows) {
    QueryBuilder builder("Pet");
    builder.offset(5);
    EXPECT_THROW((void)builder.build(), atom::error::InvalidArgument);
}

TEST(QueryBuilderTest, EmptyTableThrows) {
    QueryBuilder builder("");
    EXPECT_THROW((void)builder.build(), atom::error::InvalidArgument);
    EXPECT_THROW((void)builder.buildCount(), atom::error::InvalidArgument);
}

TEST(QueryBuilderTest, BuildCount) {
    QueryBuilder builder("Pet");
    builder.select({"name"})
        .join("Person", "Person.id = Pet.personId")
        .where("Person.name = ?", {json("Alice")})
        .orderBy("name")
        .limit(3);
    EXPECT_EQ(builder.buildCount(),
              "SELECT COUNT(*) FROM Pet INNER JOIN Person ON Person.id = "
              "Pet.personId WHERE (Person.name = ?)");
}
