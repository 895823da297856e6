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
 * test_column_ref.cpp
 *
 * Tests for ColumnRef
 * - Parsing "table.column"
 * - Malformed references
 */

#include <gtest/gtest.h>

#include "core/column_ref.hpp"
#include "core/types.hpp"

using namespace relata::core;

TEST(ColumnRefTest, ParsesTableAndColumn) {
    auto ref = ColumnRef::parse("Person.petId");
    EXPECT_EQ(ref.table, "Person");
    EXPECT_EQ(ref.column, "petId");
    EXPECT_EQ(ref.toString(), "Person.petId");
}

TEST(ColumnRefTest, SplitsAtLastDot) {
    auto ref = ColumnRef::parse("main.Person.id");
    EXPECT_EQ(ref.table, "main.Person");
    EXPECT_EQ(ref.column, "id");
}

TEST(ColumnRefTest, RejectsMissingDot) {
    EXPECT_THROW((void)ColumnRef::parse("personId"), InvalidJoinSpecError);
}

TEST(ColumnRefTest, RejectsEmptyParts) {
    EXPECT_THROW((void)ColumnRef::parse(".id"), InvalidJoinSpecError);
    EXPECT_THROW((void)ColumnRef::parse("Person."), InvalidJoinSpecError);
    EXPECT_THROW((void)ColumnRef::parse(""), InvalidJoinSpecError);
}

TEST(ColumnRefTest, Equality) {
    EXPECT_EQ(ColumnRef::parse("Pet.id"), (ColumnRef{"Pet", "id"}));
    EXPECT_FALSE(ColumnRef::parse("Pet.id") == (ColumnRef{"Person", "id"}));
    EXPECT_TRUE(ColumnRef{}.empty());
}
