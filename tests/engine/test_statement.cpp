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
 * test_statement.cpp
 *
 * Tests for Session and Statement
 * - Opening databases
 * - Binding and reading JSON values
 * - Index validation
 * - SQL errors
 */

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <memory>

#include "core/types.hpp"
#include "engine/session.hpp"
#include "engine/statement.hpp"

using namespace relata::engine;
using namespace relata::core;

class StatementTest : public ::testing::Test {
protected:
    void SetUp() override {
        session = std::make_unique<Session>(":memory:");
        session->execute(
            "CREATE TABLE samples ("
            "  id INTEGER PRIMARY KEY,"
            "  label TEXT,"
            "  amount REAL,"
            "  flag INTEGER,"
            "  payload TEXT"
            ")");
    }

    std::unique_ptr<Session> session;
};

TEST_F(StatementTest, OpenInMemory) {
    EXPECT_TRUE(session->isValid());
    EXPECT_NE(session->get(), nullptr);
}

TEST_F(StatementTest, OpenFailureThrows) {
    EXPECT_THROW(Session("/nonexistent-dir/sub/db.sqlite",
                         SQLITE_OPEN_READWRITE),
                 DatabaseOpenError);
}

TEST_F(StatementTest, BindAndReadValues) {
    auto insert = session->prepare(
        "INSERT INTO samples (label, amount, flag, payload) "
        "VALUES (?, ?, ?, ?)");
    insert->bind(1, "alpha")
        .bind(2, 2.5)
        .bind(3, true)
        .bind(4, json{{"tags", {"a", "b"}}});
    insert->execute();
    EXPECT_EQ(session->lastInsertId(), 1);
    EXPECT_EQ(session->changes(), 1);

    auto select = session->prepare(
        "SELECT id, label, amount, flag, payload FROM samples");
    ASSERT_TRUE(select->step());
    EXPECT_EQ(select->getValue(0), 1);
    EXPECT_EQ(select->getValue(1), "alpha");
    EXPECT_DOUBLE_EQ(select->getValue(2).get<double>(), 2.5);
    EXPECT_EQ(select->getValue(3), 1);
    EXPECT_EQ(json::parse(select->getValue(4).get<std::string>()),
              (json{{"tags", {"a", "b"}}}));
    EXPECT_FALSE(select->step());
}

TEST_F(StatementTest, NullRoundTrip) {
    auto insert =
        session->prepare("INSERT INTO samples (label, amount) VALUES (?, ?)");
    insert->bindAll({json(nullptr), json(1)});
    insert->execute();

    auto select = session->prepare("SELECT label, amount FROM samples");
    ASSERT_TRUE(select->step());
    EXPECT_TRUE(select->getValue(0).is_null());
    EXPECT_EQ(select->getValue(1), 1.0);
}

TEST_F(StatementTest, GetRow) {
    session->execute("INSERT INTO samples (label, flag) VALUES ('x', 0)");
    auto select = session->prepare("SELECT label, flag FROM samples");
    ASSERT_TRUE(select->step());

    EXPECT_EQ(select->getColumnCount(), 2);
    EXPECT_EQ(select->getColumnName(0), "label");
    EXPECT_EQ(select->getRow(), (json{{"label", "x"}, {"flag", 0}}));
}

TEST_F(StatementTest, ResetAllowsReuse) {
    auto insert = session->prepare("INSERT INTO samples (label) VALUES (?)");
    insert->bind(1, "one");
    insert->execute();
    insert->reset().bind(1, "two");
    insert->execute();

    auto count = session->prepare("SELECT COUNT(*) FROM samples");
    ASSERT_TRUE(count->step());
    EXPECT_EQ(count->getValue(0), 2);
}

TEST_F(StatementTest, IndexValidation) {
    auto stmt = session->prepare("SELECT label FROM samples WHERE id = ?");
    EXPECT_THROW(stmt->bind(0, 1), atom::error::InvalidArgument);
    EXPECT_THROW(stmt->bind(2, 1), atom::error::InvalidArgument);
    EXPECT_THROW((void)stmt->getValue(1), atom::error::InvalidArgument);
    EXPECT_EQ(stmt->getSql(), "SELECT label FROM samples WHERE id = ?");
}

TEST_F(StatementTest, UnsignedValuesBeyondInt64AreRejected) {
    auto stmt = session->prepare("SELECT ?");
    const auto largest =
        static_cast<std::uint64_t>(std::numeric_limits<int64_t>::max());

    EXPECT_THROW(stmt->bind(1, json(largest + 1)),
                 atom::error::InvalidArgument);

    stmt->bind(1, json(largest));
    ASSERT_TRUE(stmt->step());
    EXPECT_EQ(stmt->getValue(0), std::numeric_limits<int64_t>::max());
}

TEST_F(StatementTest, PrepareErrorThrows) {
    EXPECT_THROW((void)session->prepare("SELEKT nothing"),
                 StatementPrepareError);
    EXPECT_THROW((void)session->prepare("SELECT * FROM missing"),
                 StatementPrepareError);
}

TEST_F(StatementTest, ExecuteErrorThrows) {
    EXPECT_THROW(session->execute("INSERT INTO missing VALUES (1)"),
                 SqlExecutionError);

    session->execute("CREATE TABLE uniq (v INTEGER UNIQUE)");
    session->execute("INSERT INTO uniq VALUES (1)");
    auto dup = session->prepare("INSERT INTO uniq VALUES (?)");
    dup->bind(1, 1);
    EXPECT_THROW(dup->execute(), SqlExecutionError);
}
