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

#ifndef RELATA_ENGINE_STATEMENT_HPP
#define RELATA_ENGINE_STATEMENT_HPP

#include <sqlite3.h>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/types.hpp"

namespace relata::engine {

using json = nlohmann::json;

class Session;

/**
 * @brief A prepared statement exchanging values as JSON.
 *
 * Binding maps null, booleans, integers, floats and strings onto the
 * matching SQLite storage class; arrays and objects are stored as their
 * JSON text. Reading maps the storage class back.
 */
class Statement {
public:
    /**
     * @throws StatementPrepareError if the SQL does not compile
     */
    Statement(Session& session, const std::string& sql);

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    /**
     * @brief Binds a value to a 1-based parameter index.
     * @throws StatementPrepareError if binding fails
     */
    Statement& bind(int index, const json& value);

    /**
     * @brief Binds values to parameters 1..n in order.
     */
    Statement& bindAll(const std::vector<json>& values);

    /**
     * @brief Runs the statement to completion.
     * @throws SqlExecutionError on failure
     */
    void execute();

    /**
     * @brief Advances to the next row.
     * @return true while a row is available.
     * @throws SqlExecutionError on failure
     */
    bool step();

    Statement& reset();

    /**
     * @brief Reads a 0-based column of the current row.
     */
    [[nodiscard]] json getValue(int index) const;

    /**
     * @brief Reads the current row as {column name: value}.
     */
    [[nodiscard]] json getRow() const;

    [[nodiscard]] int getColumnCount() const;

    [[nodiscard]] std::string getColumnName(int index) const;

    [[nodiscard]] const std::string& getSql() const noexcept { return sql; }

private:
    Session& session;
    std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> stmt{
        nullptr, sqlite3_finalize};
    std::string sql;

    void validateIndex(int index, bool isParam) const;
    void checkBind(int result, const char* what);
};

}  // namespace relata::engine

#endif  // RELATA_ENGINE_STATEMENT_HPP
