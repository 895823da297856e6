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

#include "statement.hpp"

#include <cstdint>
#include <limits>

#include <spdlog/spdlog.h>

#include "session.hpp"

namespace relata::engine {

//------------------------------------------------------------------------------
// Statement Implementation
//------------------------------------------------------------------------------

Statement::Statement(Session& session, const std::string& sql)
    : session(session), sql(sql) {
    sqlite3_stmt* rawStmt = nullptr;
    int result =
        sqlite3_prepare_v2(session.get(), sql.c_str(), -1, &rawStmt, nullptr);
    stmt.reset(rawStmt);

    if (result != SQLITE_OK) {
        std::string error = "Failed to prepare SQL statement: ";
        error += sqlite3_errmsg(session.get());
        spdlog::error("{} [{}]", error, sql);
        THROW_STATEMENT_PREPARE_ERROR(error);
    }
    spdlog::debug("Prepared statement: {}", sql);
}

Statement& Statement::bind(int index, const json& value) {
    validateIndex(index, true);

    switch (value.type()) {
        case json::value_t::null:
        case json::value_t::discarded:
            checkBind(sqlite3_bind_null(stmt.get(), index), "NULL");
            break;
        case json::value_t::boolean:
            checkBind(sqlite3_bind_int(stmt.get(), index,
                                       value.get<bool>() ? 1 : 0),
                      "boolean");
            break;
        case json::value_t::number_unsigned:
            if (value.get<std::uint64_t>() >
                static_cast<std::uint64_t>(
                    std::numeric_limits<sqlite3_int64>::max())) {
                THROW_INVALID_ARGUMENT("Unsigned value " + value.dump() +
                                       " at index " + std::to_string(index) +
                                       " does not fit a SQLite integer");
            }
            [[fallthrough]];
        case json::value_t::number_integer:
            checkBind(sqlite3_bind_int64(stmt.get(), index,
                                         value.get<sqlite3_int64>()),
                      "integer");
            break;
        case json::value_t::number_float:
            checkBind(
                sqlite3_bind_double(stmt.get(), index, value.get<double>()),
                "float");
            break;
        case json::value_t::string: {
            const auto& text = value.get_ref<const std::string&>();
            checkBind(sqlite3_bind_text(stmt.get(), index, text.c_str(),
                                        static_cast<int>(text.size()),
                                        SQLITE_TRANSIENT),
                      "text");
            break;
        }
        default: {
            auto text = value.dump();
            checkBind(sqlite3_bind_text(stmt.get(), index, text.c_str(),
                                        static_cast<int>(text.size()),
                                        SQLITE_TRANSIENT),
                      "JSON text");
            break;
        }
    }
    return *this;
}

Statement& Statement::bindAll(const std::vector<json>& values) {
    int index = 1;
    for (const auto& value : values) {
        bind(index++, value);
    }
    return *this;
}

void Statement::execute() {
    int result = sqlite3_step(stmt.get());
    if (result != SQLITE_DONE && result != SQLITE_ROW) {
        std::string error = "Failed to execute statement: ";
        error += sqlite3_errmsg(session.get());
        spdlog::error("{}", error);
        THROW_SQL_EXECUTION_ERROR(error);
    }
}

bool Statement::step() {
    int result = sqlite3_step(stmt.get());
    if (result == SQLITE_ROW) {
        return true;
    }
    if (result != SQLITE_DONE) {
        std::string error = "Failed to step statement: ";
        error += sqlite3_errmsg(session.get());
        spdlog::error("{}", error);
        THROW_SQL_EXECUTION_ERROR(error);
    }
    return false;
}

Statement& Statement::reset() {
    if (sqlite3_reset(stmt.get()) != SQLITE_OK) {
        std::string error = "Failed to reset statement: ";
        error += sqlite3_errmsg(session.get());
        spdlog::error("{}", error);
        THROW_STATEMENT_PREPARE_ERROR(error);
    }
    return *this;
}

json Statement::getValue(int index) const {
    validateIndex(index, false);
    switch (sqlite3_column_type(stmt.get(), index)) {
        case SQLITE_INTEGER:
            return sqlite3_column_int64(stmt.get(), index);
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt.get(), index);
        case SQLITE_TEXT: {
            const auto* text = sqlite3_column_text(stmt.get(), index);
            return std::string(reinterpret_cast<const char*>(text),
                               sqlite3_column_bytes(stmt.get(), index));
        }
        case SQLITE_BLOB: {
            const auto* data =
                static_cast<const uint8_t*>(sqlite3_column_blob(stmt.get(), index));
            const int size = sqlite3_column_bytes(stmt.get(), index);
            return json::binary(std::vector<uint8_t>(data, data + size));
        }
        default:
            return nullptr;
    }
}

json Statement::getRow() const {
    json row = json::object();
    for (int i = 0; i < getColumnCount(); ++i) {
        row[getColumnName(i)] = getValue(i);
    }
    return row;
}

int Statement::getColumnCount() const {
    return sqlite3_column_count(stmt.get());
}

std::string Statement::getColumnName(int index) const {
    validateIndex(index, false);
    const char* name = sqlite3_column_name(stmt.get(), index);
    return name ? name : "";
}

void Statement::validateIndex(int index, bool isParam) const {
    if (isParam) {
        // Parameter indices are 1-based
        if (index <= 0 || index > sqlite3_bind_parameter_count(stmt.get())) {
            THROW_INVALID_ARGUMENT("Parameter index out of bounds: " +
                                   std::to_string(index));
        }
    } else if (index < 0 || index >= sqlite3_column_count(stmt.get())) {
        THROW_INVALID_ARGUMENT("Column index out of bounds: " +
                               std::to_string(index));
    }
}

void Statement::checkBind(int result, const char* what) {
    if (result != SQLITE_OK) {
        std::string error = std::string("Failed to bind ") + what +
                            " parameter: " + sqlite3_errmsg(session.get());
        spdlog::error("{}", error);
        THROW_STATEMENT_PREPARE_ERROR(error);
    }
}

}  // namespace relata::engine
