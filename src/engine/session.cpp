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

#include "session.hpp"

#include <spdlog/spdlog.h>

#include "statement.hpp"
#include "transaction.hpp"

namespace relata::engine {

//------------------------------------------------------------------------------
// Session Implementation
//------------------------------------------------------------------------------

Session::Session(const std::string& path, int flags) {
    sqlite3* rawDb = nullptr;
    int result = sqlite3_open_v2(path.c_str(), &rawDb, flags, nullptr);
    db.reset(rawDb);

    if (result != SQLITE_OK) {
        std::string error = "Can't open database " + path + ": ";
        error += rawDb ? sqlite3_errmsg(rawDb) : "Unknown error";
        spdlog::error("{}", error);
        THROW_DATABASE_OPEN_ERROR(error);
    }

    valid.store(true);
    execute("PRAGMA foreign_keys = ON;");
    spdlog::info("Session opened: {}", path);
}

Session::~Session() { valid.store(false); }

sqlite3* Session::get() {
    if (!valid.load()) {
        THROW_INVALID_ARGUMENT("Attempted to use a closed session");
    }
    return db.get();
}

std::unique_ptr<Statement> Session::prepare(const std::string& sql) {
    return std::make_unique<Statement>(*this, sql);
}

std::unique_ptr<Transaction> Session::beginTransaction() {
    return std::make_unique<Transaction>(*this);
}

void Session::execute(const std::string& sql) {
    char* errMsg = nullptr;
    int result = sqlite3_exec(get(), sql.c_str(), nullptr, nullptr, &errMsg);

    if (result != SQLITE_OK) {
        std::string error = "SQL Error: ";
        if (errMsg) {
            error += errMsg;
            sqlite3_free(errMsg);
        } else {
            error += "Unknown error";
        }
        spdlog::error("{}", error);
        THROW_SQL_EXECUTION_ERROR(error);
    }
}

int64_t Session::lastInsertId() { return sqlite3_last_insert_rowid(get()); }

int Session::changes() { return sqlite3_changes(get()); }

}  // namespace relata::engine
