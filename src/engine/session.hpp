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

#ifndef RELATA_ENGINE_SESSION_HPP
#define RELATA_ENGINE_SESSION_HPP

#include <sqlite3.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "core/types.hpp"

namespace relata::engine {

class Statement;
class Transaction;

/**
 * @brief An open SQLite connection, the reference persistence engine.
 */
class Session {
public:
    /**
     * @brief Opens (or creates) a database.
     *
     * @param path Database file, or ":memory:".
     * @param flags SQLite open flags.
     * @throws DatabaseOpenError if the database cannot be opened
     */
    explicit Session(const std::string& path,
                     int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);

    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * @brief Gets the raw connection handle.
     * @throws atom::error::InvalidArgument if the session is closed
     */
    sqlite3* get();

    /**
     * @brief Prepares a statement.
     * @throws StatementPrepareError if the SQL does not compile
     */
    std::unique_ptr<Statement> prepare(const std::string& sql);

    /**
     * @brief Begins a transaction that rolls back unless committed.
     * @throws TransactionError if the transaction cannot be started
     */
    std::unique_ptr<Transaction> beginTransaction();

    /**
     * @brief Executes one or more statements without results.
     * @throws SqlExecutionError if execution fails
     */
    void execute(const std::string& sql);

    /**
     * @brief Rowid of the most recent successful INSERT.
     */
    [[nodiscard]] int64_t lastInsertId();

    /**
     * @brief Rows changed by the most recent statement.
     */
    [[nodiscard]] int changes();

    [[nodiscard]] bool isValid() const noexcept { return valid.load(); }

private:
    std::unique_ptr<sqlite3, decltype(&sqlite3_close)> db{nullptr,
                                                          sqlite3_close};
    std::atomic<bool> valid{false};
};

}  // namespace relata::engine

#endif  // RELATA_ENGINE_SESSION_HPP
