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

#include "transaction.hpp"

#include <spdlog/spdlog.h>

#include "session.hpp"

namespace relata::engine {

Transaction::Transaction(Session& session) : session(session) {
    try {
        session.execute("BEGIN TRANSACTION;");
    } catch (const std::exception& e) {
        spdlog::error("Failed to begin transaction: {}", e.what());
        THROW_TRANSACTION_ERROR("Failed to begin transaction: " +
                                std::string(e.what()));
    }
}

Transaction::~Transaction() {
    if (isActive()) {
        try {
            rollback();
        } catch (const std::exception& e) {
            spdlog::error("Failed to auto-rollback transaction: {}", e.what());
        }
    }
}

void Transaction::commit() { finish("COMMIT;", committed, "commit"); }

void Transaction::rollback() { finish("ROLLBACK;", rolledBack, "rollback"); }

void Transaction::finish(const char* sql, bool& flag, const char* action) {
    if (!isActive()) {
        THROW_TRANSACTION_ERROR("Transaction already committed or rolled back");
    }
    try {
        session.execute(sql);
        flag = true;
        spdlog::debug("Transaction {} done", action);
    } catch (const std::exception& e) {
        spdlog::error("Failed to {} transaction: {}", action, e.what());
        THROW_TRANSACTION_ERROR(std::string("Failed to ") + action +
                                " transaction: " + e.what());
    }
}

}  // namespace relata::engine
