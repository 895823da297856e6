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

#ifndef RELATA_ENGINE_TRANSACTION_HPP
#define RELATA_ENGINE_TRANSACTION_HPP

#include "core/types.hpp"

namespace relata::engine {

class Session;

/**
 * @brief A transaction that rolls back on destruction unless committed.
 */
class Transaction {
public:
    /**
     * @throws TransactionError if the transaction cannot be started
     */
    explicit Transaction(Session& session);

    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    /**
     * @throws TransactionError if already finished or the commit fails
     */
    void commit();

    /**
     * @throws TransactionError if already finished or the rollback fails
     */
    void rollback();

    [[nodiscard]] bool isActive() const noexcept {
        return !committed && !rolledBack;
    }

private:
    Session& session;
    bool committed = false;
    bool rolledBack = false;

    void finish(const char* sql, bool& flag, const char* action);
};

}  // namespace relata::engine

#endif  // RELATA_ENGINE_TRANSACTION_HPP
