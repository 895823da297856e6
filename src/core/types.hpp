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

#ifndef RELATA_CORE_TYPES_HPP
#define RELATA_CORE_TYPES_HPP

#include "atom/error/exception.hpp"

namespace relata::core {

// Declaration-time errors - raised while a relation graph is being built
class InvalidNameError : public atom::error::Exception {
    using Exception::Exception;
};

class UnresolvedRecordKindError : public atom::error::Exception {
    using Exception::Exception;
};

class InvalidJoinSpecError : public atom::error::Exception {
    using Exception::Exception;
};

// Persistence engine errors
class DatabaseOpenError : public atom::error::Exception {
    using Exception::Exception;
};

class SqlExecutionError : public atom::error::Exception {
    using Exception::Exception;
};

class StatementPrepareError : public atom::error::Exception {
    using Exception::Exception;
};

class TransactionError : public atom::error::Exception {
    using Exception::Exception;
};

#define THROW_INVALID_NAME_ERROR(...)              \
    throw relata::core::InvalidNameError(          \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_UNRESOLVED_RECORD_KIND_ERROR(...)    \
    throw relata::core::UnresolvedRecordKindError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_INVALID_JOIN_SPEC_ERROR(...)         \
    throw relata::core::InvalidJoinSpecError(      \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_DATABASE_OPEN_ERROR(...)             \
    throw relata::core::DatabaseOpenError(         \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_SQL_EXECUTION_ERROR(...)             \
    throw relata::core::SqlExecutionError(         \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_STATEMENT_PREPARE_ERROR(...)         \
    throw relata::core::StatementPrepareError(     \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_TRANSACTION_ERROR(...)               \
    throw relata::core::TransactionError(          \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace relata::core

#endif  // RELATA_CORE_TYPES_HPP
