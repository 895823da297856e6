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

#include "record_kind.hpp"

#include <spdlog/spdlog.h>

#include "core/types.hpp"
#include "naming/naming_convention.hpp"

namespace relata::model {

RecordKind::RecordKind(std::string name, RecordKindOptions options)
    : name_(std::move(name)), options_(std::move(options)) {
    naming::validateName(name_, "Record-kind name");
    naming::validateName(options_.idColumn, "Id column name");
    if (options_.tableName) {
        naming::validateName(*options_.tableName, "Table name");
    }
    if (options_.timestamps) {
        naming::validateName(options_.createdAtColumn, "createdAt column name");
        naming::validateName(options_.updatedAtColumn, "updatedAt column name");
    }
    if (!options_.defaults.is_object()) {
        THROW_INVALID_ARGUMENT("Defaults of record-kind " + name_ +
                               " must be a JSON object");
    }
}

RecordKind::RecordKind(std::string name, const RecordKind& parent,
                       RecordKindOptions options)
    : RecordKind(std::move(name), std::move(options)) {
    parent_ = &parent;
}

std::string RecordKind::tableName() const {
    std::lock_guard lock(tableMutex_);
    if (!resolvedTable_) {
        resolvedTable_ = options_.tableName
                             ? *options_.tableName
                             : naming::tableNameOf(name_);
        spdlog::debug("Record-kind {} resolved to table {}", name_,
                      *resolvedTable_);
    }
    return *resolvedTable_;
}

void RecordKind::setTableName(std::string table) {
    naming::validateName(table, "Table name");

    std::lock_guard lock(tableMutex_);
    if (resolvedTable_ && *resolvedTable_ != table) {
        THROW_INVALID_NAME_ERROR("Table name of " + name_ +
                                 " is already resolved to " + *resolvedTable_);
    }
    options_.tableName = std::move(table);
}

void RecordKind::declareRelations(relation::RelationBuilder& relations) const {
    if (options_.relations) {
        options_.relations(relations);
    }
}

}  // namespace relata::model
