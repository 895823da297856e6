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

#ifndef RELATA_MODEL_RECORD_KIND_HPP
#define RELATA_MODEL_RECORD_KIND_HPP

#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace relata::relation {
class RelationBuilder;
}  // namespace relata::relation

namespace relata::model {

using json = nlohmann::json;

/// Function form of a record-kind's declareRelations() hook.
using RelationDeclarations = std::function<void(relation::RelationBuilder&)>;

/**
 * @brief Construction options of a record-kind descriptor.
 */
struct RecordKindOptions {
    std::optional<std::string> tableName;  ///< Explicit table override.
    std::string idColumn = "id";           ///< Primary key column.
    bool timestamps = true;                ///< Stamp audit columns on write.
    std::string createdAtColumn = "createdAt";
    std::string updatedAtColumn = "updatedAt";
    json defaults = json::object();  ///< Attribute defaults filled on insert.
    RelationDeclarations relations;  ///< Optional declareRelations() body.
};

/**
 * @brief Metadata describing one kind of persisted record.
 *
 * A RecordKind is created once at startup and lives for the rest of the
 * process. Its address is its identity: the relation mapping store keys its
 * cache slots by descriptor, so descriptors cannot be copied or moved.
 *
 * Relations are declared either by overriding declareRelations() or by
 * passing a RelationDeclarations function in the options.
 */
class RecordKind {
public:
    /**
     * @brief Constructs a record-kind descriptor.
     *
     * @param name The record-kind name; feeds every naming convention.
     * @param options Construction options.
     * @throws InvalidNameError if the name, id column or an explicit table
     * override is malformed
     */
    explicit RecordKind(std::string name, RecordKindOptions options = {});

    /**
     * @brief Constructs a specialization of another record-kind.
     *
     * The specialization keeps its own relation cache slot; relations of
     * the parent are not inherited unless declareRelations() replays them
     * through RelationBuilder::inheritFrom().
     */
    RecordKind(std::string name, const RecordKind& parent,
               RecordKindOptions options = {});

    virtual ~RecordKind() = default;

    RecordKind(const RecordKind&) = delete;
    RecordKind& operator=(const RecordKind&) = delete;
    RecordKind(RecordKind&&) = delete;
    RecordKind& operator=(RecordKind&&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /**
     * @brief Resolves the table name.
     *
     * Resolved on first call from the explicit override, else from the
     * naming convention, and stable from then on.
     */
    [[nodiscard]] std::string tableName() const;

    /**
     * @brief Overrides the table name.
     *
     * @throws InvalidNameError if the name is malformed, or if the table
     * name was already resolved to a different value
     */
    void setTableName(std::string table);

    [[nodiscard]] const std::string& idColumn() const noexcept {
        return options_.idColumn;
    }

    [[nodiscard]] bool timestampsEnabled() const noexcept {
        return options_.timestamps;
    }

    [[nodiscard]] const std::string& createdAtColumn() const noexcept {
        return options_.createdAtColumn;
    }

    [[nodiscard]] const std::string& updatedAtColumn() const noexcept {
        return options_.updatedAtColumn;
    }

    [[nodiscard]] const json& defaults() const noexcept {
        return options_.defaults;
    }

    /**
     * @brief The record-kind this one specializes, if any.
     */
    [[nodiscard]] const RecordKind* parent() const noexcept { return parent_; }

    /**
     * @brief Declares this record-kind's relations.
     *
     * Called by the relation mapping store the first time the relation
     * graph is requested. The default implementation runs the relations
     * function supplied in the options, if any. It must not request this
     * kind's own relation graph.
     */
    virtual void declareRelations(relation::RelationBuilder& relations) const;

private:
    std::string name_;
    const RecordKind* parent_ = nullptr;
    RecordKindOptions options_;

    mutable std::mutex tableMutex_;
    mutable std::optional<std::string> resolvedTable_;
};

}  // namespace relata::model

#endif  // RELATA_MODEL_RECORD_KIND_HPP
