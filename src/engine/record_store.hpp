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

#ifndef RELATA_ENGINE_RECORD_STORE_HPP
#define RELATA_ENGINE_RECORD_STORE_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "hooks/hook_pipeline.hpp"
#include "hooks/operation_context.hpp"
#include "model/record.hpp"
#include "relation/mapping_store.hpp"
#include "session.hpp"

namespace relata::engine {

using json = nlohmann::json;

/**
 * @brief Reads and writes records of any kind through a Session.
 *
 * Writes run the hook pipeline before the SQL is built. Audit timestamps
 * are stored in the kind's createdAt/updatedAt columns as milliseconds
 * since the Unix epoch and are lifted back out of the attributes on read.
 */
class RecordStore {
public:
    RecordStore(Session& session, relation::RelationMappingStore& mappings,
                hooks::HookPipeline pipeline = hooks::HookPipeline::standard());

    RecordStore(const RecordStore&) = delete;
    RecordStore& operator=(const RecordStore&) = delete;

    /**
     * @brief Inserts a record; a missing id is filled from the new rowid.
     * @throws SqlExecutionError if insertion fails
     */
    void insert(model::Record& record,
                const hooks::OperationContext& context = {});

    /**
     * @brief Updates the row with the record's id.
     * @return Number of rows changed.
     * @throws atom::error::InvalidArgument if the record has no id
     * @throws SqlExecutionError if the update fails
     */
    int update(model::Record& record,
               const hooks::OperationContext& context = {});

    /**
     * @brief Inserts records in one transaction; all or nothing.
     * @throws TransactionError or SqlExecutionError on failure
     */
    void insertAll(std::vector<model::Record>& records,
                   const hooks::OperationContext& context = {});

    /**
     * @brief Loads the record with the given id.
     */
    [[nodiscard]] std::optional<model::Record> find(
        const model::RecordKind& kind, const json& id);

    /**
     * @brief Loads every record of a kind matching a condition.
     *
     * @param condition SQL condition with ? placeholders; empty matches all.
     * @param params Values bound to the placeholders.
     */
    [[nodiscard]] std::vector<model::Record> where(
        const model::RecordKind& kind, const std::string& condition = "",
        const std::vector<json>& params = {});

    /**
     * @brief Deletes the row with the record's id.
     * @return Number of rows deleted.
     */
    int remove(const model::Record& record);

    /**
     * @brief Loads the records related to an owner through a named relation.
     *
     * Returns nothing when the owner's join column is unset.
     *
     * @throws atom::error::InvalidArgument if the owner has no such relation
     */
    [[nodiscard]] std::vector<model::Record> related(
        const model::Record& owner, std::string_view relationName);

    [[nodiscard]] hooks::HookPipeline& pipeline() noexcept { return pipeline_; }

private:
    Session& session_;
    relation::RelationMappingStore& mappings_;
    hooks::HookPipeline pipeline_;

    [[nodiscard]] std::vector<model::Record> fetch(
        const model::RecordKind& kind, const query::QueryBuilder& query);

    [[nodiscard]] static model::Record recordFromRow(
        const model::RecordKind& kind, json row);

    [[nodiscard]] static json requireId(const model::Record& record,
                                        std::string_view action);
};

}  // namespace relata::engine

#endif  // RELATA_ENGINE_RECORD_STORE_HPP
