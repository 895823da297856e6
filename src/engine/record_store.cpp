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

#include "record_store.hpp"

#include <spdlog/spdlog.h>

#include "join_planner.hpp"
#include "statement.hpp"
#include "transaction.hpp"

namespace relata::engine {

namespace {

// Column/value pairs written for a record, audit timestamps included
std::vector<std::pair<std::string, json>> columnsOf(const model::Record& record,
                                                    bool includeId) {
    const auto& kind = record.kind();
    std::vector<std::pair<std::string, json>> columns;
    for (const auto& [column, value] : record.attributes().items()) {
        if (column == kind.idColumn() && (!includeId || value.is_null())) {
            continue;
        }
        if (kind.timestampsEnabled() && (column == kind.createdAtColumn() ||
                                         column == kind.updatedAtColumn())) {
            continue;
        }
        columns.emplace_back(column, value);
    }
    if (kind.timestampsEnabled()) {
        if (record.createdAt() && includeId) {
            columns.emplace_back(kind.createdAtColumn(),
                                 model::toEpochMillis(*record.createdAt()));
        }
        if (record.updatedAt()) {
            columns.emplace_back(kind.updatedAtColumn(),
                                 model::toEpochMillis(*record.updatedAt()));
        }
    }
    return columns;
}

// Pre-write state of a record, restored when its batch rolls back
struct RecordState {
    json attributes;
    std::optional<model::Timestamp> createdAt;
    std::optional<model::Timestamp> updatedAt;
};

}  // namespace

RecordStore::RecordStore(Session& session,
                         relation::RelationMappingStore& mappings,
                         hooks::HookPipeline pipeline)
    : session_(session), mappings_(mappings), pipeline_(std::move(pipeline)) {}

void RecordStore::insert(model::Record& record,
                         const hooks::OperationContext& context) {
    pipeline_.runBeforeInsert(record, context);

    const auto& kind = record.kind();
    const auto columns = columnsOf(record, true);

    std::string sql = "INSERT INTO " + kind.tableName();
    if (columns.empty()) {
        sql += " DEFAULT VALUES;";
    } else {
        std::string names;
        std::string placeholders;
        for (size_t i = 0; i < columns.size(); ++i) {
            if (i > 0) {
                names += ", ";
                placeholders += ", ";
            }
            names += columns[i].first;
            placeholders += "?";
        }
        sql += " (" + names + ") VALUES (" + placeholders + ");";
    }

    auto stmt = session_.prepare(sql);
    int index = 1;
    for (const auto& [column, value] : columns) {
        stmt->bind(index++, value);
    }
    spdlog::info("Inserting record with SQL: {}", stmt->getSql());
    stmt->execute();

    if (!record.has(kind.idColumn())) {
        record.set(kind.idColumn(), session_.lastInsertId());
    }
    spdlog::info("Record {} inserted into {}", record.id().dump(),
                 kind.tableName());
}

int RecordStore::update(model::Record& record,
                        const hooks::OperationContext& context) {
    const auto id = requireId(record, "update");
    pipeline_.runBeforeUpdate(record, context);

    const auto& kind = record.kind();
    const auto columns = columnsOf(record, false);
    if (columns.empty()) {
        spdlog::warn("Update of {} {} has no columns to write",
                     kind.tableName(), id.dump());
        return 0;
    }

    std::string sql = "UPDATE " + kind.tableName() + " SET ";
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) {
            sql += ", ";
        }
        sql += columns[i].first + " = ?";
    }
    sql += " WHERE " + kind.idColumn() + " = ?;";

    auto stmt = session_.prepare(sql);
    int index = 1;
    for (const auto& [column, value] : columns) {
        stmt->bind(index++, value);
    }
    stmt->bind(index, id);
    spdlog::info("Updating record with SQL: {}", stmt->getSql());
    stmt->execute();

    const int changed = session_.changes();
    spdlog::info("{} record(s) updated in {}", changed, kind.tableName());
    return changed;
}

void RecordStore::insertAll(std::vector<model::Record>& records,
                            const hooks::OperationContext& context) {
    if (records.empty()) {
        spdlog::warn("Batch insert called with empty records vector");
        return;
    }

    spdlog::info("Starting batch insert of {} records", records.size());
    std::vector<RecordState> states;
    states.reserve(records.size());
    for (const auto& record : records) {
        states.push_back(
            {record.attributes(), record.createdAt(), record.updatedAt()});
    }

    auto transaction = session_.beginTransaction();
    try {
        for (auto& record : records) {
            insert(record, context);
        }
        transaction->commit();
        spdlog::info("Batch insert completed successfully");
    } catch (const std::exception& e) {
        spdlog::error("Batch insert failed: {}", e.what());
        if (transaction->isActive()) {
            transaction->rollback();
        }
        // Ids and stamps assigned before the failure no longer exist
        for (size_t i = 0; i < records.size(); ++i) {
            records[i].attributes() = std::move(states[i].attributes);
            records[i].setCreatedAt(states[i].createdAt);
            records[i].setUpdatedAt(states[i].updatedAt);
        }
        throw;
    }
}

std::optional<model::Record> RecordStore::find(const model::RecordKind& kind,
                                               const json& id) {
    query::QueryBuilder query(kind.tableName());
    query.where(kind.idColumn() + " = ?", {id}).limit(1);

    auto records = fetch(kind, query);
    if (records.empty()) {
        return std::nullopt;
    }
    return std::move(records.front());
}

std::vector<model::Record> RecordStore::where(const model::RecordKind& kind,
                                              const std::string& condition,
                                              const std::vector<json>& params) {
    query::QueryBuilder query(kind.tableName());
    query.where(condition, params);
    return fetch(kind, query);
}

int RecordStore::remove(const model::Record& record) {
    const auto id = requireId(record, "remove");
    const auto& kind = record.kind();

    auto stmt = session_.prepare("DELETE FROM " + kind.tableName() +
                                 " WHERE " + kind.idColumn() + " = ?;");
    stmt->bind(1, id);
    spdlog::info("Deleting record with SQL: {}", stmt->getSql());
    stmt->execute();

    const int changed = session_.changes();
    spdlog::info("{} record(s) deleted from {}", changed, kind.tableName());
    return changed;
}

std::vector<model::Record> RecordStore::related(const model::Record& owner,
                                                std::string_view relationName) {
    auto mapping = mappings_.findRelation(owner.kind(), relationName);
    if (!mapping) {
        THROW_INVALID_ARGUMENT("Record kind " + owner.kind().name() +
                               " has no relation " + std::string(relationName));
    }

    const auto ownerSide = JoinPlanner::ownerColumn(*mapping, owner.kind());
    if (!owner.has(ownerSide.column)) {
        spdlog::debug("{}.{} is unset; {} has no related records",
                      ownerSide.table, ownerSide.column, mapping->name);
        return {};
    }

    return fetch(*mapping->target, JoinPlanner::plan(owner, *mapping));
}

std::vector<model::Record> RecordStore::fetch(const model::RecordKind& kind,
                                              const query::QueryBuilder& query) {
    auto stmt = session_.prepare(query.build());
    stmt->bindAll(query.getParamValues());
    spdlog::debug("Executing query: {}", stmt->getSql());

    std::vector<model::Record> results;
    while (stmt->step()) {
        results.push_back(recordFromRow(kind, stmt->getRow()));
    }
    spdlog::debug("Query returned {} results", results.size());
    return results;
}

model::Record RecordStore::recordFromRow(const model::RecordKind& kind,
                                         json row) {
    std::optional<model::Timestamp> createdAt;
    std::optional<model::Timestamp> updatedAt;

    if (kind.timestampsEnabled()) {
        auto lift = [&row](const std::string& column,
                           std::optional<model::Timestamp>& target) {
            auto it = row.find(column);
            if (it == row.end()) {
                return;
            }
            if (it->is_number_integer()) {
                target = model::fromEpochMillis(it->get<int64_t>());
            }
            row.erase(it);
        };
        lift(kind.createdAtColumn(), createdAt);
        lift(kind.updatedAtColumn(), updatedAt);
    }

    model::Record record(kind, std::move(row));
    record.setCreatedAt(createdAt);
    record.setUpdatedAt(updatedAt);
    return record;
}

json RecordStore::requireId(const model::Record& record,
                            std::string_view action) {
    auto id = record.id();
    if (id.is_null()) {
        THROW_INVALID_ARGUMENT("Cannot " + std::string(action) + " a " +
                               record.kind().name() + " record without " +
                               record.kind().idColumn());
    }
    return id;
}

}  // namespace relata::engine
