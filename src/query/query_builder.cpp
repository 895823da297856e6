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

#include "query_builder.hpp"

#include "atom/error/exception.hpp"

namespace relata::query {

//------------------------------------------------------------------------------
// QueryBuilder Implementation
//------------------------------------------------------------------------------

QueryBuilder::QueryBuilder(std::string tableName)
    : tableName(std::move(tableName)), selectColumns({"*"}) {}

QueryBuilder& QueryBuilder::select(const std::vector<std::string>& columns) {
    if (!columns.empty()) {
        selectColumns = columns;
    }
    return *this;
}

QueryBuilder& QueryBuilder::addSelect(const std::string& column) {
    if (!column.empty()) {
        selectColumns.push_back(column);
    }
    return *this;
}

QueryBuilder& QueryBuilder::where(const std::string& condition,
                                  const std::vector<json>& params) {
    if (!condition.empty()) {
        appendCondition("AND", condition);
        paramValues.insert(paramValues.end(), params.begin(), params.end());
    }
    return *this;
}

QueryBuilder& QueryBuilder::andWhere(const std::string& condition) {
    if (!condition.empty()) {
        appendCondition("AND", condition);
    }
    return *this;
}

QueryBuilder& QueryBuilder::orWhere(const std::string& condition) {
    if (!condition.empty()) {
        appendCondition("OR", condition);
    }
    return *this;
}

QueryBuilder& QueryBuilder::scopeBy(const std::string& condition,
                                    const std::vector<json>& params) {
    if (condition.empty()) {
        return *this;
    }

    std::vector<std::string> scoped{"(" + condition + ")"};
    if (whereConditions.size() == 1) {
        scoped.push_back("AND " + whereConditions.front());
    } else if (!whereConditions.empty()) {
        std::string group;
        for (size_t i = 0; i < whereConditions.size(); ++i) {
            if (i > 0)
                group += " ";
            group += whereConditions[i];
        }
        scoped.push_back("AND (" + group + ")");
    }
    whereConditions = std::move(scoped);
    paramValues.insert(paramValues.begin(), params.begin(), params.end());
    return *this;
}

QueryBuilder& QueryBuilder::join(const std::string& table,
                                 const std::string& condition,
                                 const std::string& joinType) {
    joinClauses.push_back(joinType + " JOIN " + table + " ON " + condition);
    return *this;
}

QueryBuilder& QueryBuilder::orderBy(const std::string& column, bool asc) {
    orderByClause = column + (asc ? " ASC" : " DESC");
    return *this;
}

QueryBuilder& QueryBuilder::limit(int limit) {
    if (limit >= 0) {
        limitValue = limit;
    }
    return *this;
}

QueryBuilder& QueryBuilder::offset(int offset) {
    if (offset >= 0) {
        offsetValue = offset;
    }
    return *this;
}

std::string QueryBuilder::build() const {
    validate();

    std::string sql = "SELECT ";
    for (size_t i = 0; i < selectColumns.size(); ++i) {
        if (i > 0)
            sql += ", ";
        sql += selectColumns[i];
    }
    appendFromClause(sql);

    if (!orderByClause.empty()) {
        sql += " ORDER BY " + orderByClause;
    }
    if (limitValue >= 0) {
        sql += " LIMIT " + std::to_string(limitValue);
    }
    if (offsetValue > 0) {
        sql += " OFFSET " + std::to_string(offsetValue);
    }
    return sql;
}

std::string QueryBuilder::buildCount() const {
    validate();

    std::string sql = "SELECT COUNT(*)";
    appendFromClause(sql);
    return sql;
}

void QueryBuilder::validate() const {
    if (tableName.empty()) {
        THROW_INVALID_ARGUMENT("Table name cannot be empty");
    }
    if (offsetValue > 0 && limitValue < 0) {
        THROW_INVALID_ARGUMENT("OFFSET cannot be used without LIMIT");
    }
}

void QueryBuilder::appendCondition(const std::string& connective,
                                   const std::string& condition) {
    if (whereConditions.empty()) {
        whereConditions.push_back("(" + condition + ")");
    } else {
        whereConditions.push_back(connective + " (" + condition + ")");
    }
}

void QueryBuilder::appendFromClause(std::string& sql) const {
    sql += " FROM " + tableName;
    for (const auto& join : joinClauses) {
        sql += " " + join;
    }
    if (!whereConditions.empty()) {
        sql += " WHERE ";
        for (size_t i = 0; i < whereConditions.size(); ++i) {
            if (i > 0)
                sql += " ";
            sql += whereConditions[i];
        }
    }
}

}  // namespace relata::query
