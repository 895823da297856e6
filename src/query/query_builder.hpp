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

#ifndef RELATA_QUERY_QUERY_BUILDER_HPP
#define RELATA_QUERY_QUERY_BUILDER_HPP

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace relata::query {

using json = nlohmann::json;

/**
 * @brief Fluent builder for SELECT statements with positional parameters.
 *
 * Relation filters receive the builder of the relation's query and narrow
 * it with where()/andWhere()/orWhere()/orderBy()/limit().
 */
class QueryBuilder {
public:
    /**
     * @brief Constructs a QueryBuilder selecting from a table.
     *
     * @param tableName The table to select from.
     */
    explicit QueryBuilder(std::string tableName);

    /**
     * @brief Replaces the selected columns (default "*").
     */
    QueryBuilder& select(const std::vector<std::string>& columns);

    /**
     * @brief Appends one column expression to the selection.
     */
    QueryBuilder& addSelect(const std::string& column);

    /**
     * @brief Adds a condition joined with AND, binding one value per "?".
     *
     * @param condition The SQL condition.
     * @param params Values bound to the condition's placeholders in order.
     */
    QueryBuilder& where(const std::string& condition,
                        const std::vector<json>& params = {});

    QueryBuilder& andWhere(const std::string& condition);

    QueryBuilder& orWhere(const std::string& condition);

    /**
     * @brief Restricts the query to rows matching a condition.
     *
     * The condition becomes the first WHERE term and the existing
     * conditions are ANDed after it as one group, so an earlier orWhere()
     * cannot widen the result past it. Its parameters are bound first.
     */
    QueryBuilder& scopeBy(const std::string& condition,
                          const std::vector<json>& params = {});

    /**
     * @brief Adds a join clause.
     *
     * @param table The joined table.
     * @param condition The ON condition.
     * @param joinType INNER, LEFT, ...
     */
    QueryBuilder& join(const std::string& table, const std::string& condition,
                       const std::string& joinType = "INNER");

    QueryBuilder& orderBy(const std::string& column, bool asc = true);

    QueryBuilder& limit(int limit);

    QueryBuilder& offset(int offset);

    /**
     * @brief Builds the SELECT statement.
     * @throws atom::error::InvalidArgument if the query is inconsistent
     */
    [[nodiscard]] std::string build() const;

    /**
     * @brief Builds a COUNT(*) statement over the same FROM/JOIN/WHERE.
     */
    [[nodiscard]] std::string buildCount() const;

    /**
     * @brief Checks the table name and LIMIT/OFFSET combination.
     */
    void validate() const;

    [[nodiscard]] const std::string& getTableName() const noexcept {
        return tableName;
    }

    [[nodiscard]] const std::vector<json>& getParamValues() const noexcept {
        return paramValues;
    }

    [[nodiscard]] size_t getParamCount() const noexcept {
        return paramValues.size();
    }

private:
    std::string tableName;                    ///< The table to select from.
    std::vector<std::string> selectColumns;   ///< The selected columns.
    std::vector<std::string> whereConditions; ///< Conditions with connectives.
    std::vector<std::string> joinClauses;     ///< The join clauses.
    std::string orderByClause;                ///< The order by clause.
    int limitValue = -1;                      ///< LIMIT, -1 for none.
    int offsetValue = 0;                      ///< OFFSET.
    std::vector<json> paramValues;            ///< Bound parameter values.

    void appendCondition(const std::string& connective,
                         const std::string& condition);
    void appendFromClause(std::string& sql) const;
};

}  // namespace relata::query

#endif  // RELATA_QUERY_QUERY_BUILDER_HPP
