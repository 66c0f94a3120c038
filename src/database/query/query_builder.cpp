// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * XrayRef - Reference data resolution for X-ray spectroscopy
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

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <string_view>

#include "../core/types.hpp"

namespace xrayref::database::query {

namespace {

constexpr std::array<std::string_view, 8> SUPPORTED_OPERATORS = {
    "=", "!=", "<>", "<", "<=", ">", ">=", "LIKE"};

bool isIdentifier(const std::string& name) {
    if (name.empty() ||
        std::isdigit(static_cast<unsigned char>(name.front()))) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_';
    });
}

void requireIdentifier(const std::string& name, const char* what) {
    if (!isIdentifier(name)) {
        THROW_QUERY_BUILD_ERROR(std::string("Invalid ") + what + " name: '" +
                                name + "'");
    }
}

void requireOperator(const std::string& op) {
    if (std::find(SUPPORTED_OPERATORS.begin(), SUPPORTED_OPERATORS.end(),
                  op) == SUPPORTED_OPERATORS.end()) {
        THROW_QUERY_BUILD_ERROR("Unsupported operator: '" + op + "'");
    }
}

}  // namespace

//------------------------------------------------------------------------------
// QueryBuilder Implementation
//------------------------------------------------------------------------------

QueryBuilder::QueryBuilder(const std::string& tableName)
    : tableName(tableName) {
    requireIdentifier(tableName, "table");
}

QueryBuilder& QueryBuilder::addSelect(const std::string& table,
                                      const std::string& column) {
    requireIdentifier(table, "table");
    requireIdentifier(column, "column");
    selectColumns.push_back({table, column});
    return *this;
}

QueryBuilder& QueryBuilder::addJoin(const std::string& targetTable,
                                    const std::string& targetKey,
                                    const std::string& fromTable,
                                    const std::string& fromKey,
                                    const std::string& alias) {
    requireIdentifier(targetTable, "table");
    requireIdentifier(targetKey, "column");
    requireIdentifier(fromTable, "table");
    requireIdentifier(fromKey, "column");

    Join join{targetTable, targetKey, fromTable, fromKey,
              alias.empty() ? targetTable : alias};
    requireIdentifier(join.alias, "alias");

    if (!hasTable(fromTable)) {
        THROW_QUERY_BUILD_ERROR("Cannot join " + join.alias +
                                " from unknown table '" + fromTable + "'");
    }

    if (join.alias == tableName) {
        // Joining the FROM table onto itself by the same key adds nothing
        if (targetTable == tableName && fromTable == tableName &&
            targetKey == fromKey) {
            return *this;
        }
        THROW_QUERY_BUILD_ERROR("Alias '" + join.alias +
                                "' is already used by the FROM table");
    }

    auto existing = std::find_if(
        joins.begin(), joins.end(),
        [&join](const Join& other) { return other.alias == join.alias; });
    if (existing != joins.end()) {
        if (*existing == join) {
            return *this;
        }
        THROW_QUERY_BUILD_ERROR("Conflicting join for alias '" + join.alias +
                                "': " + existing->fromTable + "." +
                                existing->fromKey + " vs " + fromTable + "." +
                                fromKey);
    }

    joins.push_back(std::move(join));
    return *this;
}

QueryBuilder& QueryBuilder::addWhere(
    const std::vector<Predicate>& alternatives) {
    if (alternatives.empty()) {
        THROW_QUERY_BUILD_ERROR("WHERE condition needs at least one predicate");
    }
    for (const auto& predicate : alternatives) {
        requireIdentifier(predicate.table, "table");
        requireIdentifier(predicate.column, "column");
        requireOperator(predicate.op);
    }
    whereConditions.push_back(alternatives);
    return *this;
}

QueryBuilder& QueryBuilder::addOrderBy(const std::string& table,
                                       const std::string& column, bool asc) {
    requireIdentifier(table, "table");
    requireIdentifier(column, "column");
    orderByColumns.push_back({{table, column}, asc});
    return *this;
}

bool QueryBuilder::hasTable(const std::string& alias) const {
    if (alias == tableName) {
        return true;
    }
    return std::any_of(joins.begin(), joins.end(), [&alias](const Join& join) {
        return join.alias == alias;
    });
}

size_t QueryBuilder::getParamCount() const {
    size_t count = 0;
    for (const auto& condition : whereConditions) {
        count += condition.size();
    }
    return count;
}

BuiltQuery QueryBuilder::build() const {
    // Validate query parameters before building
    validate();

    BuiltQuery query;
    std::stringstream sql;

    // SELECT clause
    sql << "SELECT ";
    if (selectColumns.empty()) {
        sql << "*";
    } else {
        bool first = true;
        for (const auto& column : selectColumns) {
            if (!first)
                sql << ", ";
            sql << column.table << "." << column.column;
            first = false;
        }
    }

    // FROM clause
    sql << " FROM " << tableName;

    // JOIN clauses
    for (const auto& join : joins) {
        sql << " JOIN " << join.targetTable;
        if (join.alias != join.targetTable) {
            sql << " AS " << join.alias;
        }
        sql << " ON " << join.alias << "." << join.targetKey << " = "
            << join.fromTable << "." << join.fromKey;
    }

    // WHERE clause
    if (!whereConditions.empty()) {
        sql << " WHERE ";
        bool firstCondition = true;
        for (const auto& alternatives : whereConditions) {
            if (!firstCondition)
                sql << " AND ";
            if (alternatives.size() > 1)
                sql << "(";
            bool firstAlternative = true;
            for (const auto& predicate : alternatives) {
                if (!firstAlternative)
                    sql << " OR ";
                sql << predicate.table << "." << predicate.column << " "
                    << predicate.op << " ?";
                query.params.push_back(predicate.value);
                firstAlternative = false;
            }
            if (alternatives.size() > 1)
                sql << ")";
            firstCondition = false;
        }
    }

    // ORDER BY clause
    if (!orderByColumns.empty()) {
        sql << " ORDER BY ";
        bool first = true;
        for (const auto& order : orderByColumns) {
            if (!first)
                sql << ", ";
            sql << order.column.table << "." << order.column.column
                << (order.asc ? " ASC" : " DESC");
            first = false;
        }
    }

    query.sql = sql.str();
    return query;
}

void QueryBuilder::validate() const {
    for (const auto& column : selectColumns) {
        if (!hasTable(column.table)) {
            THROW_QUERY_BUILD_ERROR("SELECT references unknown table '" +
                                    column.table + "'");
        }
    }
    for (const auto& alternatives : whereConditions) {
        for (const auto& predicate : alternatives) {
            if (!hasTable(predicate.table)) {
                THROW_QUERY_BUILD_ERROR("WHERE references unknown table '" +
                                        predicate.table + "'");
            }
        }
    }
    for (const auto& order : orderByColumns) {
        if (!hasTable(order.column.table)) {
            THROW_QUERY_BUILD_ERROR("ORDER BY references unknown table '" +
                                    order.column.table + "'");
        }
    }
}

}  // namespace xrayref::database::query
