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

#ifndef XRAYREF_DATABASE_QUERY_QUERY_BUILDER_HPP
#define XRAYREF_DATABASE_QUERY_QUERY_BUILDER_HPP

#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace xrayref::database::query {

/// A value bound to a `?` placeholder.
using ParamValue = std::variant<int64_t, double, std::string>;

/**
 * @brief One equality (or comparison) test in a WHERE clause.
 */
struct Predicate {
    std::string table;  ///< Table name or alias.
    std::string column;
    std::string op;
    ParamValue value;
};

/**
 * @brief The output of QueryBuilder::build().
 */
struct BuiltQuery {
    std::string sql;
    std::vector<ParamValue> params;  ///< In placeholder order.

    bool operator==(const BuiltQuery&) const = default;
};

/**
 * @brief Accumulates joins, filters and ordering for a SELECT over a
 * normalized schema.
 *
 * Several resolvers can feed the same builder, so the builder tolerates
 * repeated identical joins and only rejects a join that reuses an alias for
 * a different relation. Values are never interpolated into the SQL text;
 * every value becomes a positional `?` parameter. Table, column and alias
 * names must be plain identifiers.
 *
 * A builder is owned by one call and is not thread-safe.
 */
class QueryBuilder {
public:
    /**
     * @brief Constructs a QueryBuilder selecting from a table.
     *
     * @param tableName The FROM table.
     */
    explicit QueryBuilder(const std::string& tableName);

    /**
     * @brief Adds a column to the SELECT list. Without any, all columns
     * are selected.
     *
     * @param table Table name or alias.
     * @param column Column name.
     * @return A reference to the QueryBuilder instance.
     */
    QueryBuilder& addSelect(const std::string& table,
                            const std::string& column);

    /**
     * @brief Joins `targetTable` on `alias.targetKey = fromTable.fromKey`.
     *
     * Adding the same join twice is a no-op. A join from the FROM table to
     * itself on the same key is also a no-op.
     *
     * @param targetTable Table to join.
     * @param targetKey Column of the joined table.
     * @param fromTable Table name or alias already part of the query.
     * @param fromKey Column of `fromTable`.
     * @param alias Alias of the joined table (default: the table name).
     * @return A reference to the QueryBuilder instance.
     * @throws QueryBuildError if the alias is already bound to a different
     * relation, or `fromTable` is unknown
     */
    QueryBuilder& addJoin(const std::string& targetTable,
                          const std::string& targetKey,
                          const std::string& fromTable,
                          const std::string& fromKey,
                          const std::string& alias = "");

    /**
     * @brief Adds a single filter, AND-ed with the other filters.
     *
     * @tparam T Integral, floating point or string-like value.
     * @throws QueryBuildError if the operator is not supported
     */
    template <typename T>
    QueryBuilder& addWhere(const std::string& table, const std::string& column,
                           const std::string& op, T&& value);

    /**
     * @brief Adds a disjunction of filters, AND-ed with the other filters.
     *
     * @param alternatives Predicates compiled to `(p1 OR p2 OR ...)`.
     * @throws QueryBuildError if empty or an operator is not supported
     */
    QueryBuilder& addWhere(const std::vector<Predicate>& alternatives);

    /**
     * @brief Adds an ORDER BY term.
     *
     * @param asc Whether to order in ascending order (default is true).
     */
    QueryBuilder& addOrderBy(const std::string& table,
                             const std::string& column, bool asc = true);

    /**
     * @brief Builds the SQL text and its ordered parameters.
     *
     * Building does not modify the builder: repeated calls return equal
     * results.
     *
     * @throws QueryBuildError if the query references unknown tables
     */
    BuiltQuery build() const;

    /**
     * @brief Validates the accumulated query.
     *
     * @throws QueryBuildError if validation fails
     */
    void validate() const;

    /// Whether `alias` is the FROM table or an alias of a join.
    bool hasTable(const std::string& alias) const;

    const std::string& getTableName() const { return tableName; }

    size_t getJoinCount() const { return joins.size(); }

    size_t getParamCount() const;

private:
    struct Join {
        std::string targetTable;
        std::string targetKey;
        std::string fromTable;
        std::string fromKey;
        std::string alias;

        bool operator==(const Join&) const = default;
    };

    struct Column {
        std::string table;
        std::string column;
    };

    struct Order {
        Column column;
        bool asc;
    };

    std::string tableName;                     ///< The FROM table.
    std::vector<Column> selectColumns;         ///< The columns to select.
    std::vector<Join> joins;                   ///< Joins, in insertion order.
    std::vector<std::vector<Predicate>> whereConditions;  ///< AND of ORs.
    std::vector<Order> orderByColumns;         ///< ORDER BY terms.

    // Helper to convert a parameter value
    template <typename T>
    static ParamValue toParamValue(T&& value) {
        using D = std::decay_t<T>;
        if constexpr (std::is_same_v<D, ParamValue>) {
            return std::forward<T>(value);
        } else if constexpr (std::is_integral_v<D>) {
            return static_cast<int64_t>(value);
        } else if constexpr (std::is_floating_point_v<D>) {
            return static_cast<double>(value);
        } else {
            static_assert(std::is_convertible_v<D, std::string>,
                          "Unsupported parameter type");
            return std::string(std::forward<T>(value));
        }
    }
};

// Template method implementation

template <typename T>
QueryBuilder& QueryBuilder::addWhere(const std::string& table,
                                     const std::string& column,
                                     const std::string& op, T&& value) {
    return addWhere(std::vector<Predicate>{
        Predicate{table, column, op, toParamValue(std::forward<T>(value))}});
}

}  // namespace xrayref::database::query

#endif  // XRAYREF_DATABASE_QUERY_QUERY_BUILDER_HPP
