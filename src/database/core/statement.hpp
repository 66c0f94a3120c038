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

#ifndef XRAYREF_DATABASE_CORE_STATEMENT_HPP
#define XRAYREF_DATABASE_CORE_STATEMENT_HPP

#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <string>

#include "types.hpp"

namespace xrayref::database::core {

// Forward declaration
class Database;

class Statement {
public:
    /**
     * @brief Constructs a Statement object.
     *
     * @param db Reference to the database connection.
     * @param sql The SQL statement to prepare.
     * @throws StatementPrepareError if preparation fails
     */
    Statement(Database& db, const std::string& sql);

    // Non-copyable
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    /**
     * @brief Binds a 64-bit integer value to a parameter.
     *
     * @param index Parameter index (1-based).
     * @param value Integer value to bind.
     * @return Reference to this Statement for chaining.
     * @throws StatementPrepareError if binding fails
     */
    Statement& bind(int index, int64_t value);

    /**
     * @brief Binds a double value to a parameter.
     *
     * @param index Parameter index (1-based).
     * @param value Double value to bind.
     * @return Reference to this Statement for chaining.
     * @throws StatementPrepareError if binding fails
     */
    Statement& bind(int index, double value);

    /**
     * @brief Binds a string value to a parameter.
     *
     * @param index Parameter index (1-based).
     * @param value String value to bind.
     * @return Reference to this Statement for chaining.
     * @throws StatementPrepareError if binding fails
     */
    Statement& bind(int index, const std::string& value);

    /**
     * @brief Binds a null value to a parameter.
     *
     * @param index Parameter index (1-based).
     * @throws StatementPrepareError if binding fails
     */
    Statement& bindNull(int index);

    /**
     * @brief Steps through the statement results.
     *
     * @return True if a row was retrieved, false if no more rows.
     * @throws SqlExecutionError if stepping fails (including interruption)
     */
    bool step();

    /**
     * @brief Resets the statement for reuse.
     *
     * @throws StatementPrepareError if reset fails
     */
    Statement& reset();

    int64_t getInt64(int index) const;
    double getDouble(int index) const;
    std::string getText(int index) const;
    bool isNull(int index) const;

    /**
     * @brief SQLite storage class of a column in the current row
     * (SQLITE_INTEGER, SQLITE_FLOAT, SQLITE_TEXT, SQLITE_BLOB, SQLITE_NULL).
     */
    int getColumnType(int index) const;

    int getParameterCount() const;
    int getColumnCount() const;
    std::string getColumnName(int index) const;

    std::string getSql() const;

private:
    Database& db;
    std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> stmt{
        nullptr, sqlite3_finalize};
    std::string sql;

    /**
     * @brief Validates that an index is within the valid range.
     *
     * @param index The index to validate.
     * @param isParam Whether this is a parameter index (1-based) or a column
     * index (0-based).
     * @throws DatabaseUsageError if index is out of range
     */
    void validateIndex(int index, bool isParam) const;

    [[noreturn]] void failBinding(const char* what) const;
};

}  // namespace xrayref::database::core

#endif  // XRAYREF_DATABASE_CORE_STATEMENT_HPP
