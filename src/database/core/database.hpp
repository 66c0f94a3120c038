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

#ifndef XRAYREF_DATABASE_CORE_DATABASE_HPP
#define XRAYREF_DATABASE_CORE_DATABASE_HPP

#include <sqlite3.h>
#include <atomic>
#include <memory>
#include <string>

#include "types.hpp"

namespace xrayref::database::core {

// Forward declarations
class Statement;

class Database {
public:
    /**
     * @brief Opens the specified SQLite database.
     *
     * Reference data is only read by the resolution layer, so lookups open
     * the file with SQLITE_OPEN_READONLY. Producers and test fixtures pass
     * read-write flags.
     *
     * @param db_name The name of the database file (or ":memory:").
     * @param flags SQLite open flags (default: SQLITE_OPEN_READONLY)
     * @throws DatabaseOpenError if database cannot be opened
     */
    explicit Database(const std::string& db_name,
                      int flags = SQLITE_OPEN_READONLY);

    ~Database();

    // Prevent copying
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Allow moving
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    /**
     * @brief Gets the SQLite database handle.
     *
     * @throws DatabaseUsageError if the connection is not valid
     */
    sqlite3* get();

    /**
     * @brief Creates a prepared statement from an SQL query.
     *
     * @param sql The SQL query to prepare.
     * @return A unique pointer to the created Statement.
     * @throws StatementPrepareError if statement preparation fails
     */
    std::unique_ptr<Statement> prepare(const std::string& sql);

    /**
     * @brief Executes one or more SQL statements directly, without
     * parameters. Used for DDL and seeding.
     *
     * @throws SqlExecutionError if execution fails
     */
    void execute(const std::string& sql);

    /**
     * @brief Check if database connection is valid
     */
    bool isValid() const noexcept;

    /**
     * @brief Aborts any statement currently running on this connection.
     *
     * The interrupted statement fails with SqlExecutionError. Safe to call
     * from another thread.
     */
    void interrupt() noexcept;

private:
    std::unique_ptr<sqlite3, decltype(&sqlite3_close)> db{nullptr,
                                                          sqlite3_close};
    std::atomic<bool> valid{false};
};

}  // namespace xrayref::database::core

#endif  // XRAYREF_DATABASE_CORE_DATABASE_HPP
