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

#ifndef XRAYREF_DATABASE_SQLITE_EXECUTOR_HPP
#define XRAYREF_DATABASE_SQLITE_EXECUTOR_HPP

#include <memory>
#include <string>
#include <vector>

#include "core/database.hpp"
#include "executor.hpp"

namespace xrayref::database {

/**
 * @brief QueryExecutor backed by an SQLite connection.
 *
 * The connection is shared with the caller, who may keep using it (e.g. to
 * seed data) or interrupt a running query from another thread.
 */
class SqliteQueryExecutor : public QueryExecutor {
public:
    /**
     * @param db Open connection.
     * @throws DatabaseUsageError if db is null or not valid
     */
    explicit SqliteQueryExecutor(std::shared_ptr<core::Database> db);

    /**
     * @brief Opens `path` read-only and wraps the connection.
     *
     * @throws DatabaseOpenError if the file cannot be opened
     */
    static std::unique_ptr<SqliteQueryExecutor> open(const std::string& path);

    using QueryExecutor::execute;

    /**
     * @throws StatementPrepareError if the query cannot be prepared or bound
     * @throws SqlExecutionError if stepping fails or is interrupted
     */
    std::vector<ResultRow> execute(
        const std::string& sql,
        const std::vector<query::ParamValue>& params) override;

    /// Aborts the query currently running on the connection.
    void interrupt() noexcept;

    core::Database& database() { return *db_; }

private:
    std::shared_ptr<core::Database> db_;
};

}  // namespace xrayref::database

#endif  // XRAYREF_DATABASE_SQLITE_EXECUTOR_HPP
