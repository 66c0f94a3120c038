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

#include "sqlite_executor.hpp"

#include <spdlog/spdlog.h>

#include <utility>

#include "core/statement.hpp"

namespace xrayref::database {

SqliteQueryExecutor::SqliteQueryExecutor(std::shared_ptr<core::Database> db)
    : db_(std::move(db)) {
    if (!db_ || !db_->isValid()) {
        THROW_DATABASE_USAGE_ERROR(
            "SqliteQueryExecutor requires an open database connection");
    }
}

std::unique_ptr<SqliteQueryExecutor> SqliteQueryExecutor::open(
    const std::string& path) {
    return std::make_unique<SqliteQueryExecutor>(
        std::make_shared<core::Database>(path, SQLITE_OPEN_READONLY));
}

std::vector<ResultRow> SqliteQueryExecutor::execute(
    const std::string& sql, const std::vector<query::ParamValue>& params) {
    auto stmt = db_->prepare(sql);

    if (static_cast<size_t>(stmt->getParameterCount()) != params.size()) {
        THROW_STATEMENT_PREPARE_ERROR(
            "Query expects " + std::to_string(stmt->getParameterCount()) +
            " parameters, got " + std::to_string(params.size()));
    }

    int index = 1;
    for (const auto& param : params) {
        std::visit(
            [&stmt, index](const auto& value) { stmt->bind(index, value); },
            param);
        ++index;
    }

    std::vector<ResultRow> rows;
    const int columnCount = stmt->getColumnCount();
    while (stmt->step()) {
        ResultRow row;
        row.reserve(columnCount);
        for (int col = 0; col < columnCount; ++col) {
            switch (stmt->getColumnType(col)) {
                case SQLITE_INTEGER:
                    row.emplace_back(stmt->getInt64(col));
                    break;
                case SQLITE_FLOAT:
                    row.emplace_back(stmt->getDouble(col));
                    break;
                case SQLITE_NULL:
                    row.emplace_back(std::monostate{});
                    break;
                default:
                    row.emplace_back(stmt->getText(col));
                    break;
            }
        }
        rows.push_back(std::move(row));
    }

    spdlog::debug("Query returned {} row(s)", rows.size());
    return rows;
}

void SqliteQueryExecutor::interrupt() noexcept { db_->interrupt(); }

}  // namespace xrayref::database
