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

#include "statement.hpp"

#include <spdlog/spdlog.h>

#include "database.hpp"

namespace xrayref::database::core {

//------------------------------------------------------------------------------
// Statement Implementation
//------------------------------------------------------------------------------

Statement::Statement(Database& db, const std::string& sql)
    : db(db), stmt(nullptr, sqlite3_finalize), sql(sql) {
    sqlite3_stmt* raw_stmt = nullptr;
    int result =
        sqlite3_prepare_v2(db.get(), sql.c_str(), -1, &raw_stmt, nullptr);
    stmt.reset(raw_stmt);

    if (result != SQLITE_OK) {
        std::string error = "Failed to prepare SQL statement: ";
        error += sqlite3_errmsg(db.get());
        spdlog::error("{}", error);
        THROW_STATEMENT_PREPARE_ERROR(error);
    }

    spdlog::debug("Prepared statement: {}", sql);
}

void Statement::failBinding(const char* what) const {
    std::string error = std::string("Failed to bind ") + what + " parameter: ";
    error += sqlite3_errmsg(db.get());
    spdlog::error("{}", error);
    THROW_STATEMENT_PREPARE_ERROR(error);
}

Statement& Statement::bind(int index, int64_t value) {
    validateIndex(index, true);
    if (sqlite3_bind_int64(stmt.get(), index, value) != SQLITE_OK) {
        failBinding("int64");
    }
    return *this;
}

Statement& Statement::bind(int index, double value) {
    validateIndex(index, true);
    if (sqlite3_bind_double(stmt.get(), index, value) != SQLITE_OK) {
        failBinding("double");
    }
    return *this;
}

Statement& Statement::bind(int index, const std::string& value) {
    validateIndex(index, true);
    // SQLITE_TRANSIENT makes SQLite copy the data
    if (sqlite3_bind_text(stmt.get(), index, value.c_str(), -1,
                          SQLITE_TRANSIENT) != SQLITE_OK) {
        failBinding("text");
    }
    return *this;
}

Statement& Statement::bindNull(int index) {
    validateIndex(index, true);
    if (sqlite3_bind_null(stmt.get(), index) != SQLITE_OK) {
        failBinding("NULL");
    }
    return *this;
}

bool Statement::step() {
    int result = sqlite3_step(stmt.get());
    if (result == SQLITE_ROW) {
        return true;
    }

    if (result != SQLITE_DONE) {
        std::string error = "Failed to step statement: ";
        error += sqlite3_errmsg(db.get());
        spdlog::error("{}", error);
        THROW_SQL_EXECUTION_ERROR(error);
    }

    return false;
}

Statement& Statement::reset() {
    if (sqlite3_reset(stmt.get()) != SQLITE_OK) {
        std::string error = "Failed to reset statement: ";
        error += sqlite3_errmsg(db.get());
        spdlog::error("{}", error);
        THROW_STATEMENT_PREPARE_ERROR(error);
    }
    return *this;
}

int64_t Statement::getInt64(int index) const {
    validateIndex(index, false);
    return sqlite3_column_int64(stmt.get(), index);
}

double Statement::getDouble(int index) const {
    validateIndex(index, false);
    return sqlite3_column_double(stmt.get(), index);
}

std::string Statement::getText(int index) const {
    validateIndex(index, false);
    const unsigned char* text = sqlite3_column_text(stmt.get(), index);
    if (!text) {
        return "";
    }
    return reinterpret_cast<const char*>(text);
}

bool Statement::isNull(int index) const {
    return getColumnType(index) == SQLITE_NULL;
}

int Statement::getColumnType(int index) const {
    validateIndex(index, false);
    return sqlite3_column_type(stmt.get(), index);
}

int Statement::getParameterCount() const {
    return sqlite3_bind_parameter_count(stmt.get());
}

int Statement::getColumnCount() const {
    return sqlite3_column_count(stmt.get());
}

std::string Statement::getColumnName(int index) const {
    validateIndex(index, false);
    const char* name = sqlite3_column_name(stmt.get(), index);
    return name ? name : "";
}

std::string Statement::getSql() const { return sql; }

void Statement::validateIndex(int index, bool isParam) const {
    if (isParam) {
        // Parameter indices are 1-based
        if (index <= 0 || index > sqlite3_bind_parameter_count(stmt.get())) {
            THROW_DATABASE_USAGE_ERROR("Parameter index out of bounds: " +
                                       std::to_string(index));
        }
    } else {
        // Column indices are 0-based
        if (index < 0 || index >= sqlite3_column_count(stmt.get())) {
            THROW_DATABASE_USAGE_ERROR("Column index out of bounds: " +
                                       std::to_string(index));
        }
    }
}

}  // namespace xrayref::database::core
