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

#include "database.hpp"

#include <spdlog/spdlog.h>

#include "statement.hpp"

namespace xrayref::database::core {

//------------------------------------------------------------------------------
// Database Implementation
//------------------------------------------------------------------------------

Database::Database(const std::string& db_name, int flags)
    : db(nullptr, sqlite3_close) {
    sqlite3* raw_db = nullptr;
    int result = sqlite3_open_v2(db_name.c_str(), &raw_db, flags, nullptr);
    db.reset(raw_db);

    if (result != SQLITE_OK) {
        std::string error_msg = "Can't open database: ";
        if (raw_db) {
            error_msg += sqlite3_errmsg(raw_db);
        } else {
            error_msg += "Unknown error";
        }
        spdlog::error("{}", error_msg);
        THROW_DATABASE_OPEN_ERROR(error_msg);
    }

    valid.store(true);
    try {
        execute("PRAGMA foreign_keys = ON;");
        spdlog::info("Database opened: {}", db_name);
    } catch (const std::exception& e) {
        valid.store(false);
        spdlog::error("Failed to configure database: {}", e.what());
        throw;
    }
}

Database::~Database() { valid.store(false); }

Database::Database(Database&& other) noexcept : db(std::move(other.db)) {
    valid.store(other.valid.load());
    other.valid.store(false);
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        db = std::move(other.db);
        valid.store(other.valid.load());
        other.valid.store(false);
    }
    return *this;
}

sqlite3* Database::get() {
    if (!valid.load()) {
        THROW_DATABASE_USAGE_ERROR(
            "Attempted to use an invalid database connection");
    }
    return db.get();
}

std::unique_ptr<Statement> Database::prepare(const std::string& sql) {
    if (!valid.load()) {
        THROW_DATABASE_USAGE_ERROR(
            "Attempted to prepare statement on invalid database connection");
    }
    return std::make_unique<Statement>(*this, sql);
}

void Database::execute(const std::string& sql) {
    if (!valid.load()) {
        THROW_DATABASE_USAGE_ERROR(
            "Attempted to execute SQL on invalid database connection");
    }

    char* errMsg = nullptr;
    int result = sqlite3_exec(db.get(), sql.c_str(), nullptr, nullptr, &errMsg);

    if (result != SQLITE_OK) {
        std::string error = "SQL Error: ";
        if (errMsg) {
            error += errMsg;
            sqlite3_free(errMsg);
        } else {
            error += "Unknown error";
        }
        spdlog::error("{}", error);
        THROW_SQL_EXECUTION_ERROR(error);
    }
}

bool Database::isValid() const noexcept { return valid.load(); }

void Database::interrupt() noexcept {
    if (valid.load()) {
        sqlite3_interrupt(db.get());
    }
}

}  // namespace xrayref::database::core
