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

#ifndef XRAYREF_DATABASE_HPP
#define XRAYREF_DATABASE_HPP

/**
 * @file database.hpp
 * @brief Unified facade header for the xrayref database module.
 *
 * This header provides access to all database module components:
 * - Core: Database, Statement, exception types
 * - Query: QueryBuilder for join/filter composition
 * - Execution: QueryExecutor and its SQLite implementation
 *
 * @par Usage Example:
 * @code
 * #include "database/database.hpp"
 *
 * using namespace xrayref::database;
 *
 * auto executor = SqliteQueryExecutor::open("xrayref.sql");
 *
 * query::QueryBuilder qb("transition_energy");
 * qb.addSelect("transition_energy", "value_eV")
 *   .addJoin("element", "id", "transition_energy", "element_id")
 *   .addWhere("element", "atomic_number", "=", 26);
 * auto rows = executor->execute(qb.build());
 * @endcode
 */

// Core components
#include "core/database.hpp"
#include "core/statement.hpp"
#include "core/types.hpp"

// Query building
#include "query/query_builder.hpp"

// Execution
#include "executor.hpp"
#include "sqlite_executor.hpp"

#endif  // XRAYREF_DATABASE_HPP
