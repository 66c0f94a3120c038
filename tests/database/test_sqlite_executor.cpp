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

/*
 * test_sqlite_executor.cpp
 *
 * Tests for SqliteQueryExecutor
 * - Positional binding of every parameter type
 * - Cell types of result rows
 * - Parameter count checks
 * - Connection checks and read-only opening
 */

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <variant>

#include "database/core/database.hpp"
#include "database/core/types.hpp"
#include "database/query/query_builder.hpp"
#include "database/sqlite_executor.hpp"

using namespace xrayref::database;
using namespace xrayref::database::core;
using xrayref::database::query::ParamValue;
using xrayref::database::query::QueryBuilder;

// ==================== SqliteQueryExecutor Tests ====================

class SqliteQueryExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        db = std::make_shared<Database>(
            ":memory:", SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
        db->execute(
            "CREATE TABLE element (id INTEGER PRIMARY KEY, atomic_number "
            "INTEGER);"
            "CREATE TABLE element_symbol (element_id INTEGER, symbol TEXT, "
            "mass REAL, note TEXT);"
            "INSERT INTO element VALUES (1, 26), (2, 29);"
            "INSERT INTO element_symbol VALUES (1, 'Fe', 55.845, NULL), "
            "(2, 'Cu', 63.546, 'copper');");
        executor = std::make_unique<SqliteQueryExecutor>(db);
    }

    void TearDown() override {
        executor.reset();
        db.reset();
    }

    std::shared_ptr<Database> db;
    std::unique_ptr<SqliteQueryExecutor> executor;
};

TEST_F(SqliteQueryExecutorTest, ReadsEveryCellType) {
    auto rows = executor->execute(
        "SELECT element_id, symbol, mass, note FROM element_symbol "
        "ORDER BY element_id",
        {});

    ASSERT_EQ(rows.size(), 2u);
    ASSERT_EQ(rows[0].size(), 4u);
    EXPECT_EQ(std::get<int64_t>(rows[0][0]), 1);
    EXPECT_EQ(std::get<std::string>(rows[0][1]), "Fe");
    EXPECT_DOUBLE_EQ(std::get<double>(rows[0][2]), 55.845);
    EXPECT_TRUE(std::holds_alternative<std::monostate>(rows[0][3]));
    EXPECT_EQ(std::get<std::string>(rows[1][3]), "copper");
}

TEST_F(SqliteQueryExecutorTest, BindsParametersInOrder) {
    auto rows = executor->execute(
        "SELECT element_id FROM element_symbol WHERE symbol = ? AND mass > ?",
        {ParamValue(std::string("Cu")), ParamValue(60.0)});

    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(std::get<int64_t>(rows[0][0]), 2);
}

TEST_F(SqliteQueryExecutorTest, ExecutesBuiltQueries) {
    QueryBuilder builder("element_symbol");
    builder.addSelect("element_symbol", "symbol")
        .addJoin("element", "id", "element_symbol", "element_id")
        .addWhere("element", "atomic_number", "=", 26);

    auto rows = executor->execute(builder.build());
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(std::get<std::string>(rows[0][0]), "Fe");
}

TEST_F(SqliteQueryExecutorTest, NoRows) {
    auto rows = executor->execute(
        "SELECT * FROM element WHERE atomic_number = ?",
        {ParamValue(int64_t{118})});
    EXPECT_TRUE(rows.empty());
}

TEST_F(SqliteQueryExecutorTest, ParameterCountMismatchThrows) {
    EXPECT_THROW(executor->execute(
                     "SELECT * FROM element WHERE atomic_number = ?", {}),
                 StatementPrepareError);
    EXPECT_THROW(executor->execute("SELECT * FROM element",
                                   {ParamValue(int64_t{1})}),
                 StatementPrepareError);
}

TEST_F(SqliteQueryExecutorTest, InvalidSqlThrows) {
    EXPECT_THROW(executor->execute("SELECT * FROM transitionset", {}),
                 StatementPrepareError);
}

TEST(SqliteQueryExecutorConstructionTest, RequiresConnection) {
    EXPECT_THROW(SqliteQueryExecutor(nullptr), DatabaseUsageError);
}

TEST(SqliteQueryExecutorConstructionTest, OpenMissingFileThrows) {
    EXPECT_THROW(SqliteQueryExecutor::open("/nonexistent/xrayref.sql"),
                 DatabaseOpenError);
}
