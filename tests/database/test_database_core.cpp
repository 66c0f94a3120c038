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
 * test_database_core.cpp
 *
 * Tests for the core Database class functionality
 * - Database construction and validation
 * - Execute and prepare
 * - Move semantics
 * - Error handling
 */

#include <gtest/gtest.h>
#include <sqlite3.h>

#include <memory>
#include <type_traits>

#include "database/core/database.hpp"
#include "database/core/statement.hpp"
#include "database/core/types.hpp"

using namespace xrayref::database::core;

// ==================== DatabaseCore Tests ====================

class DatabaseCoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        db = std::make_unique<Database>(":memory:", SQLITE_OPEN_READWRITE |
                                                        SQLITE_OPEN_CREATE);
    }

    void TearDown() override { db.reset(); }

    std::unique_ptr<Database> db;
};

TEST_F(DatabaseCoreTest, ConstructorWithMemoryDatabase) {
    EXPECT_TRUE(db->isValid());
    EXPECT_NE(db->get(), nullptr);
    EXPECT_EQ(db->get(), db->get());
}

TEST_F(DatabaseCoreTest, ForeignKeysEnabled) {
    auto stmt = db->prepare("PRAGMA foreign_keys");
    ASSERT_TRUE(stmt->step());
    EXPECT_EQ(stmt->getInt64(0), 1);
}

TEST_F(DatabaseCoreTest, ExecuteMultipleStatements) {
    EXPECT_NO_THROW(db->execute(
        "CREATE TABLE element (id INTEGER PRIMARY KEY, atomic_number INTEGER);"
        "INSERT INTO element VALUES (1, 26), (2, 29);"));

    auto stmt = db->prepare("SELECT COUNT(*) FROM element");
    ASSERT_TRUE(stmt->step());
    EXPECT_EQ(stmt->getInt64(0), 2);
}

TEST_F(DatabaseCoreTest, ExecuteInvalidSQL) {
    EXPECT_THROW(db->execute("CREATE TABLE"), SqlExecutionError);
}

TEST_F(DatabaseCoreTest, PrepareInvalidSQL) {
    EXPECT_THROW(db->prepare("SELECT * FROM missing_table"),
                 StatementPrepareError);
}

TEST_F(DatabaseCoreTest, FailedToOpenDatabase) {
    EXPECT_THROW(Database("/nonexistent/path/xrayref.sql"), DatabaseOpenError);
}

TEST_F(DatabaseCoreTest, CopyDeleted) {
    EXPECT_FALSE(std::is_copy_constructible_v<Database>);
    EXPECT_FALSE(std::is_copy_assignable_v<Database>);
}

TEST_F(DatabaseCoreTest, MoveConstructorInvalidatesSource) {
    db->execute("CREATE TABLE ref (id INTEGER PRIMARY KEY, bibtexkey TEXT)");

    Database moved(std::move(*db));
    EXPECT_TRUE(moved.isValid());
    EXPECT_FALSE(db->isValid());
    EXPECT_NO_THROW(moved.execute("INSERT INTO ref VALUES (1, 'doe2016')"));
}

TEST_F(DatabaseCoreTest, MoveAssignmentInvalidatesSource) {
    Database other(":memory:", SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    other = std::move(*db);
    EXPECT_TRUE(other.isValid());
    EXPECT_FALSE(db->isValid());
}

TEST_F(DatabaseCoreTest, InvalidConnectionUsage) {
    Database moved(std::move(*db));
    EXPECT_THROW(db->get(), DatabaseUsageError);
    EXPECT_THROW(db->prepare("SELECT 1"), DatabaseUsageError);
    EXPECT_THROW(db->execute("SELECT 1"), DatabaseUsageError);
    EXPECT_NO_THROW(db->interrupt());
}

TEST_F(DatabaseCoreTest, InterruptIdleConnection) {
    db->interrupt();
    // No statement was running; the connection stays usable
    auto stmt = db->prepare("SELECT 1");
    EXPECT_TRUE(stmt->step());
}

TEST_F(DatabaseCoreTest, ErrorsDeriveFromAtomException) {
    EXPECT_THROW(db->execute("NOT SQL"), atom::error::Exception);
    EXPECT_THROW(db->prepare("NOT SQL"), atom::error::Exception);
}
