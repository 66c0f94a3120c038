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
 * test_query_builder.cpp
 *
 * Tests for the QueryBuilder class
 * - Select columns and FROM table
 * - Joins, aliases and alias conflicts
 * - Where conditions and disjunctions
 * - OrderBy
 * - Build stability and parameter order
 * - Validation
 */

#include <gtest/gtest.h>

#include <string>

#include "database/core/types.hpp"
#include "database/query/query_builder.hpp"

using namespace xrayref::database::query;
using namespace xrayref::database::core;

// ==================== QueryBuilder Tests ====================

class QueryBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {}

    void TearDown() override {}
};

TEST_F(QueryBuilderTest, SelectAllByDefault) {
    QueryBuilder builder("element");

    auto query = builder.build();
    EXPECT_EQ(query.sql, "SELECT * FROM element");
    EXPECT_TRUE(query.params.empty());
}

TEST_F(QueryBuilderTest, SelectColumns) {
    QueryBuilder builder("transition_energy");
    builder.addSelect("transition_energy", "value_eV")
        .addSelect("transition_energy", "reference_id");

    EXPECT_EQ(builder.build().sql,
              "SELECT transition_energy.value_eV, "
              "transition_energy.reference_id FROM transition_energy");
}

TEST_F(QueryBuilderTest, JoinAndWhere) {
    QueryBuilder builder("transition_energy");
    builder.addJoin("element", "id", "transition_energy", "element_id")
        .addWhere("element", "atomic_number", "=", 26);

    auto query = builder.build();
    EXPECT_EQ(query.sql,
              "SELECT * FROM transition_energy JOIN element ON element.id = "
              "transition_energy.element_id WHERE element.atomic_number = ?");
    ASSERT_EQ(query.params.size(), 1u);
    EXPECT_EQ(query.params[0], ParamValue(int64_t{26}));
}

TEST_F(QueryBuilderTest, SameTableUnderTwoAliases) {
    QueryBuilder builder("transition");
    builder
        .addJoin("atomic_subshell", "id", "transition", "source_subshell_id",
                 "srcsubshell")
        .addJoin("atomic_subshell", "id", "transition",
                 "destination_subshell_id", "dstsubshell");

    auto query = builder.build();
    EXPECT_EQ(builder.getJoinCount(), 2u);
    EXPECT_NE(query.sql.find("JOIN atomic_subshell AS srcsubshell ON "
                             "srcsubshell.id = transition.source_subshell_id"),
              std::string::npos);
    EXPECT_NE(query.sql.find("JOIN atomic_subshell AS dstsubshell ON "
                             "dstsubshell.id = "
                             "transition.destination_subshell_id"),
              std::string::npos);
}

TEST_F(QueryBuilderTest, RepeatedIdenticalJoinIsIgnored) {
    QueryBuilder builder("transition_energy");
    builder.addJoin("element", "id", "transition_energy", "element_id");
    builder.addJoin("element", "id", "transition_energy", "element_id");

    EXPECT_EQ(builder.getJoinCount(), 1u);
}

TEST_F(QueryBuilderTest, ConflictingJoinUnderSameAliasThrows) {
    QueryBuilder builder("transition");
    builder.addJoin("atomic_subshell", "id", "transition",
                    "source_subshell_id", "subshell");

    EXPECT_THROW(builder.addJoin("atomic_subshell", "id", "transition",
                                 "destination_subshell_id", "subshell"),
                 QueryBuildError);
}

TEST_F(QueryBuilderTest, SelfJoinOfFromTableIsIgnored) {
    QueryBuilder builder("transition");
    builder.addJoin("transition", "id", "transition", "id");

    EXPECT_EQ(builder.getJoinCount(), 0u);
    EXPECT_THROW(builder.addJoin("element", "id", "transition", "id",
                                 "transition"),
                 QueryBuildError);
}

TEST_F(QueryBuilderTest, JoinFromUnknownTableThrows) {
    QueryBuilder builder("transition");

    EXPECT_THROW(builder.addJoin("atomic_shell", "id", "srcsubshell",
                                 "atomic_shell_id", "srcshell"),
                 QueryBuildError);
}

TEST_F(QueryBuilderTest, DisjunctionIsParenthesized) {
    QueryBuilder builder("element_symbol");
    builder.addJoin("element_name", "element_id", "element_symbol",
                    "element_id");
    builder.addWhere({{"element_name", "name", "=", std::string("Iron")},
                      {"element_symbol", "symbol", "=", std::string("Iron")}});
    builder.addWhere("element_symbol", "reference_id", ">", 0);

    auto query = builder.build();
    EXPECT_NE(query.sql.find("WHERE (element_name.name = ? OR "
                             "element_symbol.symbol = ?) AND "
                             "element_symbol.reference_id > ?"),
              std::string::npos);
    ASSERT_EQ(query.params.size(), 3u);
    EXPECT_EQ(query.params[0], ParamValue(std::string("Iron")));
    EXPECT_EQ(query.params[1], ParamValue(std::string("Iron")));
    EXPECT_EQ(query.params[2], ParamValue(int64_t{0}));
    EXPECT_EQ(builder.getParamCount(), 3u);
}

TEST_F(QueryBuilderTest, ValuesAreNeverInterpolated) {
    QueryBuilder builder("element_symbol");
    builder.addWhere("element_symbol", "symbol", "=",
                     "Fe'; DROP TABLE element; --");

    auto query = builder.build();
    EXPECT_EQ(query.sql.find("DROP"), std::string::npos);
    EXPECT_EQ(query.params[0],
              ParamValue(std::string("Fe'; DROP TABLE element; --")));
}

TEST_F(QueryBuilderTest, FloatingPointParameters) {
    QueryBuilder builder("transition_energy");
    builder.addWhere("transition_energy", "value_eV", ">=", 6400.5);

    EXPECT_EQ(builder.build().params[0], ParamValue(6400.5));
}

TEST_F(QueryBuilderTest, OrderBy) {
    QueryBuilder builder("transition_energy");
    builder.addOrderBy("transition_energy", "reference_id")
        .addOrderBy("transition_energy", "value_eV", false);

    EXPECT_NE(builder.build().sql.find(
                  "ORDER BY transition_energy.reference_id ASC, "
                  "transition_energy.value_eV DESC"),
              std::string::npos);
}

TEST_F(QueryBuilderTest, BuildIsStable) {
    QueryBuilder builder("transition");
    builder
        .addJoin("atomic_subshell", "id", "transition", "source_subshell_id",
                 "srcsubshell")
        .addJoin("atomic_subshell", "id", "transition",
                 "destination_subshell_id", "dstsubshell")
        .addWhere("srcsubshell", "azimuthal_quantum_number", "=", 1)
        .addWhere("dstsubshell", "azimuthal_quantum_number", "=", 0);

    auto first = builder.build();
    auto second = builder.build();
    EXPECT_EQ(first, second);
}

TEST_F(QueryBuilderTest, UnsafeIdentifiersAreRejected) {
    EXPECT_THROW(QueryBuilder("element; DROP TABLE element"), QueryBuildError);

    QueryBuilder builder("element");
    EXPECT_THROW(builder.addSelect("element", "id, 1"), QueryBuildError);
    EXPECT_THROW(builder.addWhere("element", "1abc", "=", 1), QueryBuildError);
}

TEST_F(QueryBuilderTest, UnsupportedOperatorIsRejected) {
    QueryBuilder builder("element");
    EXPECT_THROW(builder.addWhere("element", "atomic_number", "IS", 1),
                 QueryBuildError);
}

TEST_F(QueryBuilderTest, EmptyDisjunctionIsRejected) {
    QueryBuilder builder("element");
    EXPECT_THROW(builder.addWhere(std::vector<Predicate>{}), QueryBuildError);
}

TEST_F(QueryBuilderTest, ValidateRejectsUnknownTables) {
    QueryBuilder builder("element");
    builder.addWhere("srcshell", "principal_quantum_number", "=", 1);

    EXPECT_THROW(builder.validate(), QueryBuildError);
    EXPECT_THROW(builder.build(), QueryBuildError);
    EXPECT_FALSE(builder.hasTable("srcshell"));
    EXPECT_TRUE(builder.hasTable("element"));
}
