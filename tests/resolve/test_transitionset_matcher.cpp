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
 * test_transitionset_matcher.cpp
 *
 * Tests for the transition set matcher against a scripted executor
 * - Exact matches and rejected supersets
 * - Early exit when no candidate remains
 * - Ambiguous stores
 * - Cancellation
 * - Membership query shape
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <map>
#include <stop_token>
#include <vector>

#include "database/core/types.hpp"
#include "mock_query_executor.hpp"
#include "model/types.hpp"
#include "resolve/transitionset_matcher.hpp"
#include "resolve/types.hpp"

using namespace xrayref::resolve;
using namespace xrayref::model;
using xrayref::database::ResultRow;
using xrayref::database::query::ParamValue;
using xrayref::test::MockQueryExecutor;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

namespace {
const AtomicSubshell K(1, 0, 1);
const AtomicSubshell L1(2, 0, 1);
const AtomicSubshell L2(2, 1, 1);
const AtomicSubshell L3(2, 1, 3);

// Rebuilds the transition from the six membership query parameters
Transition transitionOf(const std::vector<ParamValue>& params) {
    auto at = [&params](size_t i) {
        return static_cast<int>(std::get<int64_t>(params.at(i)));
    };
    return Transition(at(0), at(1), at(2), at(3), at(4), at(5));
}
}  // namespace

// ==================== Matcher Tests ====================

class TransitionSetMatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Set 1 = {L2 -> K, L3 -> K}, set 2 = {L2 -> K}
        memberships[Transition(L2, K)] = {ResultRow{int64_t{1}, int64_t{2}},
                                          ResultRow{int64_t{2}, int64_t{1}}};
        memberships[Transition(L3, K)] = {ResultRow{int64_t{1}, int64_t{2}}};

        ON_CALL(executor, execute(_, _))
            .WillByDefault(Invoke([this](const std::string&,
                                         const std::vector<ParamValue>& params) {
                auto it = memberships.find(transitionOf(params));
                if (it == memberships.end()) {
                    return std::vector<ResultRow>{};
                }
                return it->second;
            }));
    }

    void TearDown() override { memberships.clear(); }

    std::map<Transition, std::vector<ResultRow>> memberships;
    ::testing::NiceMock<MockQueryExecutor> executor;
};

TEST_F(TransitionSetMatcherTest, MatchesExactSet) {
    EXPECT_CALL(executor, execute(_, _)).Times(2);

    TransitionSet requested{Transition(L2, K), Transition(L3, K)};
    EXPECT_EQ(matchTransitionSet(requested, executor), 1);
}

TEST_F(TransitionSetMatcherTest, RejectsSuperset) {
    TransitionSet requested{Transition(L2, K)};
    EXPECT_EQ(matchTransitionSet(requested, executor), 2);
}

TEST_F(TransitionSetMatcherTest, OnlySupersetStoredIsNotFound) {
    TransitionSet requested{Transition(L3, K)};
    try {
        (void)matchTransitionSet(requested, executor);
        FAIL() << "Expected NotFound";
    } catch (const NotFound& e) {
        EXPECT_EQ(e.kind(), EntityKind::TransitionSet);
        EXPECT_EQ(e.value(), requested.toString());
    }
}

TEST_F(TransitionSetMatcherTest, StopsAtFirstEmptyRound) {
    // L1 -> K sorts first and belongs to no stored set
    EXPECT_CALL(executor, execute(_, _)).Times(1);

    TransitionSet requested{Transition(L1, K), Transition(L2, K),
                            Transition(L3, K)};
    EXPECT_THROW((void)matchTransitionSet(requested, executor), NotFound);
}

TEST_F(TransitionSetMatcherTest, DisjointCandidatesAreNotFound) {
    memberships[Transition(L3, K)] = {ResultRow{int64_t{3}, int64_t{2}}};

    TransitionSet requested{Transition(L2, K), Transition(L3, K)};
    EXPECT_THROW((void)matchTransitionSet(requested, executor), NotFound);
}

TEST_F(TransitionSetMatcherTest, DuplicateStoredSetsAreAmbiguous) {
    memberships[Transition(L2, K)].push_back(
        ResultRow{int64_t{5}, int64_t{1}});

    TransitionSet requested{Transition(L2, K)};
    try {
        (void)matchTransitionSet(requested, executor);
        FAIL() << "Expected AmbiguousMatch";
    } catch (const AmbiguousMatch& e) {
        EXPECT_EQ(e.kind(), EntityKind::TransitionSet);
        EXPECT_EQ(e.candidates(), (std::vector<int64_t>{2, 5}));
    }
}

TEST_F(TransitionSetMatcherTest, CancelledBeforeFirstRound) {
    EXPECT_CALL(executor, execute(_, _)).Times(0);

    std::stop_source source;
    source.request_stop();

    TransitionSet requested{Transition(L2, K), Transition(L3, K)};
    EXPECT_THROW(
        (void)matchTransitionSet(requested, executor, source.get_token()),
        ResolutionCancelled);
}

TEST_F(TransitionSetMatcherTest, CancelledBetweenRounds) {
    std::stop_source source;
    EXPECT_CALL(executor, execute(_, _))
        .WillOnce(Invoke([&source](const std::string&,
                                   const std::vector<ParamValue>&) {
            source.request_stop();
            return std::vector<ResultRow>{ResultRow{int64_t{1}, int64_t{2}}};
        }));

    TransitionSet requested{Transition(L2, K), Transition(L3, K)};
    EXPECT_THROW(
        (void)matchTransitionSet(requested, executor, source.get_token()),
        ResolutionCancelled);
}

TEST_F(TransitionSetMatcherTest, BackendErrorsPropagate) {
    EXPECT_CALL(executor, execute(_, _))
        .WillOnce(Invoke([](const std::string&,
                            const std::vector<ParamValue>&)
                             -> std::vector<ResultRow> {
            THROW_SQL_EXECUTION_ERROR("disk I/O error");
        }));

    TransitionSet requested{Transition(L2, K)};
    EXPECT_THROW((void)matchTransitionSet(requested, executor),
                 xrayref::database::core::SqlExecutionError);
}

TEST_F(TransitionSetMatcherTest, NonIntegerCellIsABackendError) {
    EXPECT_CALL(executor, execute(_, _))
        .WillOnce(Return(std::vector<ResultRow>{
            ResultRow{std::string("1"), int64_t{1}}}));

    TransitionSet requested{Transition(L2, K)};
    EXPECT_THROW((void)matchTransitionSet(requested, executor),
                 xrayref::database::core::SqlExecutionError);
}

TEST_F(TransitionSetMatcherTest, BuildFromRawTransitions) {
    std::vector<RawTransition> requested{
        std::vector<int>{2, 1, 1, 1, 0, 1},
        std::vector<int>{2, 1, 3, 1, 0, 1},
        Transition(L2, K),
    };
    EXPECT_EQ(buildTransitionSetMatch(requested, executor), 1);
}

TEST_F(TransitionSetMatcherTest, BuildFromEmptyInputIsInvalid) {
    EXPECT_CALL(executor, execute(_, _)).Times(0);
    EXPECT_THROW((void)buildTransitionSetMatch({}, executor), ValidationError);
}

// ==================== Membership Query Tests ====================

TEST(MembershipQueryTest, SelectsSetIdAndCount) {
    auto query = buildMembershipQuery(Transition(L3, K));

    EXPECT_EQ(query.sql.rfind("SELECT transitionset_association.transitionset_id, "
                              "transitionset.count FROM "
                              "transitionset_association",
                              0),
              0u);
    EXPECT_NE(query.sql.find("JOIN transition ON transition.id = "
                             "transitionset_association.transition_id"),
              std::string::npos);
    EXPECT_NE(query.sql.find("JOIN atomic_shell AS dstshell"),
              std::string::npos);

    std::vector<ParamValue> expected{int64_t{2}, int64_t{1}, int64_t{3},
                                     int64_t{1}, int64_t{0}, int64_t{1}};
    EXPECT_EQ(query.params, expected);
}
