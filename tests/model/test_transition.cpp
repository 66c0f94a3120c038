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
 * test_transition.cpp
 *
 * Tests for Transition
 * - Representation-independent equality
 * - Coster-Kronig and radiative classification
 * - Rendering
 */

#include <gtest/gtest.h>

#include <array>
#include <unordered_set>

#include "model/transition.hpp"
#include "model/types.hpp"

using namespace xrayref::model;

namespace {
const AtomicSubshell K(1, 0, 1);
const AtomicSubshell L2(2, 1, 1);
const AtomicSubshell L3(2, 1, 3);
}  // namespace

TEST(TransitionTest, SameTransitionFromEveryInputPath) {
    Transition fromSubshells(L3, K);
    Transition fromFlat(2, 1, 3, 1, 0, 1);
    Transition fromTriples(std::array<int, 3>{2, 1, 3},
                           std::array<int, 3>{1, 0, 1});

    EXPECT_EQ(fromSubshells, fromFlat);
    EXPECT_EQ(fromSubshells, fromTriples);

    std::unordered_set<Transition> transitions{fromSubshells, fromFlat,
                                               fromTriples};
    EXPECT_EQ(transitions.size(), 1u);
}

TEST(TransitionTest, DirectionMatters) {
    EXPECT_NE(Transition(L3, K), Transition(K, L3));
}

TEST(TransitionTest, InvalidQuantumNumbersPropagate) {
    EXPECT_THROW(Transition(2, 2, 3, 1, 0, 1), ValidationError);
    EXPECT_THROW(Transition(std::array<int, 3>{2, 1, 3},
                            std::array<int, 3>{0, 0, 1}),
                 ValidationError);
}

TEST(TransitionTest, Classification) {
    Transition ka1(L3, K);
    EXPECT_TRUE(ka1.isRadiative());
    EXPECT_FALSE(ka1.isCosterKronig());

    Transition l2l3(L3, L2);
    EXPECT_FALSE(l2l3.isRadiative());
    EXPECT_TRUE(l2l3.isCosterKronig());
}

TEST(TransitionTest, Rendering) {
    EXPECT_EQ(Transition(L2, K).toString(),
              "Transition([n=2, l=1, j=0.5] -> [n=1, l=0, j=0.5])");
}
