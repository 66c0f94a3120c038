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
 * test_enumeration.cpp
 *
 * Tests for subshell and transition enumeration
 */

#include <gtest/gtest.h>

#include <algorithm>

#include "model/enumeration.hpp"

using namespace xrayref::model;

TEST(EnumerationTest, SubshellsInShellOrderWithIndices) {
    auto subshells = enumerateSubshells(2);
    ASSERT_EQ(subshells.size(), 4u);

    EXPECT_EQ(subshells[0].subshell, AtomicSubshell(1, 0, 1));
    EXPECT_EQ(subshells[0].index, 1);
    EXPECT_EQ(subshells[1].subshell, AtomicSubshell(2, 0, 1));
    EXPECT_EQ(subshells[1].index, 1);
    EXPECT_EQ(subshells[2].subshell, AtomicSubshell(2, 1, 1));
    EXPECT_EQ(subshells[2].index, 2);
    EXPECT_EQ(subshells[3].subshell, AtomicSubshell(2, 1, 3));
    EXPECT_EQ(subshells[3].index, 3);
}

TEST(EnumerationTest, SubshellCountPerShellIsTwoNMinusOne) {
    EXPECT_EQ(enumerateSubshells(1).size(), 1u);
    EXPECT_EQ(enumerateSubshells(3).size(), 9u);
    EXPECT_EQ(enumerateSubshells(7).size(), 49u);
}

TEST(EnumerationTest, TransitionsGoInward) {
    auto transitions = enumerateTransitions(2);
    // L1, L2, L3 -> K; L2 -> L1; L3 -> L1, L2
    ASSERT_EQ(transitions.size(), 6u);
    for (const auto& transition : transitions) {
        EXPECT_NE(transition.source(), transition.destination());
        EXPECT_GE(transition.source().n(), transition.destination().n());
    }
    EXPECT_NE(std::find(transitions.begin(), transitions.end(),
                        Transition(AtomicSubshell(2, 1, 3),
                                   AtomicSubshell(2, 1, 1))),
              transitions.end());
    EXPECT_EQ(std::find(transitions.begin(), transitions.end(),
                        Transition(AtomicSubshell(2, 1, 1),
                                   AtomicSubshell(2, 1, 3))),
              transitions.end());
}

TEST(EnumerationTest, RadiativeSubset) {
    auto radiative = radiativeTransitions(2);
    ASSERT_EQ(radiative.size(), 2u);
    EXPECT_EQ(radiative[0],
              Transition(AtomicSubshell(2, 1, 1), AtomicSubshell(1, 0, 1)));
    EXPECT_EQ(radiative[1],
              Transition(AtomicSubshell(2, 1, 3), AtomicSubshell(1, 0, 1)));
}
