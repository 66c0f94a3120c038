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
 * test_element.cpp
 *
 * Tests for Element and AtomicShell
 * - Atomic number range
 * - Validation error details
 * - Ordering, hashing and rendering
 */

#include <gtest/gtest.h>

#include <sstream>
#include <unordered_set>

#include "model/atomic_shell.hpp"
#include "model/element.hpp"
#include "model/types.hpp"

using namespace xrayref::model;

// ==================== Element Tests ====================

class ElementTest : public ::testing::Test {
protected:
    void SetUp() override {}

    void TearDown() override {}
};

TEST_F(ElementTest, AcceptsEveryKnownAtomicNumber) {
    for (int z = 1; z <= 118; ++z) {
        EXPECT_EQ(Element(z).atomicNumber(), z);
    }
}

TEST_F(ElementTest, RejectsZero) { EXPECT_THROW(Element(0), ValidationError); }

TEST_F(ElementTest, RejectsAtomicNumberAbove118) {
    EXPECT_THROW(Element(119), ValidationError);
}

TEST_F(ElementTest, ValidationErrorNamesTheField) {
    try {
        Element element(119);
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.field(), "atomic_number");
        EXPECT_EQ(e.actual(), "119");
        EXPECT_EQ(e.constraint(), "in [1, 118]");
    }
}

TEST_F(ElementTest, OrderedByAtomicNumber) {
    EXPECT_LT(Element(8), Element(26));
    EXPECT_EQ(Element(26), Element(26));
    EXPECT_NE(Element(26), Element(27));
}

TEST_F(ElementTest, UsableAsHashKey) {
    std::unordered_set<Element> elements{Element(26), Element(26), Element(29)};
    EXPECT_EQ(elements.size(), 2u);
}

TEST_F(ElementTest, Rendering) {
    std::ostringstream os;
    os << Element(26);
    EXPECT_EQ(os.str(), "Element(z=26)");
}

// ==================== AtomicShell Tests ====================

TEST(AtomicShellTest, PrincipalQuantumNumberStartsAtOne) {
    EXPECT_EQ(AtomicShell(1).n(), 1);
    EXPECT_EQ(AtomicShell(7).principalQuantumNumber(), 7);
    EXPECT_THROW(AtomicShell(0), ValidationError);
    EXPECT_THROW(AtomicShell(-3), ValidationError);
}

TEST(AtomicShellTest, OrderingAndRendering) {
    EXPECT_LT(AtomicShell(1), AtomicShell(2));
    EXPECT_EQ(AtomicShell(3).toString(), "AtomicShell(n=3)");
}
