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

#ifndef XRAYREF_MODEL_ENUMERATION_HPP
#define XRAYREF_MODEL_ENUMERATION_HPP

#include <vector>

#include "atomic_subshell.hpp"
#include "transition.hpp"

namespace xrayref::model {

/**
 * @brief A subshell together with its 1-based position within its shell
 * (K = 1; L1, L2, L3 = 1, 2, 3; ...).
 */
struct IndexedSubshell {
    AtomicSubshell subshell;
    int index;
};

/**
 * @brief Lists every valid subshell of the shells 1..maxN, ordered by n,
 * then l, then 2j.
 */
[[nodiscard]] std::vector<IndexedSubshell> enumerateSubshells(int maxN);

/**
 * @brief Lists every transition between subshells of the shells 1..maxN.
 *
 * A transition goes from an outer (or equal) shell to an inner one. Within
 * the same shell the destination must come strictly before the source.
 * Self-transitions are excluded.
 */
[[nodiscard]] std::vector<Transition> enumerateTransitions(int maxN);

/**
 * @brief The subset of enumerateTransitions(maxN) that is radiative.
 */
[[nodiscard]] std::vector<Transition> radiativeTransitions(int maxN);

}  // namespace xrayref::model

#endif  // XRAYREF_MODEL_ENUMERATION_HPP
