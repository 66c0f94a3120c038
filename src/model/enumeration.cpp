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

#include "enumeration.hpp"

#include <algorithm>
#include <cstdlib>
#include <iterator>

#include "selection_rules.hpp"

namespace xrayref::model {

std::vector<IndexedSubshell> enumerateSubshells(int maxN) {
    std::vector<IndexedSubshell> subshells;
    for (int n = 1; n <= maxN; ++n) {
        int index = 1;
        for (int l = 0; l < n; ++l) {
            const int jnLow = std::abs(2 * l - 1);
            const int jnHigh = 2 * l + 1;
            subshells.push_back({AtomicSubshell(n, l, jnLow), index++});
            if (jnHigh != jnLow) {
                subshells.push_back({AtomicSubshell(n, l, jnHigh), index++});
            }
        }
    }
    return subshells;
}

std::vector<Transition> enumerateTransitions(int maxN) {
    const auto subshells = enumerateSubshells(maxN);

    std::vector<Transition> transitions;
    for (const auto& src : subshells) {
        for (const auto& dst : subshells) {
            if (src.subshell == dst.subshell) {
                continue;
            }
            if (src.subshell.n() < dst.subshell.n()) {
                continue;
            }
            if (src.subshell.n() == dst.subshell.n() &&
                src.index <= dst.index) {
                continue;
            }
            transitions.emplace_back(src.subshell, dst.subshell);
        }
    }
    return transitions;
}

std::vector<Transition> radiativeTransitions(int maxN) {
    const auto all = enumerateTransitions(maxN);

    std::vector<Transition> radiative;
    std::copy_if(all.begin(), all.end(), std::back_inserter(radiative),
                 [](const Transition& t) { return t.isRadiative(); });
    return radiative;
}

}  // namespace xrayref::model
