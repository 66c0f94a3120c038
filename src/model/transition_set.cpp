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

#include "transition_set.hpp"

#include <format>

#include "types.hpp"

namespace xrayref::model {

TransitionSet::TransitionSet(std::initializer_list<Transition> transitions)
    : transitions_(transitions.begin(), transitions.end()) {
    ensureNotEmpty();
}

TransitionSet::TransitionSet(const std::vector<Transition>& transitions)
    : transitions_(transitions.begin(), transitions.end()) {
    ensureNotEmpty();
}

TransitionSet::TransitionSet(
    const std::vector<std::pair<AtomicSubshell, AtomicSubshell>>&
        subshellPairs) {
    for (const auto& [source, destination] : subshellPairs) {
        transitions_.emplace(source, destination);
    }
    ensureNotEmpty();
}

TransitionSet::TransitionSet(
    const std::vector<std::array<int, 6>>& quantumNumbers) {
    for (const auto& q : quantumNumbers) {
        transitions_.emplace(q[0], q[1], q[2], q[3], q[4], q[5]);
    }
    ensureNotEmpty();
}

void TransitionSet::ensureNotEmpty() const {
    if (transitions_.empty()) {
        THROW_MODEL_VALIDATION_ERROR("transitions", "at least one transition",
                                     "0");
    }
}

std::string TransitionSet::toString() const {
    return std::format("TransitionSet({} possible transitions)",
                       transitions_.size());
}

std::ostream& operator<<(std::ostream& os, const TransitionSet& set) {
    return os << set.toString();
}

}  // namespace xrayref::model
