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

#ifndef XRAYREF_MODEL_TRANSITION_SET_HPP
#define XRAYREF_MODEL_TRANSITION_SET_HPP

#include <array>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <ostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "transition.hpp"

namespace xrayref::model {

/**
 * @brief An unordered, deduplicated, non-empty collection of transitions
 * forming one spectral feature (e.g. a line family).
 *
 * Members are coerced to Transition before deduplication, so the same
 * transition expressed through different inputs collapses into one member.
 * Two sets compare equal when they have the same members, regardless of the
 * order they were given in.
 *
 * @throws ValidationError from every constructor when no transition remains
 */
class TransitionSet {
public:
    TransitionSet(std::initializer_list<Transition> transitions);
    explicit TransitionSet(const std::vector<Transition>& transitions);
    explicit TransitionSet(
        const std::vector<std::pair<AtomicSubshell, AtomicSubshell>>&
            subshellPairs);
    explicit TransitionSet(
        const std::vector<std::array<int, 6>>& quantumNumbers);

    [[nodiscard]] const std::set<Transition>& transitions() const noexcept {
        return transitions_;
    }
    [[nodiscard]] std::size_t size() const noexcept {
        return transitions_.size();
    }
    [[nodiscard]] bool contains(const Transition& transition) const {
        return transitions_.contains(transition);
    }

    [[nodiscard]] auto begin() const noexcept { return transitions_.begin(); }
    [[nodiscard]] auto end() const noexcept { return transitions_.end(); }

    [[nodiscard]] std::string toString() const;

    bool operator==(const TransitionSet&) const = default;

private:
    void ensureNotEmpty() const;

    std::set<Transition> transitions_;
};

std::ostream& operator<<(std::ostream& os, const TransitionSet& set);

}  // namespace xrayref::model

template <>
struct std::hash<xrayref::model::TransitionSet> {
    std::size_t operator()(
        const xrayref::model::TransitionSet& set) const noexcept {
        std::hash<xrayref::model::Transition> hasher;
        std::size_t seed = set.size();
        for (const auto& transition : set) {
            seed ^= hasher(transition) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};

#endif  // XRAYREF_MODEL_TRANSITION_SET_HPP
