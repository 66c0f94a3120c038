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

#ifndef XRAYREF_MODEL_TRANSITION_HPP
#define XRAYREF_MODEL_TRANSITION_HPP

#include <array>
#include <compare>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>

#include "atomic_subshell.hpp"

namespace xrayref::model {

/**
 * @brief A directed transition between two atomic subshells.
 *
 * A transition is identified by its (source, destination) pair only, so the
 * same transition built from subshells, quantum number triples or a flat
 * 6-tuple compares and hashes equal.
 */
class Transition {
public:
    Transition(const AtomicSubshell& source, const AtomicSubshell& destination);

    /**
     * @brief Constructs a transition from the flat quantum numbers
     * (n0, l0, 2j0, n1, l1, 2j1).
     *
     * @throws ValidationError if either subshell is invalid
     */
    Transition(int sourceN, int sourceL, int sourceJn, int destinationN,
               int destinationL, int destinationJn);

    /**
     * @brief Constructs a transition from two (n, l, 2j) triples.
     *
     * @throws ValidationError if either subshell is invalid
     */
    Transition(const std::array<int, 3>& source,
               const std::array<int, 3>& destination);

    [[nodiscard]] const AtomicSubshell& source() const noexcept {
        return source_;
    }
    [[nodiscard]] const AtomicSubshell& destination() const noexcept {
        return destination_;
    }

    /**
     * @brief Whether the transition is radiatively permitted (electric
     * dipole or quadrupole).
     */
    [[nodiscard]] bool isRadiative() const noexcept;

    /// Source and destination lie in the same shell.
    [[nodiscard]] bool isCosterKronig() const noexcept {
        return source_.n() == destination_.n();
    }

    [[nodiscard]] std::string toString() const;

    auto operator<=>(const Transition&) const = default;

private:
    AtomicSubshell source_;
    AtomicSubshell destination_;
};

std::ostream& operator<<(std::ostream& os, const Transition& transition);

}  // namespace xrayref::model

template <>
struct std::hash<xrayref::model::Transition> {
    std::size_t operator()(
        const xrayref::model::Transition& transition) const noexcept {
        std::hash<xrayref::model::AtomicSubshell> hasher;
        std::size_t seed = hasher(transition.source());
        seed ^= hasher(transition.destination()) + 0x9e3779b9 + (seed << 6) +
                (seed >> 2);
        return seed;
    }
};

#endif  // XRAYREF_MODEL_TRANSITION_HPP
