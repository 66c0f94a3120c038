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

#ifndef XRAYREF_MODEL_ATOMIC_SUBSHELL_HPP
#define XRAYREF_MODEL_ATOMIC_SUBSHELL_HPP

#include <compare>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>

#include "atomic_shell.hpp"

namespace xrayref::model {

/**
 * @brief An electron subshell characterized by (n, l, 2j).
 *
 * The total angular momentum is stored doubled so that subshell identity is
 * exact integer equality. Invariants:
 * - 0 <= l <= n - 1
 * - 2j is |2l - 1| or 2l + 1
 */
class AtomicSubshell {
public:
    /**
     * @brief Constructs a subshell from its quantum numbers.
     *
     * @param principalQuantumNumber n.
     * @param azimuthalQuantumNumber l.
     * @param totalAngularMomentumNominator 2j.
     * @throws ValidationError if any invariant is violated
     */
    AtomicSubshell(int principalQuantumNumber, int azimuthalQuantumNumber,
                   int totalAngularMomentumNominator);

    /**
     * @brief Constructs a subshell of an existing shell.
     *
     * @throws ValidationError if l or 2j is invalid for the shell
     */
    AtomicSubshell(const AtomicShell& shell, int azimuthalQuantumNumber,
                   int totalAngularMomentumNominator);

    [[nodiscard]] int n() const noexcept { return principalQuantumNumber_; }
    [[nodiscard]] int l() const noexcept { return azimuthalQuantumNumber_; }
    [[nodiscard]] int jn() const noexcept {
        return totalAngularMomentumNominator_;
    }
    /// Total angular momentum j (2j / 2).
    [[nodiscard]] double j() const noexcept {
        return totalAngularMomentumNominator_ / 2.0;
    }

    [[nodiscard]] AtomicShell atomicShell() const {
        return AtomicShell(principalQuantumNumber_);
    }

    [[nodiscard]] std::string toString() const;

    auto operator<=>(const AtomicSubshell&) const = default;

private:
    int principalQuantumNumber_;
    int azimuthalQuantumNumber_;
    int totalAngularMomentumNominator_;
};

std::ostream& operator<<(std::ostream& os, const AtomicSubshell& subshell);

}  // namespace xrayref::model

template <>
struct std::hash<xrayref::model::AtomicSubshell> {
    std::size_t operator()(
        const xrayref::model::AtomicSubshell& subshell) const noexcept {
        // n < 2^16, l < n, 2j <= 2n - 1: packs without collisions
        std::size_t key = static_cast<std::size_t>(subshell.n());
        key = (key << 16) ^ static_cast<std::size_t>(subshell.l());
        key = (key << 16) ^ static_cast<std::size_t>(subshell.jn());
        return std::hash<std::size_t>{}(key);
    }
};

#endif  // XRAYREF_MODEL_ATOMIC_SUBSHELL_HPP
