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

#ifndef XRAYREF_MODEL_SELECTION_RULES_HPP
#define XRAYREF_MODEL_SELECTION_RULES_HPP

#include "atomic_subshell.hpp"

namespace xrayref::model {

/**
 * @brief Electric dipole selection rule: |Δ(2j)| <= 2 and |Δl| = 1.
 */
[[nodiscard]] bool isElectricDipolePermitted(
    const AtomicSubshell& source, const AtomicSubshell& destination) noexcept;

/**
 * @brief Electric quadrupole selection rule: |Δ(2j)| <= 4, |Δl| in {0, 2}
 * and not j = 1/2 -> j = 1/2.
 */
[[nodiscard]] bool isElectricQuadrupolePermitted(
    const AtomicSubshell& source, const AtomicSubshell& destination) noexcept;

/**
 * @brief Determines whether a transition between two subshells is
 * radiative.
 *
 * Transitions within the same shell are never radiative. Otherwise the
 * transition is radiative if either the electric dipole or the electric
 * quadrupole rule permits it. The evaluation is directional.
 *
 * @param source Subshell the vacancy moves from.
 * @param destination Subshell the vacancy moves to.
 * @return True if radiatively permitted.
 */
[[nodiscard]] bool isRadiative(const AtomicSubshell& source,
                               const AtomicSubshell& destination) noexcept;

}  // namespace xrayref::model

#endif  // XRAYREF_MODEL_SELECTION_RULES_HPP
