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

#include "atomic_subshell.hpp"

#include <cstdlib>
#include <format>

#include "types.hpp"

namespace xrayref::model {

AtomicSubshell::AtomicSubshell(int principalQuantumNumber,
                               int azimuthalQuantumNumber,
                               int totalAngularMomentumNominator)
    : principalQuantumNumber_(principalQuantumNumber),
      azimuthalQuantumNumber_(azimuthalQuantumNumber),
      totalAngularMomentumNominator_(totalAngularMomentumNominator) {
    // Validates n
    AtomicShell shell(principalQuantumNumber);

    const int lmax = shell.n() - 1;
    if (azimuthalQuantumNumber < 0 || azimuthalQuantumNumber > lmax) {
        THROW_MODEL_VALIDATION_ERROR("azimuthal_quantum_number",
                                     std::format("in [0, {}]", lmax),
                                     std::to_string(azimuthalQuantumNumber));
    }

    const int jnMin = std::abs(2 * azimuthalQuantumNumber - 1);
    const int jnMax = 2 * azimuthalQuantumNumber + 1;
    if (totalAngularMomentumNominator != jnMin &&
        totalAngularMomentumNominator != jnMax) {
        THROW_MODEL_VALIDATION_ERROR(
            "total_angular_momentum_nominator",
            jnMin == jnMax ? std::format("{}", jnMin)
                           : std::format("one of {{{}, {}}}", jnMin, jnMax),
            std::to_string(totalAngularMomentumNominator));
    }
}

AtomicSubshell::AtomicSubshell(const AtomicShell& shell,
                               int azimuthalQuantumNumber,
                               int totalAngularMomentumNominator)
    : AtomicSubshell(shell.n(), azimuthalQuantumNumber,
                     totalAngularMomentumNominator) {}

std::string AtomicSubshell::toString() const {
    return std::format("AtomicSubshell(n={}, l={}, j={:.1f})",
                       principalQuantumNumber_, azimuthalQuantumNumber_, j());
}

std::ostream& operator<<(std::ostream& os, const AtomicSubshell& subshell) {
    return os << subshell.toString();
}

}  // namespace xrayref::model
