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

#include "selection_rules.hpp"

#include <cstdlib>

namespace xrayref::model {

bool isElectricDipolePermitted(const AtomicSubshell& source,
                               const AtomicSubshell& destination) noexcept {
    const int deltaJn = std::abs(destination.jn() - source.jn());
    if (deltaJn > 2) {
        return false;
    }
    return std::abs(destination.l() - source.l()) == 1;
}

bool isElectricQuadrupolePermitted(const AtomicSubshell& source,
                                   const AtomicSubshell& destination) noexcept {
    const int deltaJn = std::abs(destination.jn() - source.jn());
    if (deltaJn > 4) {
        return false;
    }
    // j = 1/2 -> j = 1/2 is forbidden for quadrupole radiation
    if (source.jn() == 1 && destination.jn() == 1) {
        return false;
    }
    const int deltaL = std::abs(destination.l() - source.l());
    return deltaL == 0 || deltaL == 2;
}

bool isRadiative(const AtomicSubshell& source,
                 const AtomicSubshell& destination) noexcept {
    if (source.n() == destination.n()) {
        return false;
    }
    return isElectricDipolePermitted(source, destination) ||
           isElectricQuadrupolePermitted(source, destination);
}

}  // namespace xrayref::model
