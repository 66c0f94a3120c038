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

#include "atomic_shell.hpp"

#include <format>

#include "types.hpp"

namespace xrayref::model {

AtomicShell::AtomicShell(int principalQuantumNumber)
    : principalQuantumNumber_(principalQuantumNumber) {
    if (principalQuantumNumber < 1) {
        THROW_MODEL_VALIDATION_ERROR("principal_quantum_number", "in [1, inf[",
                                     std::to_string(principalQuantumNumber));
    }
}

std::string AtomicShell::toString() const {
    return std::format("AtomicShell(n={})", principalQuantumNumber_);
}

std::ostream& operator<<(std::ostream& os, const AtomicShell& shell) {
    return os << shell.toString();
}

}  // namespace xrayref::model
