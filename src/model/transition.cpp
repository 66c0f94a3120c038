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

#include "transition.hpp"

#include <format>

#include "selection_rules.hpp"

namespace xrayref::model {

Transition::Transition(const AtomicSubshell& source,
                       const AtomicSubshell& destination)
    : source_(source), destination_(destination) {}

Transition::Transition(int sourceN, int sourceL, int sourceJn,
                       int destinationN, int destinationL, int destinationJn)
    : source_(sourceN, sourceL, sourceJn),
      destination_(destinationN, destinationL, destinationJn) {}

Transition::Transition(const std::array<int, 3>& source,
                       const std::array<int, 3>& destination)
    : source_(source[0], source[1], source[2]),
      destination_(destination[0], destination[1], destination[2]) {}

bool Transition::isRadiative() const noexcept {
    return model::isRadiative(source_, destination_);
}

std::string Transition::toString() const {
    return std::format(
        "Transition([n={}, l={}, j={:.1f}] -> [n={}, l={}, j={:.1f}])",
        source_.n(), source_.l(), source_.j(), destination_.n(),
        destination_.l(), destination_.j());
}

std::ostream& operator<<(std::ostream& os, const Transition& transition) {
    return os << transition.toString();
}

}  // namespace xrayref::model
