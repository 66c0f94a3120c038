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

#include "element.hpp"

#include <format>

#include "types.hpp"

namespace xrayref::model {

Element::Element(int atomicNumber) : atomicNumber_(atomicNumber) {
    if (atomicNumber < MIN_ATOMIC_NUMBER || atomicNumber > MAX_ATOMIC_NUMBER) {
        THROW_MODEL_VALIDATION_ERROR(
            "atomic_number",
            std::format("in [{}, {}]", MIN_ATOMIC_NUMBER, MAX_ATOMIC_NUMBER),
            std::to_string(atomicNumber));
    }
}

std::string Element::toString() const {
    return std::format("Element(z={})", atomicNumber_);
}

std::ostream& operator<<(std::ostream& os, const Element& element) {
    return os << element.toString();
}

}  // namespace xrayref::model
