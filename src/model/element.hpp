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

#ifndef XRAYREF_MODEL_ELEMENT_HPP
#define XRAYREF_MODEL_ELEMENT_HPP

#include <compare>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>

namespace xrayref::model {

/**
 * @brief A chemical element identified by its atomic number.
 *
 * Elements are ordered by atomic number. Valid atomic numbers are [1, 118].
 */
class Element {
public:
    static constexpr int MIN_ATOMIC_NUMBER = 1;
    static constexpr int MAX_ATOMIC_NUMBER = 118;

    /**
     * @brief Constructs an element.
     *
     * @param atomicNumber Atomic number Z.
     * @throws ValidationError if Z is outside [1, 118]
     */
    explicit Element(int atomicNumber);

    [[nodiscard]] int atomicNumber() const noexcept { return atomicNumber_; }
    [[nodiscard]] int z() const noexcept { return atomicNumber_; }

    [[nodiscard]] std::string toString() const;

    auto operator<=>(const Element&) const = default;

private:
    int atomicNumber_;
};

std::ostream& operator<<(std::ostream& os, const Element& element);

}  // namespace xrayref::model

template <>
struct std::hash<xrayref::model::Element> {
    std::size_t operator()(const xrayref::model::Element& element) const noexcept {
        return std::hash<int>{}(element.atomicNumber());
    }
};

#endif  // XRAYREF_MODEL_ELEMENT_HPP
