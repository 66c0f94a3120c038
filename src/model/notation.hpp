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

#ifndef XRAYREF_MODEL_NOTATION_HPP
#define XRAYREF_MODEL_NOTATION_HPP

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace xrayref::model {

/**
 * @brief A naming system label such as "iupac" or "siegbahn".
 *
 * The name is lower-cased on construction, so notations compare
 * case-insensitively.
 */
class Notation {
public:
    /**
     * @throws ValidationError if the name is empty
     */
    explicit Notation(std::string_view name);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] std::string toString() const;

    bool operator==(const Notation&) const = default;

private:
    std::string name_;
};

std::ostream& operator<<(std::ostream& os, const Notation& notation);

inline const Notation NOTATION_IUPAC{"iupac"};
inline const Notation NOTATION_SIEGBAHN{"siegbahn"};
inline const Notation NOTATION_ORBITAL{"orbital"};

/// Lower-cases ASCII letters.
[[nodiscard]] std::string toLower(std::string_view text);

}  // namespace xrayref::model

template <>
struct std::hash<xrayref::model::Notation> {
    std::size_t operator()(
        const xrayref::model::Notation& notation) const noexcept {
        return std::hash<std::string>{}(notation.name());
    }
};

#endif  // XRAYREF_MODEL_NOTATION_HPP
