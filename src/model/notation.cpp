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

#include "notation.hpp"

#include <algorithm>
#include <cctype>

#include "types.hpp"

namespace xrayref::model {

std::string toLower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lowered;
}

Notation::Notation(std::string_view name) : name_(toLower(name)) {
    if (name_.empty()) {
        THROW_MODEL_VALIDATION_ERROR("notation_name", "non-empty", "\"\"");
    }
}

std::string Notation::toString() const { return "Notation(" + name_ + ")"; }

std::ostream& operator<<(std::ostream& os, const Notation& notation) {
    return os << notation.toString();
}

}  // namespace xrayref::model
