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

#include "language.hpp"

#include "notation.hpp"
#include "types.hpp"

namespace xrayref::model {

Language::Language(std::string_view code) : code_(toLower(code)) {
    if (code_.size() < 2 || code_.size() > 3) {
        THROW_MODEL_VALIDATION_ERROR("language_code", "2 or 3 characters long",
                                     "\"" + code_ + "\"");
    }
}

std::string Language::toString() const { return "Language(" + code_ + ")"; }

std::ostream& operator<<(std::ostream& os, const Language& language) {
    return os << language.toString();
}

}  // namespace xrayref::model
