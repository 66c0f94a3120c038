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

#ifndef XRAYREF_MODEL_LANGUAGE_HPP
#define XRAYREF_MODEL_LANGUAGE_HPP

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace xrayref::model {

/**
 * @brief A 2 or 3 character language code, stored lower-cased.
 */
class Language {
public:
    /**
     * @throws ValidationError if the code is not 2 or 3 characters long
     */
    explicit Language(std::string_view code);

    [[nodiscard]] const std::string& code() const noexcept { return code_; }

    [[nodiscard]] std::string toString() const;

    bool operator==(const Language&) const = default;

private:
    std::string code_;
};

std::ostream& operator<<(std::ostream& os, const Language& language);

}  // namespace xrayref::model

template <>
struct std::hash<xrayref::model::Language> {
    std::size_t operator()(
        const xrayref::model::Language& language) const noexcept {
        return std::hash<std::string>{}(language.code());
    }
};

#endif  // XRAYREF_MODEL_LANGUAGE_HPP
