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

#ifndef XRAYREF_MODEL_TYPES_HPP
#define XRAYREF_MODEL_TYPES_HPP

#include <string>
#include <utility>

#include "atom/error/exception.hpp"

namespace xrayref::model {

/**
 * @brief Raised when a value object is constructed with values that violate
 * its invariants.
 *
 * Besides the formatted message, the offending field, the expected
 * constraint and the actual value are kept so callers can report them
 * without parsing the message.
 */
class ValidationError : public atom::error::Exception {
public:
    ValidationError(const char* file, int line, const char* func,
                    std::string field, std::string constraint,
                    std::string actual)
        : Exception(file, line, func,
                    formatMessage(field, constraint, actual)),
          field_(std::move(field)),
          constraint_(std::move(constraint)),
          actual_(std::move(actual)) {}

    [[nodiscard]] const std::string& field() const noexcept { return field_; }
    [[nodiscard]] const std::string& constraint() const noexcept {
        return constraint_;
    }
    [[nodiscard]] const std::string& actual() const noexcept {
        return actual_;
    }

private:
    static std::string formatMessage(const std::string& field,
                                     const std::string& constraint,
                                     const std::string& actual) {
        return field + " (" + actual + ") must be " + constraint;
    }

    std::string field_;
    std::string constraint_;
    std::string actual_;
};

#define THROW_MODEL_VALIDATION_ERROR(field, constraint, actual)        \
    throw xrayref::model::ValidationError(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                          ATOM_FUNC_NAME, field,          \
                                          constraint, actual)

}  // namespace xrayref::model

#endif  // XRAYREF_MODEL_TYPES_HPP
