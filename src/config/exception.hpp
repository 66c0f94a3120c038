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

#ifndef XRAYREF_CONFIG_EXCEPTION_HPP
#define XRAYREF_CONFIG_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace xrayref::config {

/**
 * @brief Base exception for configuration errors
 */
class BadConfigException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_BAD_CONFIG_EXCEPTION(...)                                       \
    throw xrayref::config::BadConfigException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                              ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Exception for configuration file I/O errors
 */
class ConfigIOException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_CONFIG_IO_EXCEPTION(...)                                       \
    throw xrayref::config::ConfigIOException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                             ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Exception for malformed configuration documents
 */
class ConfigSerializationException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_CONFIG_SERIALIZATION_EXCEPTION(...)        \
    throw xrayref::config::ConfigSerializationException( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace xrayref::config

#endif  // XRAYREF_CONFIG_EXCEPTION_HPP
