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

#ifndef XRAYREF_DATABASE_CORE_TYPES_HPP
#define XRAYREF_DATABASE_CORE_TYPES_HPP

#include "atom/error/exception.hpp"

namespace xrayref::database::core {

// Exception classes - all follow the XxxError naming convention
class DatabaseOpenError : public atom::error::Exception {
    using Exception::Exception;
};

class SqlExecutionError : public atom::error::Exception {
    using Exception::Exception;
};

class StatementPrepareError : public atom::error::Exception {
    using Exception::Exception;
};

/// Misuse of a connection or statement (closed handle, bad index).
class DatabaseUsageError : public atom::error::Exception {
    using Exception::Exception;
};

/// Rejected query construction (unsafe identifier, conflicting join, ...).
class QueryBuildError : public atom::error::Exception {
    using Exception::Exception;
};

#define THROW_DATABASE_OPEN_ERROR(...)                \
    throw xrayref::database::core::DatabaseOpenError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_SQL_EXECUTION_ERROR(...)                \
    throw xrayref::database::core::SqlExecutionError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_STATEMENT_PREPARE_ERROR(...)                \
    throw xrayref::database::core::StatementPrepareError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_DATABASE_USAGE_ERROR(...)                \
    throw xrayref::database::core::DatabaseUsageError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_QUERY_BUILD_ERROR(...)                \
    throw xrayref::database::core::QueryBuildError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace xrayref::database::core

#endif  // XRAYREF_DATABASE_CORE_TYPES_HPP
