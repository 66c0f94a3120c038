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

#ifndef XRAYREF_DATABASE_EXECUTOR_HPP
#define XRAYREF_DATABASE_EXECUTOR_HPP

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "query/query_builder.hpp"

namespace xrayref::database {

/// A cell of a result row. `std::monostate` stands for SQL NULL.
using CellValue = std::variant<std::monostate, int64_t, double, std::string>;

using ResultRow = std::vector<CellValue>;

/**
 * @brief Runs a parametrized query against the reference data store.
 *
 * Implementations bind the parameters positionally and return every row.
 * Backend failures are reported by throwing; the resolution layer does not
 * retry.
 */
class QueryExecutor {
public:
    virtual ~QueryExecutor() = default;

    /**
     * @brief Executes a query.
     *
     * @param sql Query text with `?` placeholders.
     * @param params Values for the placeholders, in order.
     * @return All result rows, in the order the backend returned them.
     */
    virtual std::vector<ResultRow> execute(
        const std::string& sql, const std::vector<query::ParamValue>& params) = 0;

    /// Convenience overload for a built query.
    std::vector<ResultRow> execute(const query::BuiltQuery& query) {
        return execute(query.sql, query.params);
    }
};

}  // namespace xrayref::database

#endif  // XRAYREF_DATABASE_EXECUTOR_HPP
