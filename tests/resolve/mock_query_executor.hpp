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

#ifndef XRAYREF_TESTS_RESOLVE_MOCK_QUERY_EXECUTOR_HPP
#define XRAYREF_TESTS_RESOLVE_MOCK_QUERY_EXECUTOR_HPP

#include <gmock/gmock.h>

#include <string>
#include <vector>

#include "database/executor.hpp"

namespace xrayref::test {

class MockQueryExecutor : public database::QueryExecutor {
public:
    using database::QueryExecutor::execute;

    MOCK_METHOD(std::vector<database::ResultRow>, execute,
                (const std::string&,
                 const std::vector<database::query::ParamValue>&),
                (override));
};

}  // namespace xrayref::test

#endif  // XRAYREF_TESTS_RESOLVE_MOCK_QUERY_EXECUTOR_HPP
