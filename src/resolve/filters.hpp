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

#ifndef XRAYREF_RESOLVE_FILTERS_HPP
#define XRAYREF_RESOLVE_FILTERS_HPP

#include <string>

#include "database/query/query_builder.hpp"
#include "identifier.hpp"
#include "model/atomic_subshell.hpp"
#include "model/transition.hpp"

namespace xrayref::resolve {

using database::query::QueryBuilder;

/**
 * @brief Joins `notationTable` on `notationKey = table.column` and matches
 * the label against either its ASCII or its UTF-16 rendering.
 */
void filterNotationLabel(QueryBuilder& builder, const std::string& table,
                         const std::string& column,
                         const std::string& notationTable,
                         const std::string& notationKey,
                         const NotationLabel& label);

/**
 * @brief Joins the subshell (and its shell) on `atomic_subshell.id =
 * table.column` and filters on (n, l, 2j).
 */
void filterAtomicSubshell(QueryBuilder& builder, const std::string& table,
                          const std::string& column,
                          const model::AtomicSubshell& subshell);

/**
 * @brief Joins the transition on `transition.id = table.column`, then both of
 * its subshells and shells under the source/destination aliases, and filters
 * on the six quantum numbers.
 */
void filterTransition(QueryBuilder& builder, const std::string& table,
                      const std::string& column,
                      const model::Transition& transition);

}  // namespace xrayref::resolve

#endif  // XRAYREF_RESOLVE_FILTERS_HPP
