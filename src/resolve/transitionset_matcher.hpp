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

#ifndef XRAYREF_RESOLVE_TRANSITIONSET_MATCHER_HPP
#define XRAYREF_RESOLVE_TRANSITIONSET_MATCHER_HPP

#include <cstdint>
#include <stop_token>
#include <vector>

#include "database/executor.hpp"
#include "database/query/query_builder.hpp"
#include "identifier.hpp"
#include "model/transition_set.hpp"

namespace xrayref::resolve {

/**
 * @brief Builds the query listing `(transitionset_id, count)` for every
 * stored transition set that has `transition` as a member.
 */
[[nodiscard]] database::query::BuiltQuery buildMembershipQuery(
    const model::Transition& transition);

/**
 * @brief Finds the stored transition set whose members are exactly the
 * transitions of `transitions`.
 *
 * One membership query runs per transition. The candidate sets are
 * intersected round after round, then narrowed to those whose stored member
 * count equals `transitions.size()`, so a stored superset never matches.
 *
 * @param transitions Requested members.
 * @param executor Runs the membership queries.
 * @param stop Checked before every round.
 * @return The surrogate key of the matching set.
 * @throws NotFound if no stored set matches
 * @throws AmbiguousMatch if several stored sets match
 * @throws ResolutionCancelled if a stop was requested
 */
[[nodiscard]] int64_t matchTransitionSet(const model::TransitionSet& transitions,
                                         database::QueryExecutor& executor,
                                         std::stop_token stop = {});

/**
 * @brief Normalizes a collection of transition identifiers and matches it.
 *
 * @throws ValidationError if the collection is empty
 * @throws UnresolvedIdentifier if a member is a notation label or malformed
 */
[[nodiscard]] int64_t buildTransitionSetMatch(
    const std::vector<RawTransition>& transitions,
    database::QueryExecutor& executor, std::stop_token stop = {});

}  // namespace xrayref::resolve

#endif  // XRAYREF_RESOLVE_TRANSITIONSET_MATCHER_HPP
