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

#include "transitionset_matcher.hpp"

#include <map>
#include <utility>

#include <spdlog/spdlog.h>

#include "database/core/types.hpp"
#include "filters.hpp"
#include "normalizer.hpp"
#include "schema.hpp"
#include "types.hpp"

namespace xrayref::resolve {

namespace {

// transitionset_id -> stored member count
using Candidates = std::map<int64_t, int64_t>;

int64_t integerCell(const database::ResultRow& row, size_t index) {
    if (index >= row.size()) {
        THROW_SQL_EXECUTION_ERROR("Membership row has " +
                                  std::to_string(row.size()) + " columns");
    }
    const auto* value = std::get_if<int64_t>(&row[index]);
    if (value == nullptr) {
        THROW_SQL_EXECUTION_ERROR("Membership column " + std::to_string(index) +
                                  " is not an integer");
    }
    return *value;
}

Candidates fetchCandidates(const model::Transition& transition,
                           database::QueryExecutor& executor) {
    Candidates candidates;
    for (const auto& row : executor.execute(buildMembershipQuery(transition))) {
        candidates.emplace(integerCell(row, 0), integerCell(row, 1));
    }
    return candidates;
}

void intersect(Candidates& running, const Candidates& round) {
    for (auto it = running.begin(); it != running.end();) {
        if (round.contains(it->first)) {
            ++it;
        } else {
            it = running.erase(it);
        }
    }
}

}  // namespace

database::query::BuiltQuery buildMembershipQuery(
    const model::Transition& transition) {
    const std::string association = schema::transitionset::ASSOCIATION_TABLE;

    QueryBuilder builder(association);
    builder.addSelect(association, schema::transitionset::ASSOCIATION_SET_ID);
    builder.addSelect(schema::transitionset::TABLE,
                      schema::transitionset::COUNT);
    builder.addJoin(schema::transitionset::TABLE, schema::ID, association,
                    schema::transitionset::ASSOCIATION_SET_ID);
    filterTransition(builder, association,
                     schema::transitionset::ASSOCIATION_TRANSITION_ID,
                     transition);
    return builder.build();
}

int64_t matchTransitionSet(const model::TransitionSet& transitions,
                           database::QueryExecutor& executor,
                           std::stop_token stop) {
    const std::string value = transitions.toString();

    Candidates running;
    bool first = true;
    for (const auto& transition : transitions) {
        if (stop.stop_requested()) {
            spdlog::warn("Transition set match cancelled: {}", value);
            THROW_RESOLUTION_CANCELLED("Transition set match cancelled: " +
                                       value);
        }

        Candidates round = fetchCandidates(transition, executor);
        if (first) {
            running = std::move(round);
            first = false;
        } else {
            intersect(running, round);
        }
        spdlog::debug("{}: {} candidate set(s) left", transition.toString(),
                      running.size());

        if (running.empty()) {
            spdlog::debug("No stored set contains every transition of {}",
                          value);
            THROW_NOT_FOUND(EntityKind::TransitionSet, value);
        }
    }

    const auto expected = static_cast<int64_t>(transitions.size());
    std::vector<int64_t> matches;
    for (const auto& [id, count] : running) {
        if (count == expected) {
            matches.push_back(id);
        }
    }

    if (matches.empty()) {
        spdlog::debug("Only supersets of {} are stored", value);
        THROW_NOT_FOUND(EntityKind::TransitionSet, value);
    }
    if (matches.size() > 1) {
        spdlog::error("{} stored transition sets equal {}", matches.size(),
                      value);
        THROW_AMBIGUOUS_MATCH(EntityKind::TransitionSet, value, matches);
    }

    spdlog::info("Matched {} to transition set {}", value, matches.front());
    return matches.front();
}

int64_t buildTransitionSetMatch(const std::vector<RawTransition>& transitions,
                                database::QueryExecutor& executor,
                                std::stop_token stop) {
    auto normalized = normalizeTransitionSet(RawTransitionSet{transitions});
    return matchTransitionSet(std::get<model::TransitionSet>(normalized),
                              executor, std::move(stop));
}

}  // namespace xrayref::resolve
