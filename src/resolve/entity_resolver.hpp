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

#ifndef XRAYREF_RESOLVE_ENTITY_RESOLVER_HPP
#define XRAYREF_RESOLVE_ENTITY_RESOLVER_HPP

#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

#include "config/resolver_config.hpp"
#include "database/executor.hpp"
#include "database/query/query_builder.hpp"
#include "identifier.hpp"

namespace xrayref::resolve {

using database::query::QueryBuilder;

/**
 * @brief Turns raw identifiers into joins and filters on a QueryBuilder.
 *
 * Every select* method normalizes its identifier, then joins the tables
 * needed to address the entity from `table.column` and adds the filters that
 * pin it down. Several calls can feed the same builder to compose one query,
 * for example an element filter and a transition filter on
 * `transition_energy`.
 *
 * A resolver holds no per-query state. The executor is only used to match
 * transition sets.
 *
 * @code
 * EntityResolver resolver(executor, config);
 * QueryBuilder builder("transition_energy");
 * builder.addSelect("transition_energy", "value_eV");
 * resolver.selectElement(builder, "transition_energy", "element_id", "Fe");
 * resolver.selectTransition(builder, "transition_energy", "transition_id",
 *                           std::vector<int>{2, 1, 3, 1, 0, 1});
 * resolver.selectReference(builder, "transition_energy",
 *                          UnspecifiedReference{}, "transition_energy");
 * auto rows = executor.execute(builder.build());
 * @endcode
 */
class EntityResolver {
public:
    explicit EntityResolver(database::QueryExecutor& executor,
                            config::ResolverConfig config = {});

    /**
     * @brief Atomic numbers filter `element`; strings match an element name
     * or symbol.
     *
     * @throws UnresolvedIdentifier if the string is empty
     * @throws ValidationError if the atomic number is out of range
     */
    void selectElement(QueryBuilder& builder, const std::string& table,
                       const std::string& column, const RawElement& raw) const;

    void selectAtomicShell(QueryBuilder& builder, const std::string& table,
                           const std::string& column,
                           const RawAtomicShell& raw) const;

    void selectAtomicSubshell(QueryBuilder& builder, const std::string& table,
                              const std::string& column,
                              const RawAtomicSubshell& raw) const;

    /// Source and destination are joined under separate aliases.
    void selectTransition(QueryBuilder& builder, const std::string& table,
                          const std::string& column,
                          const RawTransition& raw) const;

    /**
     * @brief Labels join the notation table; anything else is matched
     * against the stored sets first (see matchTransitionSet()).
     *
     * @throws NotFound if no stored set has exactly these members
     * @throws AmbiguousMatch if several do
     */
    void selectTransitionSet(QueryBuilder& builder, const std::string& table,
                             const std::string& column,
                             const RawTransitionSet& raw,
                             std::stop_token stop = {}) const;

    /// Joins `notation` on `table.notation_id`.
    void selectNotation(QueryBuilder& builder, const std::string& table,
                        const RawNotation& raw) const;

    /// Joins `language` on `table.language_id`.
    void selectLanguage(QueryBuilder& builder, const std::string& table,
                        const RawLanguage& raw) const;

    /**
     * @brief Filters on a bibtex key joined through `table.reference_id`.
     *
     * An unspecified reference uses the configured default of `property`
     * when there is one. Otherwise rows are ordered by `table.reference_id`
     * and the caller keeps the first.
     *
     * @throws ValidationError if `property` is not a lookup property
     */
    void selectReference(QueryBuilder& builder, const std::string& table,
                         const RawReference& raw,
                         std::optional<std::string_view> property = {}) const;

    [[nodiscard]] const config::ResolverConfig& config() const {
        return config_;
    }

private:
    database::QueryExecutor& executor_;
    config::ResolverConfig config_;
};

}  // namespace xrayref::resolve

#endif  // XRAYREF_RESOLVE_ENTITY_RESOLVER_HPP
