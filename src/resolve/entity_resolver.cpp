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

#include "entity_resolver.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "filters.hpp"
#include "normalizer.hpp"
#include "schema.hpp"
#include "transitionset_matcher.hpp"

namespace xrayref::resolve {

EntityResolver::EntityResolver(database::QueryExecutor& executor,
                               config::ResolverConfig config)
    : executor_(executor), config_(std::move(config)) {}

void EntityResolver::selectElement(QueryBuilder& builder,
                                   const std::string& table,
                                   const std::string& column,
                                   const RawElement& raw) const {
    auto normalized = normalizeElement(raw);

    if (const auto* label = std::get_if<NotationLabel>(&normalized)) {
        spdlog::debug("Element {} resolved by name or symbol", describe(raw));
        builder.addJoin(schema::element_name::TABLE,
                        schema::element_name::ELEMENT_ID, table, column);
        builder.addJoin(schema::element_symbol::TABLE,
                        schema::element_symbol::ELEMENT_ID, table, column);
        builder.addWhere({{schema::element_name::TABLE,
                           schema::element_name::NAME, "=", label->text},
                          {schema::element_symbol::TABLE,
                           schema::element_symbol::SYMBOL, "=", label->text}});
        return;
    }

    const auto& element = std::get<model::Element>(normalized);
    spdlog::debug("Element {} resolved by atomic number", describe(raw));
    builder.addJoin(schema::element::TABLE, schema::ID, table, column);
    builder.addWhere(schema::element::TABLE, schema::element::ATOMIC_NUMBER,
                     "=", element.atomicNumber());
}

void EntityResolver::selectAtomicShell(QueryBuilder& builder,
                                       const std::string& table,
                                       const std::string& column,
                                       const RawAtomicShell& raw) const {
    auto normalized = normalizeAtomicShell(raw);

    if (const auto* label = std::get_if<NotationLabel>(&normalized)) {
        spdlog::debug("Atomic shell {} resolved by notation", describe(raw));
        filterNotationLabel(builder, table, column,
                            schema::atomic_shell::NOTATION_TABLE,
                            schema::atomic_shell::NOTATION_KEY, *label);
        return;
    }

    const auto& shell = std::get<model::AtomicShell>(normalized);
    spdlog::debug("Atomic shell {} resolved by quantum number", describe(raw));
    builder.addJoin(schema::atomic_shell::TABLE, schema::ID, table, column);
    builder.addWhere(schema::atomic_shell::TABLE,
                     schema::atomic_shell::PRINCIPAL_QUANTUM_NUMBER, "=",
                     shell.n());
}

void EntityResolver::selectAtomicSubshell(QueryBuilder& builder,
                                          const std::string& table,
                                          const std::string& column,
                                          const RawAtomicSubshell& raw) const {
    auto normalized = normalizeAtomicSubshell(raw);

    if (const auto* label = std::get_if<NotationLabel>(&normalized)) {
        spdlog::debug("Atomic subshell {} resolved by notation",
                      describe(raw));
        filterNotationLabel(builder, table, column,
                            schema::atomic_subshell::NOTATION_TABLE,
                            schema::atomic_subshell::NOTATION_KEY, *label);
        return;
    }

    spdlog::debug("Atomic subshell {} resolved by quantum numbers",
                  describe(raw));
    filterAtomicSubshell(builder, table, column,
                         std::get<model::AtomicSubshell>(normalized));
}

void EntityResolver::selectTransition(QueryBuilder& builder,
                                      const std::string& table,
                                      const std::string& column,
                                      const RawTransition& raw) const {
    auto normalized = normalizeTransition(raw);

    if (const auto* label = std::get_if<NotationLabel>(&normalized)) {
        spdlog::debug("Transition {} resolved by notation", describe(raw));
        filterNotationLabel(builder, table, column,
                            schema::transition::NOTATION_TABLE,
                            schema::transition::NOTATION_KEY, *label);
        return;
    }

    spdlog::debug("Transition {} resolved by quantum numbers", describe(raw));
    filterTransition(builder, table, column,
                     std::get<model::Transition>(normalized));
}

void EntityResolver::selectTransitionSet(QueryBuilder& builder,
                                         const std::string& table,
                                         const std::string& column,
                                         const RawTransitionSet& raw,
                                         std::stop_token stop) const {
    auto normalized = normalizeTransitionSet(raw);

    if (const auto* label = std::get_if<NotationLabel>(&normalized)) {
        spdlog::debug("Transition set {} resolved by notation", describe(raw));
        filterNotationLabel(builder, table, column,
                            schema::transitionset::NOTATION_TABLE,
                            schema::transitionset::NOTATION_KEY, *label);
        return;
    }

    spdlog::debug("Transition set {} resolved by membership", describe(raw));
    int64_t id = matchTransitionSet(
        std::get<model::TransitionSet>(normalized), executor_, std::move(stop));

    builder.addJoin(schema::transitionset::TABLE, schema::ID, table, column);
    builder.addWhere(schema::transitionset::TABLE, schema::ID, "=", id);
}

void EntityResolver::selectNotation(QueryBuilder& builder,
                                    const std::string& table,
                                    const RawNotation& raw) const {
    auto notation = normalizeNotation(raw);
    builder.addJoin(schema::notation::TABLE, schema::ID, table,
                    schema::notation::FOREIGN_KEY);
    builder.addWhere(schema::notation::TABLE, schema::notation::NAME, "=",
                     notation.name());
}

void EntityResolver::selectLanguage(QueryBuilder& builder,
                                    const std::string& table,
                                    const RawLanguage& raw) const {
    auto language = normalizeLanguage(raw);
    builder.addJoin(schema::language::TABLE, schema::ID, table,
                    schema::language::FOREIGN_KEY);
    builder.addWhere(schema::language::TABLE, schema::language::CODE, "=",
                     language.code());
}

void EntityResolver::selectReference(
    QueryBuilder& builder, const std::string& table, const RawReference& raw,
    std::optional<std::string_view> property) const {
    std::optional<std::string> key;
    if (auto reference = normalizeReference(raw)) {
        key = reference->bibtexKey();
    } else if (property) {
        key = config_.getDefaultReference(*property);
        if (key) {
            spdlog::debug("Default reference of {}: {}", *property, *key);
        }
    }

    if (!key) {
        builder.addOrderBy(table, schema::reference::FOREIGN_KEY);
        return;
    }

    builder.addJoin(schema::reference::TABLE, schema::ID, table,
                    schema::reference::FOREIGN_KEY);
    builder.addWhere(schema::reference::TABLE, schema::reference::BIBTEXKEY,
                     "=", *key);
}

}  // namespace xrayref::resolve
