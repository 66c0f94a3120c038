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

#include "filters.hpp"

#include "schema.hpp"

namespace xrayref::resolve {

namespace {

// Joins a subshell and its owning shell under the given aliases and filters
// on the subshell's quantum numbers.
void filterSubshellSide(QueryBuilder& builder, const std::string& fromTable,
                        const std::string& fromKey,
                        const std::string& subshellAlias,
                        const std::string& shellAlias,
                        const model::AtomicSubshell& subshell) {
    builder.addJoin(schema::atomic_subshell::TABLE, schema::ID, fromTable,
                    fromKey, subshellAlias);
    builder.addJoin(schema::atomic_shell::TABLE, schema::ID, subshellAlias,
                    schema::atomic_subshell::ATOMIC_SHELL_ID, shellAlias);

    builder.addWhere(shellAlias,
                     schema::atomic_shell::PRINCIPAL_QUANTUM_NUMBER, "=",
                     subshell.n());
    builder.addWhere(subshellAlias,
                     schema::atomic_subshell::AZIMUTHAL_QUANTUM_NUMBER, "=",
                     subshell.l());
    builder.addWhere(subshellAlias,
                     schema::atomic_subshell::TOTAL_ANGULAR_MOMENTUM_NOMINATOR,
                     "=", subshell.jn());
}

}  // namespace

void filterNotationLabel(QueryBuilder& builder, const std::string& table,
                         const std::string& column,
                         const std::string& notationTable,
                         const std::string& notationKey,
                         const NotationLabel& label) {
    builder.addJoin(notationTable, notationKey, table, column);
    builder.addWhere({{notationTable, schema::ASCII, "=", label.text},
                      {notationTable, schema::UTF16, "=", label.text}});
}

void filterAtomicSubshell(QueryBuilder& builder, const std::string& table,
                          const std::string& column,
                          const model::AtomicSubshell& subshell) {
    filterSubshellSide(builder, table, column,
                       schema::atomic_subshell::TABLE,
                       schema::atomic_shell::TABLE, subshell);
}

void filterTransition(QueryBuilder& builder, const std::string& table,
                      const std::string& column,
                      const model::Transition& transition) {
    builder.addJoin(schema::transition::TABLE, schema::ID, table, column);
    filterSubshellSide(builder, schema::transition::TABLE,
                       schema::transition::SOURCE_SUBSHELL_ID,
                       schema::transition::SOURCE_SUBSHELL_ALIAS,
                       schema::transition::SOURCE_SHELL_ALIAS,
                       transition.source());
    filterSubshellSide(builder, schema::transition::TABLE,
                       schema::transition::DESTINATION_SUBSHELL_ID,
                       schema::transition::DESTINATION_SUBSHELL_ALIAS,
                       schema::transition::DESTINATION_SHELL_ALIAS,
                       transition.destination());
}

}  // namespace xrayref::resolve
