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

#ifndef XRAYREF_RESOLVE_SCHEMA_HPP
#define XRAYREF_RESOLVE_SCHEMA_HPP

/**
 * @file schema.hpp
 * @brief Table and column names of the reference data store.
 *
 * The store is populated by the ingestion tooling; the resolvers only read
 * it. Every entity table has an integer surrogate key `id`. Every notation
 * table carries an `ascii` and a `utf16` rendering of its label.
 */

namespace xrayref::resolve::schema {

inline constexpr const char* ID = "id";

// Notation renderings
inline constexpr const char* ASCII = "ascii";
inline constexpr const char* UTF16 = "utf16";

namespace element {
inline constexpr const char* TABLE = "element";
inline constexpr const char* ATOMIC_NUMBER = "atomic_number";
}  // namespace element

namespace element_name {
inline constexpr const char* TABLE = "element_name";
inline constexpr const char* ELEMENT_ID = "element_id";
inline constexpr const char* NAME = "name";
}  // namespace element_name

namespace element_symbol {
inline constexpr const char* TABLE = "element_symbol";
inline constexpr const char* ELEMENT_ID = "element_id";
inline constexpr const char* SYMBOL = "symbol";
}  // namespace element_symbol

namespace atomic_shell {
inline constexpr const char* TABLE = "atomic_shell";
inline constexpr const char* PRINCIPAL_QUANTUM_NUMBER =
    "principal_quantum_number";
inline constexpr const char* NOTATION_TABLE = "atomic_shell_notation";
inline constexpr const char* NOTATION_KEY = "atomic_shell_id";
}  // namespace atomic_shell

namespace atomic_subshell {
inline constexpr const char* TABLE = "atomic_subshell";
inline constexpr const char* ATOMIC_SHELL_ID = "atomic_shell_id";
inline constexpr const char* AZIMUTHAL_QUANTUM_NUMBER =
    "azimuthal_quantum_number";
inline constexpr const char* TOTAL_ANGULAR_MOMENTUM_NOMINATOR =
    "total_angular_momentum_nominator";
inline constexpr const char* NOTATION_TABLE = "atomic_subshell_notation";
inline constexpr const char* NOTATION_KEY = "atomic_subshell_id";
}  // namespace atomic_subshell

namespace transition {
inline constexpr const char* TABLE = "transition";
inline constexpr const char* SOURCE_SUBSHELL_ID = "source_subshell_id";
inline constexpr const char* DESTINATION_SUBSHELL_ID =
    "destination_subshell_id";
inline constexpr const char* NOTATION_TABLE = "transition_notation";
inline constexpr const char* NOTATION_KEY = "transition_id";

// Aliases for the two sides of a transition
inline constexpr const char* SOURCE_SUBSHELL_ALIAS = "srcsubshell";
inline constexpr const char* DESTINATION_SUBSHELL_ALIAS = "dstsubshell";
inline constexpr const char* SOURCE_SHELL_ALIAS = "srcshell";
inline constexpr const char* DESTINATION_SHELL_ALIAS = "dstshell";
}  // namespace transition

namespace transitionset {
inline constexpr const char* TABLE = "transitionset";
inline constexpr const char* COUNT = "count";
inline constexpr const char* ASSOCIATION_TABLE = "transitionset_association";
inline constexpr const char* ASSOCIATION_SET_ID = "transitionset_id";
inline constexpr const char* ASSOCIATION_TRANSITION_ID = "transition_id";
inline constexpr const char* NOTATION_TABLE = "transitionset_notation";
inline constexpr const char* NOTATION_KEY = "transitionset_id";
}  // namespace transitionset

namespace notation {
inline constexpr const char* TABLE = "notation";
inline constexpr const char* NAME = "name";
inline constexpr const char* FOREIGN_KEY = "notation_id";
}  // namespace notation

namespace language {
inline constexpr const char* TABLE = "language";
inline constexpr const char* CODE = "code";
inline constexpr const char* FOREIGN_KEY = "language_id";
}  // namespace language

namespace reference {
inline constexpr const char* TABLE = "ref";
inline constexpr const char* BIBTEXKEY = "bibtexkey";
inline constexpr const char* FOREIGN_KEY = "reference_id";
}  // namespace reference

}  // namespace xrayref::resolve::schema

#endif  // XRAYREF_RESOLVE_SCHEMA_HPP
