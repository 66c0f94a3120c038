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

#ifndef XRAYREF_RESOLVE_IDENTIFIER_HPP
#define XRAYREF_RESOLVE_IDENTIFIER_HPP

#include <string>
#include <variant>
#include <vector>

#include "model/atomic_shell.hpp"
#include "model/atomic_subshell.hpp"
#include "model/element.hpp"
#include "model/language.hpp"
#include "model/notation.hpp"
#include "model/reference.hpp"
#include "model/transition.hpp"
#include "model/transition_set.hpp"

namespace xrayref::resolve {

// ============================================================================
// Raw identifiers: every shape a caller may use to address an entity
// ============================================================================

/// Value object, atomic number, or a name/symbol to look up.
using RawElement = std::variant<model::Element, int, std::string>;

/// Value object, principal quantum number, or a notation label.
using RawAtomicShell = std::variant<model::AtomicShell, int, std::string>;

/// Value object, (n, l, 2j), or a notation label.
using RawAtomicSubshell =
    std::variant<model::AtomicSubshell, std::vector<int>, std::string>;

/**
 * Value object, a (source, destination) pair of subshell identifiers, the
 * flat quantum numbers (n0, l0, 2j0, n1, l1, 2j1), or a notation label.
 */
using RawTransition =
    std::variant<model::Transition, std::vector<RawAtomicSubshell>,
                 std::vector<int>, std::string>;

/// Value object, a collection of transition identifiers, or a notation label.
using RawTransitionSet = std::variant<model::TransitionSet,
                                      std::vector<RawTransition>, std::string>;

using RawNotation = std::variant<model::Notation, std::string>;

using RawLanguage = std::variant<model::Language, std::string>;

/// No reference requested: the first stored reference is used.
struct UnspecifiedReference {
    bool operator==(const UnspecifiedReference&) const = default;
};

/// An empty key string is treated like UnspecifiedReference.
using RawReference =
    std::variant<UnspecifiedReference, model::Reference, std::string>;

// ============================================================================
// Normalized identifiers
// ============================================================================

/**
 * @brief A label that must be resolved through a lookup table (a notation
 * rendering, or an element name or symbol) rather than by structure.
 */
struct NotationLabel {
    std::string text;

    bool operator==(const NotationLabel&) const = default;
};

/// Either the canonical value object or a label to look up.
template <typename T>
using Normalized = std::variant<T, NotationLabel>;

// ============================================================================
// Descriptions for error messages and logs
// ============================================================================

[[nodiscard]] std::string describe(const RawElement& raw);
[[nodiscard]] std::string describe(const RawAtomicShell& raw);
[[nodiscard]] std::string describe(const RawAtomicSubshell& raw);
[[nodiscard]] std::string describe(const RawTransition& raw);
[[nodiscard]] std::string describe(const RawTransitionSet& raw);
[[nodiscard]] std::string describe(const RawNotation& raw);
[[nodiscard]] std::string describe(const RawLanguage& raw);
[[nodiscard]] std::string describe(const RawReference& raw);

}  // namespace xrayref::resolve

#endif  // XRAYREF_RESOLVE_IDENTIFIER_HPP
