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

#ifndef XRAYREF_RESOLVE_NORMALIZER_HPP
#define XRAYREF_RESOLVE_NORMALIZER_HPP

#include <optional>

#include "identifier.hpp"

namespace xrayref::resolve {

/**
 * @brief Classifies raw identifiers into canonical value objects or lookup
 * labels.
 *
 * Each function maps every alternative of its raw variant to exactly one
 * outcome. Structural inputs that do not fit (a triple with the wrong
 * arity, an empty label, a transition pair whose members are labels) raise
 * UnresolvedIdentifier. Invalid quantum numbers raise the ValidationError
 * of the value object unchanged.
 */

/// Integers become Element(z); strings are element names or symbols.
[[nodiscard]] Normalized<model::Element> normalizeElement(const RawElement& raw);

[[nodiscard]] Normalized<model::AtomicShell> normalizeAtomicShell(
    const RawAtomicShell& raw);

[[nodiscard]] Normalized<model::AtomicSubshell> normalizeAtomicSubshell(
    const RawAtomicSubshell& raw);

/// Pair members are normalized with normalizeAtomicSubshell().
[[nodiscard]] Normalized<model::Transition> normalizeTransition(
    const RawTransition& raw);

/// Members are normalized with normalizeTransition() then deduplicated.
[[nodiscard]] Normalized<model::TransitionSet> normalizeTransitionSet(
    const RawTransitionSet& raw);

[[nodiscard]] model::Notation normalizeNotation(const RawNotation& raw);

[[nodiscard]] model::Language normalizeLanguage(const RawLanguage& raw);

/// Returns std::nullopt for an unspecified reference (or an empty key).
[[nodiscard]] std::optional<model::Reference> normalizeReference(
    const RawReference& raw);

}  // namespace xrayref::resolve

#endif  // XRAYREF_RESOLVE_NORMALIZER_HPP
