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

#include "normalizer.hpp"

#include <type_traits>

#include "types.hpp"

namespace xrayref::resolve {

namespace {

NotationLabel toLabel(EntityKind kind, const std::string& text) {
    if (text.empty()) {
        THROW_UNRESOLVED_IDENTIFIER(kind, "''");
    }
    return NotationLabel{text};
}

}  // namespace

Normalized<model::Element> normalizeElement(const RawElement& raw) {
    return std::visit(
        [](const auto& value) -> Normalized<model::Element> {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, int>) {
                return model::Element(value);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return toLabel(EntityKind::Element, value);
            } else {
                return value;
            }
        },
        raw);
}

Normalized<model::AtomicShell> normalizeAtomicShell(const RawAtomicShell& raw) {
    return std::visit(
        [](const auto& value) -> Normalized<model::AtomicShell> {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, int>) {
                return model::AtomicShell(value);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return toLabel(EntityKind::AtomicShell, value);
            } else {
                return value;
            }
        },
        raw);
}

Normalized<model::AtomicSubshell> normalizeAtomicSubshell(
    const RawAtomicSubshell& raw) {
    return std::visit(
        [&raw](const auto& value) -> Normalized<model::AtomicSubshell> {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::vector<int>>) {
                if (value.size() != 3) {
                    THROW_UNRESOLVED_IDENTIFIER(EntityKind::AtomicSubshell,
                                                describe(raw));
                }
                return model::AtomicSubshell(value[0], value[1], value[2]);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return toLabel(EntityKind::AtomicSubshell, value);
            } else {
                return value;
            }
        },
        raw);
}

Normalized<model::Transition> normalizeTransition(const RawTransition& raw) {
    return std::visit(
        [&raw](const auto& value) -> Normalized<model::Transition> {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::vector<RawAtomicSubshell>>) {
                if (value.size() != 2) {
                    THROW_UNRESOLVED_IDENTIFIER(EntityKind::Transition,
                                                describe(raw));
                }
                auto source = normalizeAtomicSubshell(value[0]);
                auto destination = normalizeAtomicSubshell(value[1]);
                const auto* src = std::get_if<model::AtomicSubshell>(&source);
                const auto* dst =
                    std::get_if<model::AtomicSubshell>(&destination);
                if (src == nullptr || dst == nullptr) {
                    // Labels cannot be split into quantum numbers
                    THROW_UNRESOLVED_IDENTIFIER(EntityKind::Transition,
                                                describe(raw));
                }
                return model::Transition(*src, *dst);
            } else if constexpr (std::is_same_v<T, std::vector<int>>) {
                if (value.size() != 6) {
                    THROW_UNRESOLVED_IDENTIFIER(EntityKind::Transition,
                                                describe(raw));
                }
                return model::Transition(value[0], value[1], value[2],
                                         value[3], value[4], value[5]);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return toLabel(EntityKind::Transition, value);
            } else {
                return value;
            }
        },
        raw);
}

Normalized<model::TransitionSet> normalizeTransitionSet(
    const RawTransitionSet& raw) {
    return std::visit(
        [&raw](const auto& value) -> Normalized<model::TransitionSet> {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::vector<RawTransition>>) {
                std::vector<model::Transition> transitions;
                transitions.reserve(value.size());
                for (const auto& member : value) {
                    auto transition = normalizeTransition(member);
                    if (const auto* t =
                            std::get_if<model::Transition>(&transition)) {
                        transitions.push_back(*t);
                    } else {
                        THROW_UNRESOLVED_IDENTIFIER(EntityKind::TransitionSet,
                                                    describe(raw));
                    }
                }
                // Deduplicates; throws ValidationError when empty
                return model::TransitionSet(transitions);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return toLabel(EntityKind::TransitionSet, value);
            } else {
                return value;
            }
        },
        raw);
}

model::Notation normalizeNotation(const RawNotation& raw) {
    if (const auto* name = std::get_if<std::string>(&raw)) {
        return model::Notation(*name);
    }
    return std::get<model::Notation>(raw);
}

model::Language normalizeLanguage(const RawLanguage& raw) {
    if (const auto* code = std::get_if<std::string>(&raw)) {
        return model::Language(*code);
    }
    return std::get<model::Language>(raw);
}

std::optional<model::Reference> normalizeReference(const RawReference& raw) {
    if (const auto* key = std::get_if<std::string>(&raw)) {
        if (key->empty()) {
            return std::nullopt;
        }
        return model::Reference(*key);
    }
    if (const auto* reference = std::get_if<model::Reference>(&raw)) {
        return *reference;
    }
    return std::nullopt;
}

}  // namespace xrayref::resolve
