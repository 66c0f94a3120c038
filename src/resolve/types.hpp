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

#ifndef XRAYREF_RESOLVE_TYPES_HPP
#define XRAYREF_RESOLVE_TYPES_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "atom/error/exception.hpp"

namespace xrayref::resolve {

/**
 * @brief The closed set of entity kinds an identifier can refer to.
 */
enum class EntityKind {
    Element,
    AtomicShell,
    AtomicSubshell,
    Transition,
    TransitionSet,
    Notation,
    Language,
    Reference
};

[[nodiscard]] constexpr std::string_view entityKindName(EntityKind kind) {
    switch (kind) {
        case EntityKind::Element: return "element";
        case EntityKind::AtomicShell: return "atomic shell";
        case EntityKind::AtomicSubshell: return "atomic subshell";
        case EntityKind::Transition: return "transition";
        case EntityKind::TransitionSet: return "transition set";
        case EntityKind::Notation: return "notation";
        case EntityKind::Language: return "language";
        case EntityKind::Reference: return "reference";
    }
    return "unknown";
}

/**
 * @brief Base of the errors that name an entity kind and the caller's raw
 * identifier.
 */
class IdentifierError : public atom::error::Exception {
public:
    IdentifierError(const char* file, int line, const char* func,
                    EntityKind kind, std::string value, std::string_view what)
        : Exception(file, line, func,
                    std::string(what) + " " +
                        std::string(entityKindName(kind)) + ": " + value),
          kind_(kind),
          value_(std::move(value)) {}

    [[nodiscard]] EntityKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& value() const noexcept { return value_; }

private:
    EntityKind kind_;
    std::string value_;
};

/// The input matches none of the accepted shapes for its kind.
class UnresolvedIdentifier : public IdentifierError {
public:
    UnresolvedIdentifier(const char* file, int line, const char* func,
                         EntityKind kind, std::string value)
        : IdentifierError(file, line, func, kind, std::move(value),
                          "Cannot classify") {}
};

/// A well-formed identifier matches no stored entity.
class NotFound : public IdentifierError {
public:
    NotFound(const char* file, int line, const char* func, EntityKind kind,
             std::string value)
        : IdentifierError(file, line, func, kind, std::move(value),
                          "Cannot find") {}
};

/**
 * @brief More than one stored entity matches. This is a data-integrity
 * problem in the store, never a caller error.
 */
class AmbiguousMatch : public IdentifierError {
public:
    AmbiguousMatch(const char* file, int line, const char* func,
                   EntityKind kind, std::string value,
                   std::vector<int64_t> candidates)
        : IdentifierError(file, line, func, kind, std::move(value),
                          "Several stored rows match"),
          candidates_(std::move(candidates)) {}

    [[nodiscard]] const std::vector<int64_t>& candidates() const noexcept {
        return candidates_;
    }

private:
    std::vector<int64_t> candidates_;
};

/// The caller requested a stop while a resolution was in progress.
class ResolutionCancelled : public atom::error::Exception {
public:
    using Exception::Exception;
};

#define THROW_UNRESOLVED_IDENTIFIER(kind, value)                        \
    throw xrayref::resolve::UnresolvedIdentifier(                       \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, kind, value)

#define THROW_NOT_FOUND(kind, value)                                    \
    throw xrayref::resolve::NotFound(ATOM_FILE_NAME, ATOM_FILE_LINE,    \
                                     ATOM_FUNC_NAME, kind, value)

#define THROW_AMBIGUOUS_MATCH(kind, value, candidates)                  \
    throw xrayref::resolve::AmbiguousMatch(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                           ATOM_FUNC_NAME, kind, value, \
                                           candidates)

#define THROW_RESOLUTION_CANCELLED(...)                                 \
    throw xrayref::resolve::ResolutionCancelled(                        \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace xrayref::resolve

#endif  // XRAYREF_RESOLVE_TYPES_HPP
