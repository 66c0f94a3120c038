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

#include "identifier.hpp"

#include <type_traits>

namespace xrayref::resolve {

namespace {

std::string quote(const std::string& text) { return "'" + text + "'"; }

std::string describeNumbers(const std::vector<int>& numbers) {
    std::string out = "(";
    for (size_t i = 0; i < numbers.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += std::to_string(numbers[i]);
    }
    return out + ")";
}

template <typename Variant>
std::string describeSequence(const std::vector<Variant>& items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += describe(items[i]);
    }
    return out + "]";
}

}  // namespace

std::string describe(const RawElement& raw) {
    return std::visit(
        [](const auto& value) -> std::string {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, int>) {
                return std::to_string(value);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return quote(value);
            } else {
                return value.toString();
            }
        },
        raw);
}

std::string describe(const RawAtomicShell& raw) {
    return std::visit(
        [](const auto& value) -> std::string {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, int>) {
                return std::to_string(value);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return quote(value);
            } else {
                return value.toString();
            }
        },
        raw);
}

std::string describe(const RawAtomicSubshell& raw) {
    return std::visit(
        [](const auto& value) -> std::string {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::vector<int>>) {
                return describeNumbers(value);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return quote(value);
            } else {
                return value.toString();
            }
        },
        raw);
}

std::string describe(const RawTransition& raw) {
    return std::visit(
        [](const auto& value) -> std::string {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::vector<int>>) {
                return describeNumbers(value);
            } else if constexpr (std::is_same_v<T,
                                                std::vector<RawAtomicSubshell>>) {
                return describeSequence(value);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return quote(value);
            } else {
                return value.toString();
            }
        },
        raw);
}

std::string describe(const RawTransitionSet& raw) {
    return std::visit(
        [](const auto& value) -> std::string {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::vector<RawTransition>>) {
                return describeSequence(value);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return quote(value);
            } else {
                return value.toString();
            }
        },
        raw);
}

std::string describe(const RawNotation& raw) {
    if (const auto* text = std::get_if<std::string>(&raw)) {
        return quote(*text);
    }
    return std::get<model::Notation>(raw).toString();
}

std::string describe(const RawLanguage& raw) {
    if (const auto* text = std::get_if<std::string>(&raw)) {
        return quote(*text);
    }
    return std::get<model::Language>(raw).toString();
}

std::string describe(const RawReference& raw) {
    if (const auto* text = std::get_if<std::string>(&raw)) {
        return quote(*text);
    }
    if (const auto* reference = std::get_if<model::Reference>(&raw)) {
        return reference->toString();
    }
    return "<unspecified>";
}

}  // namespace xrayref::resolve
