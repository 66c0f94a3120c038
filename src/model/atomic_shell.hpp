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

#ifndef XRAYREF_MODEL_ATOMIC_SHELL_HPP
#define XRAYREF_MODEL_ATOMIC_SHELL_HPP

#include <compare>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>

namespace xrayref::model {

/**
 * @brief An electron shell identified by its principal quantum number n >= 1.
 */
class AtomicShell {
public:
    /**
     * @brief Constructs an atomic shell.
     *
     * @param principalQuantumNumber n.
     * @throws ValidationError if n < 1
     */
    explicit AtomicShell(int principalQuantumNumber);

    [[nodiscard]] int principalQuantumNumber() const noexcept {
        return principalQuantumNumber_;
    }
    [[nodiscard]] int n() const noexcept { return principalQuantumNumber_; }

    [[nodiscard]] std::string toString() const;

    auto operator<=>(const AtomicShell&) const = default;

private:
    int principalQuantumNumber_;
};

std::ostream& operator<<(std::ostream& os, const AtomicShell& shell);

}  // namespace xrayref::model

template <>
struct std::hash<xrayref::model::AtomicShell> {
    std::size_t operator()(
        const xrayref::model::AtomicShell& shell) const noexcept {
        return std::hash<int>{}(shell.n());
    }
};

#endif  // XRAYREF_MODEL_ATOMIC_SHELL_HPP
