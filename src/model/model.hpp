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

#ifndef XRAYREF_MODEL_HPP
#define XRAYREF_MODEL_HPP

/**
 * @file model.hpp
 * @brief Facade header for the value-object model.
 *
 * - Element, AtomicShell, AtomicSubshell
 * - Transition, TransitionSet and the radiative selection rules
 * - Notation, Language, Reference
 * - Subshell/transition enumeration
 */

#include "atomic_shell.hpp"
#include "atomic_subshell.hpp"
#include "element.hpp"
#include "enumeration.hpp"
#include "language.hpp"
#include "notation.hpp"
#include "reference.hpp"
#include "selection_rules.hpp"
#include "transition.hpp"
#include "transition_set.hpp"
#include "types.hpp"

#endif  // XRAYREF_MODEL_HPP
