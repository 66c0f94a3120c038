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

#ifndef XRAYREF_CONFIG_RESOLVER_CONFIG_HPP
#define XRAYREF_CONFIG_RESOLVER_CONFIG_HPP

#include <array>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "atom/type/json.hpp"

namespace xrayref::config {

using json = nlohmann::json;

/// Lookup properties that may carry a preferred reference.
inline constexpr std::array<std::string_view, 17> REFERENCE_PROPERTIES = {
    "element_symbol",
    "element_name",
    "element_atomic_weight",
    "element_mass_density",
    "atomic_shell_notation",
    "atomic_subshell_notation",
    "atomic_subshell_binding_energy",
    "atomic_subshell_radiative_width",
    "atomic_subshell_nonradiative_width",
    "atomic_subshell_occupancy",
    "transition_notation",
    "transition_energy",
    "transition_probability",
    "transition_relative_weight",
    "transitionset_notation",
    "transitionset_energy",
    "transitionset_relative_weight"};

[[nodiscard]] bool isReferenceProperty(std::string_view property);

/**
 * @brief Settings of the resolution engine.
 *
 * Passed explicitly to the resolvers; nothing here is process-wide except
 * what applyLogging() installs on the default spdlog logger.
 */
struct ResolverConfig {
    /// Configuration path
    static constexpr std::string_view PATH = "/xrayref/resolver";

    std::string databasePath{"xrayref.sql"};  ///< Opened read-only
    std::string logLevel{"info"};             ///< spdlog level name
    std::string logPattern;                   ///< Empty keeps spdlog's pattern

    /**
     * @brief Preferred bibtex key for a property.
     *
     * @throws ValidationError if `property` is not a lookup property
     */
    [[nodiscard]] std::optional<std::string> getDefaultReference(
        std::string_view property) const;

    /**
     * @brief Sets the preferred bibtex key for a property. An empty key
     * clears it.
     *
     * @throws ValidationError if `property` is not a lookup property
     */
    void setDefaultReference(std::string_view property, std::string key);

    [[nodiscard]] const std::map<std::string, std::string>& defaultReferences()
        const {
        return defaultReferences_;
    }

    [[nodiscard]] json serialize() const;

    /**
     * @throws ConfigSerializationException if a field has the wrong type
     * @throws ValidationError if an unknown property carries a reference
     */
    [[nodiscard]] static ResolverConfig deserialize(const json& j);

    [[nodiscard]] json toJson() const { return serialize(); }

    [[nodiscard]] static ResolverConfig fromJson(const json& j) {
        return deserialize(j);
    }

    /**
     * @brief Reads a JSON document from disk.
     *
     * @throws ConfigIOException if the file cannot be read
     * @throws ConfigSerializationException if it is not valid JSON
     */
    [[nodiscard]] static ResolverConfig loadFromFile(const std::string& path);

private:
    std::map<std::string, std::string> defaultReferences_;
};

/**
 * @brief Applies the level and pattern of `config` to the default logger.
 *
 * @throws ConfigSerializationException if the level name is unknown
 */
void applyLogging(const ResolverConfig& config);

}  // namespace xrayref::config

#endif  // XRAYREF_CONFIG_RESOLVER_CONFIG_HPP
