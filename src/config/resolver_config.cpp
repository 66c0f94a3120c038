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

#include "resolver_config.hpp"

#include <algorithm>
#include <fstream>

#include <spdlog/spdlog.h>

#include "exception.hpp"
#include "model/types.hpp"

namespace xrayref::config {

namespace {

void requireReferenceProperty(std::string_view property) {
    if (!isReferenceProperty(property)) {
        THROW_MODEL_VALIDATION_ERROR("property", "a lookup property name",
                                     std::string(property));
    }
}

}  // namespace

bool isReferenceProperty(std::string_view property) {
    return std::find(REFERENCE_PROPERTIES.begin(), REFERENCE_PROPERTIES.end(),
                     property) != REFERENCE_PROPERTIES.end();
}

std::optional<std::string> ResolverConfig::getDefaultReference(
    std::string_view property) const {
    requireReferenceProperty(property);
    auto it = defaultReferences_.find(std::string(property));
    if (it == defaultReferences_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ResolverConfig::setDefaultReference(std::string_view property,
                                         std::string key) {
    requireReferenceProperty(property);
    if (key.empty()) {
        defaultReferences_.erase(std::string(property));
        return;
    }
    defaultReferences_[std::string(property)] = std::move(key);
}

json ResolverConfig::serialize() const {
    return {{"databasePath", databasePath},
            {"logLevel", logLevel},
            {"logPattern", logPattern},
            {"defaultReferences", defaultReferences_}};
}

ResolverConfig ResolverConfig::deserialize(const json& j) {
    ResolverConfig config;
    try {
        config.databasePath = j.value("databasePath", config.databasePath);
        config.logLevel = j.value("logLevel", config.logLevel);
        config.logPattern = j.value("logPattern", config.logPattern);
        if (j.contains("defaultReferences")) {
            for (const auto& [property, key] :
                 j.at("defaultReferences").items()) {
                config.setDefaultReference(property, key.get<std::string>());
            }
        }
    } catch (const json::exception& e) {
        spdlog::error("Invalid resolver configuration: {}", e.what());
        THROW_CONFIG_SERIALIZATION_EXCEPTION(
            std::string("Invalid resolver configuration: ") + e.what());
    }
    return config;
}

ResolverConfig ResolverConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::error("Failed to open config file: {}", path);
        THROW_CONFIG_IO_EXCEPTION("Failed to open config file: " + path);
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::parse_error& e) {
        spdlog::error("Failed to parse config file {}: {}", path, e.what());
        THROW_CONFIG_SERIALIZATION_EXCEPTION("Failed to parse " + path + ": " +
                                             e.what());
    }

    auto config = deserialize(j);
    spdlog::info("Loaded resolver configuration from {}", path);
    return config;
}

void applyLogging(const ResolverConfig& config) {
    auto level = spdlog::level::from_str(config.logLevel);
    if (level == spdlog::level::off && config.logLevel != "off") {
        THROW_CONFIG_SERIALIZATION_EXCEPTION("Unknown log level: " +
                                             config.logLevel);
    }
    spdlog::set_level(level);
    if (!config.logPattern.empty()) {
        spdlog::set_pattern(config.logPattern);
    }
    spdlog::debug("Log level set to {}", config.logLevel);
}

}  // namespace xrayref::config
