// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Relata - Relation mapping and lifecycle hooks for record stores
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

#ifndef RELATA_LOGGING_LOGGING_HPP
#define RELATA_LOGGING_LOGGING_HPP

#include <memory>
#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

#include "config/relata_config.hpp"

namespace relata::logging {

/// Name of the logger installed as spdlog's default.
inline constexpr std::string_view LOGGER_NAME = "relata";

/// Environment variable overriding the configured level.
inline constexpr const char* LEVEL_ENV = "RELATA_LOG_LEVEL";

/**
 * @brief Parses a level name ("warn" and "warning" are both accepted).
 * @return The level, or nullopt for an unknown name.
 */
[[nodiscard]] std::optional<spdlog::level::level_enum> parseLevel(
    std::string_view name);

/**
 * @brief Installs a colored stdout logger named "relata" as spdlog's
 * default logger.
 *
 * Calling it again replaces the logger. An unknown level in the config or
 * the environment falls back to "info" with a warning.
 */
void initialize(const config::LoggingSection& section);

/**
 * @brief Level that initialize() would apply for a section, after the
 * environment override.
 */
[[nodiscard]] spdlog::level::level_enum effectiveLevel(
    const config::LoggingSection& section);

}  // namespace relata::logging

#endif  // RELATA_LOGGING_LOGGING_HPP
