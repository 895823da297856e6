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

#ifndef RELATA_CONFIG_CONFIG_LOADER_HPP
#define RELATA_CONFIG_CONFIG_LOADER_HPP

#include <filesystem>
#include <string_view>

#include <nlohmann/json.hpp>

#include "exception.hpp"
#include "relata_config.hpp"

namespace relata::config {

/**
 * @brief Loads a configuration file.
 *
 * `.json` files are parsed with nlohmann_json, `.yaml`/`.yml` files with
 * yaml-cpp. Settings are read from the top-level "relata" object; a file
 * without one yields the defaults.
 *
 * @throws ConfigLoadError if the file is missing, unreadable, malformed,
 * of an unknown type, or holds mistyped or invalid values
 */
[[nodiscard]] RelataConfig loadConfigFile(const std::filesystem::path& path);

/**
 * @brief Parses YAML text into the equivalent JSON tree.
 * @throws ConfigLoadError on a YAML syntax error
 */
[[nodiscard]] json parseYaml(std::string_view content);

}  // namespace relata::config

#endif  // RELATA_CONFIG_CONFIG_LOADER_HPP
