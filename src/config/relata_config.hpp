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

#ifndef RELATA_CONFIG_RELATA_CONFIG_HPP
#define RELATA_CONFIG_RELATA_CONFIG_HPP

#include <filesystem>
#include <string>

#include "config_section.hpp"
#include "model/record_kind.hpp"

namespace relata::config {

/**
 * @brief Mapping defaults shared by every record-kind of a context
 *
 * @example
 * ```yaml
 * relata:
 *   mapping:
 *     modelsDirectory: src/models
 *     idColumn: id
 *     timestamps: true
 * ```
 */
struct MappingSection : ConfigSection<MappingSection> {
    static constexpr std::string_view PATH = "/relata/mapping";

    std::string modelsDirectory = "src/models";  ///< Relative to the cwd
    std::string idColumn = "id";
    bool timestamps = true;
    std::string createdAtColumn = "createdAt";
    std::string updatedAtColumn = "updatedAt";

    /**
     * @brief modelsDirectory resolved against the working directory
     */
    [[nodiscard]] std::filesystem::path resolvedModelsDirectory() const;

    /**
     * @brief RecordKindOptions carrying these defaults
     */
    [[nodiscard]] model::RecordKindOptions kindDefaults() const;

    [[nodiscard]] json serialize() const;
    [[nodiscard]] static MappingSection deserialize(const json& j);
    [[nodiscard]] static json generateSchema();
    void check(ConfigValidationResult& result) const;
};

struct LoggingSection : ConfigSection<LoggingSection> {
    static constexpr std::string_view PATH = "/relata/logging";

    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

    [[nodiscard]] json serialize() const;
    [[nodiscard]] static LoggingSection deserialize(const json& j);
    [[nodiscard]] static json generateSchema();
    void check(ConfigValidationResult& result) const;
};

static_assert(ConfigSectionDerived<MappingSection>);
static_assert(ConfigSectionDerived<LoggingSection>);

/**
 * @brief Root configuration, read from the "relata" object of a file
 */
struct RelataConfig {
    MappingSection mapping;
    LoggingSection logging;

    [[nodiscard]] json toJson() const;

    /**
     * @param root Contents of the "relata" object; missing keys take defaults
     */
    [[nodiscard]] static RelataConfig fromJson(const json& root);

    [[nodiscard]] ConfigValidationResult validate() const;
};

}  // namespace relata::config

#endif  // RELATA_CONFIG_RELATA_CONFIG_HPP
