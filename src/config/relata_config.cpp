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

#include "relata_config.hpp"

#include <array>

namespace relata::config {

namespace {

constexpr std::array<std::string_view, 7> LOG_LEVELS = {
    "trace", "debug", "info", "warn", "error", "critical", "off"};

json sectionOf(const json& root, std::string_view key) {
    if (!root.is_object()) {
        return json::object();
    }
    auto it = root.find(std::string(key));
    if (it == root.end() || it->is_null()) {
        return json::object();
    }
    return *it;
}

void requireNonEmpty(ConfigValidationResult& result, std::string_view path,
                     const char* field, const std::string& value) {
    if (value.empty()) {
        result.addError(std::string(path) + "/" + field, "must not be empty");
    }
}

}  // namespace

//------------------------------------------------------------------------------
// MappingSection
//------------------------------------------------------------------------------

std::filesystem::path MappingSection::resolvedModelsDirectory() const {
    return std::filesystem::absolute(modelsDirectory).lexically_normal();
}

model::RecordKindOptions MappingSection::kindDefaults() const {
    model::RecordKindOptions options;
    options.idColumn = idColumn;
    options.timestamps = timestamps;
    options.createdAtColumn = createdAtColumn;
    options.updatedAtColumn = updatedAtColumn;
    return options;
}

json MappingSection::serialize() const {
    return {{"modelsDirectory", modelsDirectory},
            {"idColumn", idColumn},
            {"timestamps", timestamps},
            {"createdAtColumn", createdAtColumn},
            {"updatedAtColumn", updatedAtColumn}};
}

MappingSection MappingSection::deserialize(const json& j) {
    MappingSection config;
    config.modelsDirectory = j.value("modelsDirectory", config.modelsDirectory);
    config.idColumn = j.value("idColumn", config.idColumn);
    config.timestamps = j.value("timestamps", config.timestamps);
    config.createdAtColumn = j.value("createdAtColumn", config.createdAtColumn);
    config.updatedAtColumn = j.value("updatedAtColumn", config.updatedAtColumn);
    return config;
}

json MappingSection::generateSchema() {
    json schema;
    schema["type"] = "object";
    MappingSection defaults;
    addSchemaProperty(schema, "modelsDirectory", "string",
                      defaults.modelsDirectory,
                      "Directory bare record-kind names resolve under");
    addSchemaProperty(schema, "idColumn", "string", defaults.idColumn,
                      "Primary key column");
    addSchemaProperty(schema, "timestamps", "boolean", defaults.timestamps,
                      "Stamp createdAt/updatedAt on writes");
    addSchemaProperty(schema, "createdAtColumn", "string",
                      defaults.createdAtColumn);
    addSchemaProperty(schema, "updatedAtColumn", "string",
                      defaults.updatedAtColumn);
    return schema;
}

void MappingSection::check(ConfigValidationResult& result) const {
    requireNonEmpty(result, PATH, "modelsDirectory", modelsDirectory);
    requireNonEmpty(result, PATH, "idColumn", idColumn);
    requireNonEmpty(result, PATH, "createdAtColumn", createdAtColumn);
    requireNonEmpty(result, PATH, "updatedAtColumn", updatedAtColumn);
    if (timestamps && createdAtColumn == updatedAtColumn) {
        result.addError(std::string(PATH),
                        "createdAtColumn and updatedAtColumn must differ");
    }
}

//------------------------------------------------------------------------------
// LoggingSection
//------------------------------------------------------------------------------

json LoggingSection::serialize() const {
    return {{"level", level}, {"pattern", pattern}};
}

LoggingSection LoggingSection::deserialize(const json& j) {
    LoggingSection config;
    config.level = j.value("level", config.level);
    config.pattern = j.value("pattern", config.pattern);
    return config;
}

json LoggingSection::generateSchema() {
    json schema;
    schema["type"] = "object";
    LoggingSection defaults;
    addSchemaProperty(schema, "level", "string", defaults.level);
    addEnum(schema, "level", "trace", "debug", "info", "warn", "error",
            "critical", "off");
    addSchemaProperty(schema, "pattern", "string", defaults.pattern,
                      "spdlog pattern");
    return schema;
}

void LoggingSection::check(ConfigValidationResult& result) const {
    bool known = false;
    for (auto candidate : LOG_LEVELS) {
        known = known || candidate == level;
    }
    if (!known) {
        result.addError(std::string(PATH) + "/level",
                        "unknown log level: " + level);
    }
    requireNonEmpty(result, PATH, "pattern", pattern);
}

//------------------------------------------------------------------------------
// RelataConfig
//------------------------------------------------------------------------------

json RelataConfig::toJson() const {
    return {{"mapping", mapping.toJson()}, {"logging", logging.toJson()}};
}

RelataConfig RelataConfig::fromJson(const json& root) {
    RelataConfig config;
    config.mapping = MappingSection::fromJson(sectionOf(root, "mapping"));
    config.logging = LoggingSection::fromJson(sectionOf(root, "logging"));
    return config;
}

ConfigValidationResult RelataConfig::validate() const {
    auto result = mapping.validate();
    for (auto& error : logging.validate().errors) {
        result.addError(std::move(error.path), std::move(error.message));
    }
    return result;
}

}  // namespace relata::config
