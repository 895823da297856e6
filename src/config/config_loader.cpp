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

#include "config_loader.hpp"

#include <charconv>
#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace relata::config {

namespace {

constexpr size_t MAX_YAML_DEPTH = 64;

json yamlScalarToJson(const YAML::Node& node) {
    const auto& value = node.Scalar();

    // Quoted scalars are always strings
    if (node.Tag() == "!") {
        return json(value);
    }

    if (value == "true" || value == "True" || value == "TRUE" ||
        value == "yes" || value == "Yes" || value == "YES" || value == "on" ||
        value == "On" || value == "ON") {
        return json(true);
    }
    if (value == "false" || value == "False" || value == "FALSE" ||
        value == "no" || value == "No" || value == "NO" || value == "off" ||
        value == "Off" || value == "OFF") {
        return json(false);
    }
    if (value == "null" || value == "Null" || value == "NULL" ||
        value == "~" || value.empty()) {
        return json(nullptr);
    }

    const char* first = value.data();
    const char* last = value.data() + value.size();

    long long intVal = 0;
    auto [intEnd, intErr] = std::from_chars(first, last, intVal);
    if (intErr == std::errc() && intEnd == last) {
        return json(intVal);
    }

    double floatVal = 0.0;
    auto [floatEnd, floatErr] = std::from_chars(first, last, floatVal);
    if (floatErr == std::errc() && floatEnd == last) {
        return json(floatVal);
    }

    return json(value);
}

json yamlNodeToJson(const YAML::Node& node, size_t depth) {
    if (depth > MAX_YAML_DEPTH) {
        THROW_CONFIG_LOAD_ERROR("Maximum YAML nesting depth exceeded");
    }

    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            return yamlScalarToJson(node);

        case YAML::NodeType::Sequence: {
            json arr = json::array();
            for (const auto& item : node) {
                arr.push_back(yamlNodeToJson(item, depth + 1));
            }
            return arr;
        }

        case YAML::NodeType::Map: {
            json obj = json::object();
            for (const auto& pair : node) {
                obj[pair.first.as<std::string>()] =
                    yamlNodeToJson(pair.second, depth + 1);
            }
            return obj;
        }

        default:
            return json(nullptr);
    }
}

std::string readFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        spdlog::error("Cannot open config file {}", path.string());
        THROW_CONFIG_LOAD_ERROR("Cannot open config file " + path.string());
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

}  // namespace

json parseYaml(std::string_view content) {
    try {
        return yamlNodeToJson(YAML::Load(std::string(content)), 0);
    } catch (const YAML::Exception& e) {
        THROW_CONFIG_LOAD_ERROR(std::string("YAML parse error: ") + e.what());
    }
}

RelataConfig loadConfigFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        spdlog::error("Config file not found: {}", path.string());
        THROW_CONFIG_LOAD_ERROR("Config file not found: " + path.string());
    }

    const auto extension = path.extension().string();
    const auto content = readFile(path);

    json document;
    if (extension == ".json") {
        try {
            document = json::parse(content);
        } catch (const json::parse_error& e) {
            spdlog::error("Malformed JSON in {}: {}", path.string(), e.what());
            THROW_CONFIG_LOAD_ERROR("Malformed JSON in " + path.string() +
                                    ": " + e.what());
        }
    } else if (extension == ".yaml" || extension == ".yml") {
        try {
            document = parseYaml(content);
        } catch (const ConfigLoadError& e) {
            spdlog::error("Malformed YAML in {}: {}", path.string(), e.what());
            throw;
        }
    } else {
        spdlog::error("Unsupported config file type: {}", path.string());
        THROW_CONFIG_LOAD_ERROR("Unsupported config file type: " +
                                path.string());
    }

    json root = json::object();
    if (document.is_object() && document.contains("relata")) {
        root = document["relata"];
    }

    RelataConfig config;
    try {
        config = RelataConfig::fromJson(root);
    } catch (const json::exception& e) {
        spdlog::error("Invalid value in {}: {}", path.string(), e.what());
        THROW_CONFIG_LOAD_ERROR("Invalid value in " + path.string() + ": " +
                                e.what());
    }

    auto validation = config.validate();
    if (!validation) {
        std::string message = "Invalid configuration in " + path.string();
        for (const auto& error : validation.errors) {
            message += "; " + error.path + ": " + error.message;
        }
        spdlog::error("{}", message);
        THROW_CONFIG_LOAD_ERROR(message);
    }

    spdlog::info("Loaded configuration from {}", path.string());
    return config;
}

}  // namespace relata::config
