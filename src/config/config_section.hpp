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

#ifndef RELATA_CONFIG_CONFIG_SECTION_HPP
#define RELATA_CONFIG_CONFIG_SECTION_HPP

#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace relata::config {

using json = nlohmann::json;

/**
 * @brief A single validation failure
 */
struct ConfigValidationError {
    std::string path;     ///< Section path or field
    std::string message;  ///< What is wrong
};

/**
 * @brief Result of validating a configuration section
 */
struct ConfigValidationResult {
    bool valid{true};
    std::vector<ConfigValidationError> errors;

    [[nodiscard]] bool isValid() const noexcept { return valid; }

    [[nodiscard]] explicit operator bool() const noexcept { return valid; }

    void addError(std::string path, std::string message) {
        valid = false;
        errors.push_back({std::move(path), std::move(message)});
    }
};

/**
 * @brief Concept for valid ConfigSection derived types
 */
template <typename T>
concept ConfigSectionDerived = requires(const T t, const json& j,
                                        ConfigValidationResult& r) {
    { T::PATH } -> std::convertible_to<std::string_view>;
    { t.serialize() } -> std::convertible_to<json>;
    { T::deserialize(j) } -> std::convertible_to<T>;
    { T::generateSchema() } -> std::convertible_to<json>;
    t.check(r);
};

/**
 * @brief CRTP base class for type-safe configuration sections
 *
 * Derived classes must:
 *
 * 1. Define a static constexpr PATH member for the configuration path
 * 2. Implement serialize() to convert to JSON
 * 3. Implement static deserialize(const json&); missing keys keep defaults
 * 4. Implement static generateSchema() to return JSON Schema
 * 5. Implement check(ConfigValidationResult&) for field constraints
 *
 * @tparam Derived The derived configuration struct type (CRTP)
 */
template <typename Derived>
class ConfigSection {
public:
    /**
     * @brief Get the configuration path for this section
     * @return Configuration path (e.g., "/relata/mapping")
     */
    [[nodiscard]] static constexpr std::string_view path() noexcept {
        return Derived::PATH;
    }

    [[nodiscard]] json toJson() const {
        return static_cast<const Derived*>(this)->serialize();
    }

    /**
     * @brief Create a configuration from JSON
     * @throws nlohmann::json::exception on mistyped values
     */
    [[nodiscard]] static Derived fromJson(const json& j) {
        return Derived::deserialize(j);
    }

    /**
     * @brief Try to create a configuration from JSON
     * @return Configuration instance or nullopt if a value is mistyped
     */
    [[nodiscard]] static std::optional<Derived> tryFromJson(
        const json& j) noexcept {
        try {
            return Derived::deserialize(j);
        } catch (const json::exception&) {
            return std::nullopt;
        }
    }

    [[nodiscard]] static json schema() { return Derived::generateSchema(); }

    [[nodiscard]] static Derived defaults() { return Derived{}; }

    /**
     * @brief Validate this configuration's field constraints
     */
    [[nodiscard]] ConfigValidationResult validate() const {
        ConfigValidationResult result;
        static_cast<const Derived*>(this)->check(result);
        return result;
    }

    /**
     * @brief Merge another configuration into this one
     *
     * Values from other override values in this config; nulls are skipped.
     */
    void merge(const Derived& other) {
        auto thisJson = toJson();
        mergeJson(thisJson, other.toJson());
        *static_cast<Derived*>(this) = Derived::deserialize(thisJson);
    }

    [[nodiscard]] bool operator==(const ConfigSection& other) const {
        return toJson() == static_cast<const Derived&>(other).toJson();
    }

protected:
    /**
     * @brief Helper to add a property to a JSON Schema
     */
    template <typename T>
    static void addSchemaProperty(json& schema, const std::string& name,
                                  const std::string& type,
                                  const T& defaultValue,
                                  const std::string& description = "") {
        if (!schema.contains("properties")) {
            schema["properties"] = json::object();
        }
        json& prop = schema["properties"][name];
        prop["type"] = type;
        prop["default"] = defaultValue;
        if (!description.empty()) {
            prop["description"] = description;
        }
    }

    /**
     * @brief Helper to add enum constraint to a property
     */
    template <typename... Args>
    static void addEnum(json& schema, const std::string& name,
                        Args&&... values) {
        if (schema.contains("properties") &&
            schema["properties"].contains(name)) {
            schema["properties"][name]["enum"] =
                json::array({std::forward<Args>(values)...});
        }
    }

private:
    static void mergeJson(json& target, const json& source) {
        if (source.is_object()) {
            for (auto& [key, value] : source.items()) {
                if (value.is_object() && target.contains(key) &&
                    target[key].is_object()) {
                    mergeJson(target[key], value);
                } else if (!value.is_null()) {
                    target[key] = value;
                }
            }
        }
    }
};

}  // namespace relata::config

#endif  // RELATA_CONFIG_CONFIG_SECTION_HPP
