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

#ifndef RELATA_MODEL_RECORD_HPP
#define RELATA_MODEL_RECORD_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "record_kind.hpp"

namespace relata::model {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief One in-memory record of a given kind.
 *
 * Column values live in a JSON object keyed by column name. The audit
 * timestamps are kept typed and are only turned into column values when
 * the persistence engine serializes the record.
 */
class Record {
public:
    explicit Record(const RecordKind& kind, json attributes = json::object());

    [[nodiscard]] const RecordKind& kind() const noexcept { return *kind_; }

    [[nodiscard]] json& attributes() noexcept { return attributes_; }
    [[nodiscard]] const json& attributes() const noexcept {
        return attributes_;
    }

    /**
     * @brief Gets a column value, or null when the column is unset.
     */
    [[nodiscard]] json get(std::string_view column) const;

    Record& set(const std::string& column, json value);

    [[nodiscard]] bool has(std::string_view column) const;

    /**
     * @brief Value of the kind's primary key column, or null.
     */
    [[nodiscard]] json id() const;

    [[nodiscard]] const std::optional<Timestamp>& createdAt() const noexcept {
        return createdAt_;
    }
    [[nodiscard]] const std::optional<Timestamp>& updatedAt() const noexcept {
        return updatedAt_;
    }

    void setCreatedAt(std::optional<Timestamp> value) noexcept {
        createdAt_ = value;
    }
    void setUpdatedAt(std::optional<Timestamp> value) noexcept {
        updatedAt_ = value;
    }

private:
    const RecordKind* kind_;
    json attributes_;
    std::optional<Timestamp> createdAt_;
    std::optional<Timestamp> updatedAt_;
};

/**
 * @brief Milliseconds since the epoch, the column encoding of timestamps.
 */
[[nodiscard]] int64_t toEpochMillis(Timestamp value) noexcept;

[[nodiscard]] Timestamp fromEpochMillis(int64_t millis) noexcept;

}  // namespace relata::model

#endif  // RELATA_MODEL_RECORD_HPP
