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

#include "record.hpp"

#include "atom/error/exception.hpp"

namespace relata::model {

Record::Record(const RecordKind& kind, json attributes)
    : kind_(&kind), attributes_(std::move(attributes)) {
    if (attributes_.is_null()) {
        attributes_ = json::object();
    }
    if (!attributes_.is_object()) {
        THROW_INVALID_ARGUMENT("Attributes of a " + kind.name() +
                               " record must be a JSON object");
    }
}

json Record::get(std::string_view column) const {
    auto it = attributes_.find(std::string(column));
    return it != attributes_.end() ? *it : json(nullptr);
}

Record& Record::set(const std::string& column, json value) {
    attributes_[column] = std::move(value);
    return *this;
}

bool Record::has(std::string_view column) const {
    auto it = attributes_.find(std::string(column));
    return it != attributes_.end() && !it->is_null();
}

json Record::id() const { return get(kind_->idColumn()); }

int64_t toEpochMillis(Timestamp value) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               value.time_since_epoch())
        .count();
}

Timestamp fromEpochMillis(int64_t millis) noexcept {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::milliseconds(millis)));
}

}  // namespace relata::model
