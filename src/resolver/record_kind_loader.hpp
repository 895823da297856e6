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

#ifndef RELATA_RESOLVER_RECORD_KIND_LOADER_HPP
#define RELATA_RESOLVER_RECORD_KIND_LOADER_HPP

#include <filesystem>

namespace relata::model {
class RecordKind;
}  // namespace relata::model

namespace relata::resolver {

namespace fs = std::filesystem;

/**
 * @brief Module-loading collaborator: maps a location to a descriptor.
 *
 * Implementations decide what a location means (a registry key, a shared
 * library, a generated table of descriptors). Locations handed to load()
 * are always absolute and lexically normalized.
 */
class RecordKindLoader {
public:
    virtual ~RecordKindLoader() = default;

    /**
     * @brief Loads the record-kind published at a location.
     *
     * @param location Absolute, normalized location.
     * @return The descriptor, or nullptr if nothing is published there.
     */
    virtual const model::RecordKind* load(const fs::path& location) = 0;
};

/**
 * @brief Makes a location absolute (against the working directory) and
 * lexically normal, so equal locations compare equal.
 */
[[nodiscard]] inline fs::path normalizeLocation(const fs::path& location) {
    return fs::absolute(location).lexically_normal();
}

}  // namespace relata::resolver

#endif  // RELATA_RESOLVER_RECORD_KIND_LOADER_HPP
