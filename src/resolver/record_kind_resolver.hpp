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

#ifndef RELATA_RESOLVER_RECORD_KIND_RESOLVER_HPP
#define RELATA_RESOLVER_RECORD_KIND_RESOLVER_HPP

#include <memory>
#include <string>
#include <string_view>

#include "record_kind_loader.hpp"

namespace relata::resolver {

/**
 * @brief A relation target: a descriptor, or a string that names one.
 *
 * Strings starting with '.' or '/' are locations; anything else is a bare
 * record-kind name looked up under the models directory.
 */
class TargetRef {
public:
    TargetRef(const model::RecordKind& kind) : kind_(&kind) {}
    TargetRef(std::string identifier) : identifier_(std::move(identifier)) {}
    TargetRef(const char* identifier) : identifier_(identifier) {}

    [[nodiscard]] bool isDirect() const noexcept { return kind_ != nullptr; }

    [[nodiscard]] const model::RecordKind* direct() const noexcept {
        return kind_;
    }

    [[nodiscard]] const std::string& identifier() const noexcept {
        return identifier_;
    }

    /**
     * @brief Readable form for log and error messages.
     */
    [[nodiscard]] std::string describe() const;

private:
    const model::RecordKind* kind_ = nullptr;
    std::string identifier_;
};

/**
 * @brief Turns relation targets into concrete record-kind descriptors.
 */
class RecordKindResolver {
public:
    /**
     * @param loader Module-loading collaborator.
     * @param modelsDirectory Directory bare record-kind names live under.
     */
    RecordKindResolver(std::shared_ptr<RecordKindLoader> loader,
                       fs::path modelsDirectory);

    /**
     * @brief Resolves a target.
     *
     * Direct references are returned unchanged without consulting the
     * loader.
     *
     * @throws UnresolvedRecordKindError if the loader has nothing at the
     * target's location
     */
    [[nodiscard]] const model::RecordKind& resolve(
        const TargetRef& target) const;

    /**
     * @brief Location a string identifier resolves to.
     */
    [[nodiscard]] fs::path locate(std::string_view identifier) const;

    /**
     * @brief True for identifiers starting with a relative or absolute path
     * marker.
     */
    [[nodiscard]] static bool isPathLike(std::string_view identifier) noexcept;

    [[nodiscard]] const fs::path& modelsDirectory() const noexcept {
        return modelsDirectory_;
    }

private:
    std::shared_ptr<RecordKindLoader> loader_;
    fs::path modelsDirectory_;
};

}  // namespace relata::resolver

#endif  // RELATA_RESOLVER_RECORD_KIND_RESOLVER_HPP
