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

#ifndef RELATA_RESOLVER_KIND_REGISTRY_HPP
#define RELATA_RESOLVER_KIND_REGISTRY_HPP

#include <map>
#include <shared_mutex>
#include <vector>

#include "record_kind_loader.hpp"

namespace relata::resolver {

/**
 * @brief In-process loader: record-kinds published under a location.
 *
 * Kinds added without an explicit location are published under
 * <modelsDirectory>/<kind name>, which is where bare-name targets are
 * looked up by the resolver.
 */
class KindRegistry : public RecordKindLoader {
public:
    explicit KindRegistry(fs::path modelsDirectory);

    /**
     * @brief Publishes a kind under <modelsDirectory>/<kind name>.
     */
    void add(const model::RecordKind& kind);

    /**
     * @brief Publishes a kind under an explicit location. A later add() for
     * the same location replaces the earlier kind.
     */
    void add(const model::RecordKind& kind, const fs::path& location);

    bool remove(const fs::path& location);

    const model::RecordKind* load(const fs::path& location) override;

    [[nodiscard]] const fs::path& modelsDirectory() const noexcept {
        return modelsDirectory_;
    }

    [[nodiscard]] std::vector<fs::path> locations() const;

    [[nodiscard]] size_t size() const;

private:
    fs::path modelsDirectory_;
    mutable std::shared_mutex mutex_;
    std::map<fs::path, const model::RecordKind*> kinds_;
};

}  // namespace relata::resolver

#endif  // RELATA_RESOLVER_KIND_REGISTRY_HPP
