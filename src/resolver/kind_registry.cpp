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

#include "kind_registry.hpp"

#include <mutex>

#include <spdlog/spdlog.h>

#include "model/record_kind.hpp"

namespace relata::resolver {

KindRegistry::KindRegistry(fs::path modelsDirectory)
    : modelsDirectory_(normalizeLocation(modelsDirectory)) {}

void KindRegistry::add(const model::RecordKind& kind) {
    add(kind, modelsDirectory_ / kind.name());
}

void KindRegistry::add(const model::RecordKind& kind,
                       const fs::path& location) {
    auto normalized = normalizeLocation(location);
    std::unique_lock lock(mutex_);
    auto [it, inserted] = kinds_.insert_or_assign(normalized, &kind);
    if (inserted) {
        spdlog::debug("Registered record-kind {} at {}", kind.name(),
                      it->first.string());
    } else {
        spdlog::warn("Record-kind {} replaces the kind registered at {}",
                     kind.name(), it->first.string());
    }
}

bool KindRegistry::remove(const fs::path& location) {
    std::unique_lock lock(mutex_);
    return kinds_.erase(normalizeLocation(location)) > 0;
}

const model::RecordKind* KindRegistry::load(const fs::path& location) {
    std::shared_lock lock(mutex_);
    auto it = kinds_.find(location);
    return it != kinds_.end() ? it->second : nullptr;
}

std::vector<fs::path> KindRegistry::locations() const {
    std::shared_lock lock(mutex_);
    std::vector<fs::path> result;
    result.reserve(kinds_.size());
    for (const auto& [location, kind] : kinds_) {
        result.push_back(location);
    }
    return result;
}

size_t KindRegistry::size() const {
    std::shared_lock lock(mutex_);
    return kinds_.size();
}

}  // namespace relata::resolver
