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

#include "record_kind_resolver.hpp"

#include <spdlog/spdlog.h>

#include "core/types.hpp"
#include "model/record_kind.hpp"

namespace relata::resolver {

std::string TargetRef::describe() const {
    return kind_ ? kind_->name() : "'" + identifier_ + "'";
}

RecordKindResolver::RecordKindResolver(
    std::shared_ptr<RecordKindLoader> loader, fs::path modelsDirectory)
    : loader_(std::move(loader)),
      modelsDirectory_(normalizeLocation(modelsDirectory)) {
    if (!loader_) {
        THROW_INVALID_ARGUMENT("RecordKindResolver requires a loader");
    }
}

const model::RecordKind& RecordKindResolver::resolve(
    const TargetRef& target) const {
    if (target.isDirect()) {
        return *target.direct();
    }

    if (target.identifier().empty()) {
        THROW_UNRESOLVED_RECORD_KIND_ERROR(
            "Cannot resolve a record-kind from an empty identifier");
    }

    auto location = locate(target.identifier());
    const auto* kind = loader_->load(location);
    if (kind == nullptr) {
        THROW_UNRESOLVED_RECORD_KIND_ERROR("No record-kind found for " +
                                           target.describe() + " at " +
                                           location.string());
    }
    spdlog::debug("Resolved {} to record-kind {}", target.describe(),
                  kind->name());
    return *kind;
}

fs::path RecordKindResolver::locate(std::string_view identifier) const {
    if (isPathLike(identifier)) {
        return normalizeLocation(fs::path(identifier));
    }
    return normalizeLocation(modelsDirectory_ / fs::path(identifier));
}

bool RecordKindResolver::isPathLike(std::string_view identifier) noexcept {
    return !identifier.empty() &&
           (identifier.front() == '.' || identifier.front() == '/');
}

}  // namespace relata::resolver
