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

#include "mapping_store.hpp"

#include <spdlog/spdlog.h>

#include "core/types.hpp"
#include "model/record_kind.hpp"
#include "relation_builder.hpp"

namespace relata::relation {

RelationMappingStore::RelationMappingStore(
    std::shared_ptr<const resolver::RecordKindResolver> resolver)
    : resolver_(std::move(resolver)) {
    if (!resolver_) {
        THROW_INVALID_ARGUMENT("RelationMappingStore requires a resolver");
    }
}

RelationMappingStore::GraphPtr RelationMappingStore::getRelationMappings(
    const model::RecordKind& kind) {
    auto& slot = slotFor(kind);
    if (slot.builder.load() == std::this_thread::get_id()) {
        THROW_INVALID_JOIN_SPEC_ERROR("Relations of " + kind.name() +
                                      " requested while they are declared");
    }

    std::lock_guard lock(slot.mutex);
    if (!slot.graph) {
        struct BuilderMark {
            std::atomic<std::thread::id>& builder;
            ~BuilderMark() { builder.store(std::thread::id{}); }
        } mark{slot.builder};
        slot.builder.store(std::this_thread::get_id());
        slot.graph = build(kind);
    }
    return slot.graph;
}

void RelationMappingStore::setRelationMappings(const model::RecordKind& kind,
                                               RelationGraph mappings) {
    auto graph = std::make_shared<const RelationGraph>(std::move(mappings));
    auto& slot = slotFor(kind);
    std::lock_guard lock(slot.mutex);
    slot.graph = std::move(graph);
    spdlog::info("Installed {} explicit relation(s) for {}",
                 slot.graph->size(), kind.name());
}

std::optional<RelationMapping> RelationMappingStore::findRelation(
    const model::RecordKind& kind, std::string_view name) {
    auto graph = getRelationMappings(kind);
    auto it = graph->find(name);
    if (it == graph->end()) {
        return std::nullopt;
    }
    return it->second;
}

bool RelationMappingStore::isResolved(const model::RecordKind& kind) const {
    const auto* slot = findSlot(kind);
    if (slot == nullptr) {
        return false;
    }
    std::lock_guard lock(slot->mutex);
    return slot->graph != nullptr;
}

RelationMappingStore::Slot& RelationMappingStore::slotFor(
    const model::RecordKind& kind) {
    {
        std::shared_lock lock(slotsMutex_);
        auto it = slots_.find(&kind);
        if (it != slots_.end()) {
            return *it->second;
        }
    }

    std::unique_lock lock(slotsMutex_);
    auto& slot = slots_[&kind];
    if (!slot) {
        slot = std::make_unique<Slot>();
    }
    return *slot;
}

const RelationMappingStore::Slot* RelationMappingStore::findSlot(
    const model::RecordKind& kind) const {
    std::shared_lock lock(slotsMutex_);
    auto it = slots_.find(&kind);
    return it != slots_.end() ? it->second.get() : nullptr;
}

RelationMappingStore::GraphPtr RelationMappingStore::build(
    const model::RecordKind& kind) {
    RelationBuilder builder(kind, *resolver_);
    try {
        kind.declareRelations(builder);
    } catch (const std::exception& e) {
        spdlog::error("Failed to build relation graph of {}: {}", kind.name(),
                      e.what());
        throw;
    }

    auto graph = std::make_shared<const RelationGraph>(builder.take());
    ++buildCount_;
    spdlog::info("Built relation graph of {} with {} relation(s)", kind.name(),
                 graph->size());
    return graph;
}

}  // namespace relata::relation
