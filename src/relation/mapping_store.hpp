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

#ifndef RELATA_RELATION_MAPPING_STORE_HPP
#define RELATA_RELATION_MAPPING_STORE_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string_view>
#include <thread>
#include <unordered_map>

#include "relation_mapping.hpp"
#include "resolver/record_kind_resolver.hpp"

namespace relata::relation {

/**
 * @brief Per record-kind cache of resolved relation graphs.
 *
 * Each descriptor owns one slot, keyed by descriptor identity and never
 * shared with a parent kind. A slot is filled at most once: the first
 * getRelationMappings() call runs the kind's declareRelations() hook while
 * holding that slot's lock only, so first accesses of unrelated kinds do
 * not wait on each other and concurrent first accesses of the same kind
 * run the hook once. A hook that throws leaves the slot empty and the next
 * call runs it again. A hook may not request its own kind's graph; that
 * call throws InvalidJoinSpecError.
 */
class RelationMappingStore {
public:
    using GraphPtr = std::shared_ptr<const RelationGraph>;

    explicit RelationMappingStore(
        std::shared_ptr<const resolver::RecordKindResolver> resolver);

    RelationMappingStore(const RelationMappingStore&) = delete;
    RelationMappingStore& operator=(const RelationMappingStore&) = delete;

    /**
     * @brief Gets the relation graph of a kind, building it on first use.
     *
     * Repeated calls return the same graph instance.
     *
     * @throws UnresolvedRecordKindError, InvalidJoinSpecError or
     * InvalidNameError from the kind's declarations
     * @throws InvalidJoinSpecError when called from the kind's own
     * declareRelations()
     */
    [[nodiscard]] GraphPtr getRelationMappings(const model::RecordKind& kind);

    /**
     * @brief Installs a graph for a kind; its hook will never run.
     *
     * Replaces any graph already installed for the kind.
     */
    void setRelationMappings(const model::RecordKind& kind,
                             RelationGraph mappings);

    /**
     * @brief Looks up one relation of a kind, building the graph if needed.
     */
    [[nodiscard]] std::optional<RelationMapping> findRelation(
        const model::RecordKind& kind, std::string_view name);

    /**
     * @brief True once a graph is installed for the kind.
     */
    [[nodiscard]] bool isResolved(const model::RecordKind& kind) const;

    /**
     * @brief Number of declareRelations() runs that produced a graph.
     */
    [[nodiscard]] size_t buildCount() const noexcept {
        return buildCount_.load();
    }

    [[nodiscard]] const resolver::RecordKindResolver& resolver()
        const noexcept {
        return *resolver_;
    }

private:
    struct Slot {
        mutable std::mutex mutex;
        GraphPtr graph;
        std::atomic<std::thread::id> builder{};  ///< Thread running the hook.
    };

    std::shared_ptr<const resolver::RecordKindResolver> resolver_;

    mutable std::shared_mutex slotsMutex_;
    std::unordered_map<const model::RecordKind*, std::unique_ptr<Slot>> slots_;

    std::atomic<size_t> buildCount_{0};

    Slot& slotFor(const model::RecordKind& kind);
    [[nodiscard]] const Slot* findSlot(const model::RecordKind& kind) const;
    [[nodiscard]] GraphPtr build(const model::RecordKind& kind);
};

}  // namespace relata::relation

#endif  // RELATA_RELATION_MAPPING_STORE_HPP
