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

#ifndef RELATA_CONTEXT_MAPPING_CONTEXT_HPP
#define RELATA_CONTEXT_MAPPING_CONTEXT_HPP

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "config/relata_config.hpp"
#include "engine/record_store.hpp"
#include "engine/session.hpp"
#include "hooks/hook_pipeline.hpp"
#include "model/record_kind.hpp"
#include "relation/mapping_store.hpp"
#include "resolver/kind_registry.hpp"
#include "resolver/record_kind_resolver.hpp"

namespace relata::context {

using json = nlohmann::json;

/**
 * @brief Everything needed to declare record-kinds and read their relations.
 *
 * Owns a kind registry rooted at the configured models directory, the
 * resolver over it, the relation mapping store and the default hook
 * pipeline. Kinds defined through the context are owned by it and
 * registered under "<modelsDirectory>/<name>".
 *
 * @code
 * context::MappingContext ctx;
 * ctx.define("Person", [](relation::RelationBuilder& r) { r.hasMany("Pet"); });
 * ctx.define("Pet", [](relation::RelationBuilder& r) { r.belongsTo("Person"); });
 * auto graph = ctx.mappings().getRelationMappings(ctx.kind("Person"));
 * @endcode
 */
class MappingContext {
public:
    explicit MappingContext(config::RelataConfig config = {});

    MappingContext(const MappingContext&) = delete;
    MappingContext& operator=(const MappingContext&) = delete;

    /**
     * @brief Defines a kind with the configured defaults.
     * @throws InvalidNameError if the name is malformed
     */
    const model::RecordKind& define(std::string name,
                                    model::RelationDeclarations relations = {});

    /**
     * @brief Defines a kind with explicit options.
     */
    const model::RecordKind& define(std::string name,
                                    model::RecordKindOptions options);

    /**
     * @brief Defines a specialization of a kind; see RecordKind.
     */
    const model::RecordKind& specialize(
        std::string name, const model::RecordKind& parent,
        model::RelationDeclarations relations = {});

    /**
     * @brief Registers a caller-owned kind at an explicit location.
     */
    void registerKind(const model::RecordKind& kind,
                      const std::filesystem::path& location);

    /**
     * @brief Looks up a kind by name or path, as relation targets are.
     * @throws UnresolvedRecordKindError if nothing is registered there
     */
    [[nodiscard]] const model::RecordKind& kind(
        const std::string& identifier) const;

    /**
     * @brief Record store over a session using a copy of the pipeline.
     */
    [[nodiscard]] std::unique_ptr<engine::RecordStore> openStore(
        engine::Session& session);

    /**
     * @brief Relation graphs of every kind defined through the context.
     */
    [[nodiscard]] json describe();

    [[nodiscard]] const config::RelataConfig& config() const noexcept {
        return config_;
    }
    [[nodiscard]] resolver::KindRegistry& registry() noexcept {
        return *registry_;
    }
    [[nodiscard]] const resolver::RecordKindResolver& resolver()
        const noexcept {
        return *resolver_;
    }
    [[nodiscard]] relation::RelationMappingStore& mappings() noexcept {
        return mappings_;
    }
    [[nodiscard]] hooks::HookPipeline& pipeline() noexcept {
        return pipeline_;
    }

private:
    config::RelataConfig config_;
    std::shared_ptr<resolver::KindRegistry> registry_;
    std::shared_ptr<const resolver::RecordKindResolver> resolver_;
    relation::RelationMappingStore mappings_;
    hooks::HookPipeline pipeline_;
    std::vector<std::unique_ptr<model::RecordKind>> kinds_;

    const model::RecordKind& adopt(std::unique_ptr<model::RecordKind> kind);
};

}  // namespace relata::context

#endif  // RELATA_CONTEXT_MAPPING_CONTEXT_HPP
