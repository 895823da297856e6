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

#include "mapping_context.hpp"

#include <spdlog/spdlog.h>

namespace relata::context {

MappingContext::MappingContext(config::RelataConfig config)
    : config_(std::move(config)),
      registry_(std::make_shared<resolver::KindRegistry>(
          config_.mapping.resolvedModelsDirectory())),
      resolver_(std::make_shared<resolver::RecordKindResolver>(
          registry_, registry_->modelsDirectory())),
      mappings_(resolver_),
      pipeline_(hooks::HookPipeline::standard()) {
    spdlog::info("Mapping context created, models directory {}",
                 registry_->modelsDirectory().string());
}

const model::RecordKind& MappingContext::define(
    std::string name, model::RelationDeclarations relations) {
    auto options = config_.mapping.kindDefaults();
    options.relations = std::move(relations);
    return define(std::move(name), std::move(options));
}

const model::RecordKind& MappingContext::define(
    std::string name, model::RecordKindOptions options) {
    return adopt(
        std::make_unique<model::RecordKind>(std::move(name), std::move(options)));
}

const model::RecordKind& MappingContext::specialize(
    std::string name, const model::RecordKind& parent,
    model::RelationDeclarations relations) {
    auto options = config_.mapping.kindDefaults();
    options.relations = std::move(relations);
    return adopt(std::make_unique<model::RecordKind>(std::move(name), parent,
                                                     std::move(options)));
}

void MappingContext::registerKind(const model::RecordKind& kind,
                                  const std::filesystem::path& location) {
    registry_->add(kind, location);
}

const model::RecordKind& MappingContext::kind(
    const std::string& identifier) const {
    return resolver_->resolve(identifier);
}

std::unique_ptr<engine::RecordStore> MappingContext::openStore(
    engine::Session& session) {
    return std::make_unique<engine::RecordStore>(session, mappings_, pipeline_);
}

json MappingContext::describe() {
    json result = json::object();
    for (const auto& kind : kinds_) {
        result[kind->name()] =
            relation::toJson(*mappings_.getRelationMappings(*kind));
    }
    return result;
}

const model::RecordKind& MappingContext::adopt(
    std::unique_ptr<model::RecordKind> kind) {
    registry_->add(*kind);
    kinds_.push_back(std::move(kind));
    return *kinds_.back();
}

}  // namespace relata::context
