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

/**
 * @file relata.hpp
 * @brief Aggregated header for the Relata library.
 *
 * @par Usage Example:
 * @code
 * #include "relata.hpp"
 *
 * using namespace relata;
 *
 * context::MappingContext ctx;
 * const auto& person = ctx.define("Person", [](relation::RelationBuilder& r) {
 *     r.hasMany("Pet");
 * });
 * ctx.define("Pet");
 *
 * engine::Session session(":memory:");
 * auto store = ctx.openStore(session);
 * @endcode
 */

#ifndef RELATA_RELATA_HPP
#define RELATA_RELATA_HPP

// Errors and column references
#include "core/column_ref.hpp"
#include "core/types.hpp"

// Naming conventions
#include "naming/naming_convention.hpp"

// Record-kinds and records
#include "model/record.hpp"
#include "model/record_kind.hpp"

// Target resolution
#include "resolver/kind_registry.hpp"
#include "resolver/record_kind_resolver.hpp"

// Relation declarations and the mapping store
#include "relation/mapping_store.hpp"
#include "relation/relation_builder.hpp"
#include "relation/relation_mapping.hpp"

// Write hooks
#include "hooks/default_values_hook.hpp"
#include "hooks/hook_pipeline.hpp"
#include "hooks/timestamp_hook.hpp"

// SQLite engine adapter
#include "engine/join_planner.hpp"
#include "engine/record_store.hpp"
#include "engine/session.hpp"
#include "engine/statement.hpp"
#include "engine/transaction.hpp"
#include "query/query_builder.hpp"

// Configuration, logging, context
#include "config/config_loader.hpp"
#include "context/mapping_context.hpp"
#include "logging/logging.hpp"

namespace relata {

inline constexpr const char* VERSION = "1.0.0";

}  // namespace relata

#endif  // RELATA_RELATA_HPP
