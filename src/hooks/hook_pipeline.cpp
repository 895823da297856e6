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

#include "hook_pipeline.hpp"

#include <algorithm>

#include "atom/error/exception.hpp"
#include "default_values_hook.hpp"
#include "timestamp_hook.hpp"

namespace relata::hooks {

HookPipeline HookPipeline::standard() {
    HookPipeline pipeline;
    pipeline.append(std::make_shared<DefaultValuesHook>())
        .append(std::make_shared<TimestampHook>());
    return pipeline;
}

HookPipeline& HookPipeline::append(std::shared_ptr<WriteHook> hook) {
    checkInsertable(hook);
    hooks_.push_back(std::move(hook));
    return *this;
}

HookPipeline& HookPipeline::insertBefore(std::string_view existing,
                                         std::shared_ptr<WriteHook> hook) {
    checkInsertable(hook);
    auto it = find(existing);
    if (it == hooks_.end()) {
        THROW_INVALID_ARGUMENT("No write hook named " + std::string(existing));
    }
    hooks_.insert(it, std::move(hook));
    return *this;
}

bool HookPipeline::remove(std::string_view name) {
    auto it = find(name);
    if (it == hooks_.end()) {
        return false;
    }
    hooks_.erase(it);
    return true;
}

void HookPipeline::runBeforeInsert(model::Record& record,
                                   const OperationContext& context) const {
    for (const auto& hook : hooks_) {
        hook->beforeInsert(record, context);
    }
}

void HookPipeline::runBeforeUpdate(model::Record& record,
                                   const OperationContext& context) const {
    for (const auto& hook : hooks_) {
        hook->beforeUpdate(record, context);
    }
}

std::vector<std::string> HookPipeline::names() const {
    std::vector<std::string> result;
    result.reserve(hooks_.size());
    for (const auto& hook : hooks_) {
        result.emplace_back(hook->name());
    }
    return result;
}

void HookPipeline::checkInsertable(
    const std::shared_ptr<WriteHook>& hook) const {
    if (!hook) {
        THROW_INVALID_ARGUMENT("Cannot add a null write hook");
    }
    if (find(hook->name()) != hooks_.end()) {
        THROW_INVALID_ARGUMENT("Write hook " + std::string(hook->name()) +
                               " is already registered");
    }
}

std::vector<std::shared_ptr<WriteHook>>::const_iterator HookPipeline::find(
    std::string_view name) const {
    return std::find_if(hooks_.begin(), hooks_.end(),
                        [name](const auto& hook) { return hook->name() == name; });
}

}  // namespace relata::hooks
