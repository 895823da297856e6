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

#ifndef RELATA_HOOKS_HOOK_PIPELINE_HPP
#define RELATA_HOOKS_HOOK_PIPELINE_HPP

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "write_hook.hpp"

namespace relata::hooks {

/**
 * @brief Ordered composition of write hooks.
 *
 * Hooks run in registration order; each sees the record as left by the
 * hooks before it.
 */
class HookPipeline {
public:
    /**
     * @brief The engine's default pipeline: defaults, then timestamps.
     */
    [[nodiscard]] static HookPipeline standard();

    /**
     * @brief Appends a hook.
     * @throws atom::error::InvalidArgument on a null hook or duplicate name
     */
    HookPipeline& append(std::shared_ptr<WriteHook> hook);

    /**
     * @brief Inserts a hook right before the hook with the given name.
     * @throws atom::error::InvalidArgument if no such hook exists
     */
    HookPipeline& insertBefore(std::string_view existing,
                               std::shared_ptr<WriteHook> hook);

    bool remove(std::string_view name);

    void runBeforeInsert(model::Record& record,
                         const OperationContext& context) const;

    void runBeforeUpdate(model::Record& record,
                         const OperationContext& context) const;

    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] size_t size() const noexcept { return hooks_.size(); }

private:
    std::vector<std::shared_ptr<WriteHook>> hooks_;

    void checkInsertable(const std::shared_ptr<WriteHook>& hook) const;
    [[nodiscard]] std::vector<std::shared_ptr<WriteHook>>::const_iterator find(
        std::string_view name) const;
};

}  // namespace relata::hooks

#endif  // RELATA_HOOKS_HOOK_PIPELINE_HPP
