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

#ifndef RELATA_HOOKS_DEFAULT_VALUES_HOOK_HPP
#define RELATA_HOOKS_DEFAULT_VALUES_HOOK_HPP

#include "write_hook.hpp"

namespace relata::hooks {

/**
 * @brief Fills attributes a new record leaves unset (or null) with the
 * defaults of its kind. Updates are left alone.
 */
class DefaultValuesHook : public WriteHook {
public:
    static constexpr std::string_view NAME = "defaults";

    [[nodiscard]] std::string_view name() const noexcept override {
        return NAME;
    }

    void beforeInsert(model::Record& record,
                      const OperationContext& context) override;

    void beforeUpdate(model::Record&, const OperationContext&) override {}
};

}  // namespace relata::hooks

#endif  // RELATA_HOOKS_DEFAULT_VALUES_HOOK_HPP
