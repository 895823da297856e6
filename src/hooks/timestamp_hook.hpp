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

#ifndef RELATA_HOOKS_TIMESTAMP_HOOK_HPP
#define RELATA_HOOKS_TIMESTAMP_HOOK_HPP

#include <functional>

#include "write_hook.hpp"

namespace relata::hooks {

/**
 * @brief Stamps audit timestamps before writes.
 *
 * Insert sets createdAt and updatedAt, update advances updatedAt only.
 * Nothing is stamped when the record's kind has timestamps disabled or the
 * context asks to skip the touch.
 */
class TimestampHook : public WriteHook {
public:
    using Clock = std::function<model::Timestamp()>;

    static constexpr std::string_view NAME = "timestamps";

    /**
     * @param clock Time source, std::chrono::system_clock by default.
     */
    explicit TimestampHook(Clock clock = {});

    [[nodiscard]] std::string_view name() const noexcept override {
        return NAME;
    }

    void beforeInsert(model::Record& record,
                      const OperationContext& context) noexcept override;

    void beforeUpdate(model::Record& record,
                      const OperationContext& context) noexcept override;

    /**
     * @brief Whether a write of this record in this context gets stamped.
     */
    [[nodiscard]] static bool shouldTouch(
        const model::Record& record, const OperationContext& context) noexcept;

private:
    Clock clock_;
};

}  // namespace relata::hooks

#endif  // RELATA_HOOKS_TIMESTAMP_HOOK_HPP
