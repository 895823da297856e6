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

#ifndef RELATA_CONFIG_EXCEPTION_HPP
#define RELATA_CONFIG_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace relata::config {

/**
 * @brief Configuration file could not be read or parsed
 */
class ConfigLoadError : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_CONFIG_LOAD_ERROR(...)                                       \
    throw relata::config::ConfigLoadError(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                          ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace relata::config

#endif  // RELATA_CONFIG_EXCEPTION_HPP
