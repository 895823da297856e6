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

#include "logging.hpp"

#include <cstdlib>
#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace relata::logging {

namespace {
std::mutex initMutex;
}  // namespace

std::optional<spdlog::level::level_enum> parseLevel(std::string_view name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error" || name == "err") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return std::nullopt;
}

spdlog::level::level_enum effectiveLevel(
    const config::LoggingSection& section) {
    std::string_view name = section.level;
    if (const char* env = std::getenv(LEVEL_ENV); env != nullptr && *env) {
        name = env;
    }
    return parseLevel(name).value_or(spdlog::level::info);
}

void initialize(const config::LoggingSection& section) {
    std::lock_guard lock(initMutex);

    const std::string name(LOGGER_NAME);
    spdlog::drop(name);

    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
    logger->set_pattern(section.pattern);
    logger->set_level(effectiveLevel(section));
    logger->flush_on(spdlog::level::err);

    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    const char* env = std::getenv(LEVEL_ENV);
    std::string_view requested =
        (env != nullptr && *env) ? std::string_view(env) : section.level;
    if (!parseLevel(requested)) {
        spdlog::warn("Unknown log level '{}', using info", requested);
    }
    spdlog::debug("Logging initialized at level {}",
                  spdlog::level::to_string_view(logger->level()));
}

}  // namespace relata::logging
