// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * Bookshelf a gRPC book catalog service.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#ifndef BOOKSHELF_COMMON_LOGGING_HPP
#define BOOKSHELF_COMMON_LOGGING_HPP

#include <string>
#include <expected>
#include <variant>
#include <spdlog/common.h>
#include "common/Error.hpp"

namespace bookshelf {

struct LogConfig {
    std::string level {"info"};
    // Empty disables the rotating file sink.
    std::string file {};
};

std::expected<spdlog::level::level_enum, Error> parseLogLevel(const std::string& level);

// Installs an async default logger writing to the console and, optionally, a rotating file.
std::expected<std::monostate, Error> initLogging(const LogConfig& config);

} // namespace bookshelf

#endif // BOOKSHELF_COMMON_LOGGING_HPP
