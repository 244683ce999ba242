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
#ifndef BOOKSHELF_SERVER_SERVERCONFIG_HPP
#define BOOKSHELF_SERVER_SERVERCONFIG_HPP

#include <string>
#include <vector>
#include <optional>
#include <expected>
#include <functional>
#include "common/Error.hpp"
#include "common/Logging.hpp"

namespace bookshelf {

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

EnvLookup processEnvironment();

struct ServerConfig {
    std::string listenAddress {"0.0.0.0:50052"};
    LogConfig log {};

    // Environment first (BOOKS_LISTEN_ADDR, BOOKS_LOG_LEVEL, BOOKS_LOG_FILE),
    // then command line flags, which win.
    static std::expected<ServerConfig, Error> load(const std::vector<std::string>& args, const EnvLookup& env);
};

std::string usage();

} // namespace bookshelf

#endif // BOOKSHELF_SERVER_SERVERCONFIG_HPP
