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
#include "server/ServerConfig.hpp"
#include <cstdlib>
#include <string>
#include <vector>
#include <optional>
#include <expected>
#include "common/Error.hpp"
#include "common/Logging.hpp"

namespace bookshelf {

EnvLookup processEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string {value};
    };
}

std::expected<ServerConfig, Error> ServerConfig::load(const std::vector<std::string>& args, const EnvLookup& env) {
    ServerConfig config {};
    if (auto v = env("BOOKS_LISTEN_ADDR"); v.has_value() && !v->empty()) {
        config.listenAddress = *v;
    }
    if (auto v = env("BOOKS_LOG_LEVEL"); v.has_value() && !v->empty()) {
        config.log.level = *v;
    }
    if (auto v = env("BOOKS_LOG_FILE"); v.has_value()) {
        config.log.file = *v;
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg != "--listen" && arg != "--log-level" && arg != "--log-file") {
            return std::unexpected {Error {ErrorCode::InvalidArg, "Unknown argument: " + arg}};
        }
        if (i + 1 >= args.size()) {
            return std::unexpected {Error {ErrorCode::InvalidArg, "Missing value for " + arg}};
        }
        const auto& value = args[++i];
        if (arg == "--listen") {
            config.listenAddress = value;
        } else if (arg == "--log-level") {
            config.log.level = value;
        } else {
            config.log.file = value;
        }
    }

    if (config.listenAddress.find(':') == std::string::npos) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "Listen address must be host:port, got: " + config.listenAddress}};
    }
    if (auto level = parseLogLevel(config.log.level); !level.has_value()) {
        return std::unexpected {level.error()};
    }
    return config;
}

std::string usage() {
    return "Usage: bookshelf [--listen host:port] [--log-level level] [--log-file path]";
}

} // namespace bookshelf
