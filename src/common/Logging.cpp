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
#include "common/Logging.hpp"
#include <memory>
#include <vector>
#include <string>
#include <spdlog/common.h>
#include "spdlog/async.h"
#include "spdlog/async_logger.h"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "common/Error.hpp"

namespace bookshelf {

std::expected<spdlog::level::level_enum, Error> parseLogLevel(const std::string& level) {
    const auto parsed = spdlog::level::from_str(level);
    // from_str maps anything it does not recognize to off.
    if (parsed == spdlog::level::off && level != "off") {
        return std::unexpected {Error {ErrorCode::InvalidArg, "Unknown log level: " + level}};
    }
    return parsed;
}

std::expected<std::monostate, Error> initLogging(const LogConfig& config) {
    auto level = parseLogLevel(config.level);
    if (!level.has_value()) {
        return std::unexpected {level.error()};
    }
    try {
        spdlog::init_thread_pool(8192, 1);
        std::vector<spdlog::sink_ptr> sinks {std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
        if (!config.file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file, 1024 * 1024 * 5, 3));
        }
        const auto asyncLogger = std::make_shared<spdlog::async_logger>(
            "bookshelf", sinks.begin(), sinks.end(),
            spdlog::thread_pool(), spdlog::async_overflow_policy::overrun_oldest);
        asyncLogger->set_level(level.value());
        spdlog::set_default_logger(asyncLogger);
    } catch (const spdlog::spdlog_ex& e) {
        return std::unexpected {Error {ErrorCode::Internal, std::string {"Failed to initialize logging: "} + e.what()}};
    }
    return {};
}

} // namespace bookshelf
