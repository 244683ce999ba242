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
#include <gtest/gtest.h>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/common.h>
#include "server/ServerConfig.hpp"
#include "common/Logging.hpp"
#include "common/Error.hpp"

using bookshelf::EnvLookup;
using bookshelf::ErrorCode;
using bookshelf::ServerConfig;
using bookshelf::parseLogLevel;

namespace {

EnvLookup fakeEnv(std::map<std::string, std::string> vars) {
    return [vars](const std::string& name) -> std::optional<std::string> {
        auto i = vars.find(name);
        if (i == vars.end()) {
            return std::nullopt;
        }
        return i->second;
    };
}

} // namespace

TEST(ServerConfigTest, Defaults) {
    auto config = ServerConfig::load({}, fakeEnv({}));
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->listenAddress, "0.0.0.0:50052");
    EXPECT_EQ(config->log.level, "info");
    EXPECT_EQ(config->log.file, "");
}

TEST(ServerConfigTest, EnvironmentOverridesDefaults) {
    auto config = ServerConfig::load({}, fakeEnv({
        {"BOOKS_LISTEN_ADDR", "127.0.0.1:6000"},
        {"BOOKS_LOG_LEVEL", "debug"},
        {"BOOKS_LOG_FILE", "logs/books.txt"}
    }));
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->listenAddress, "127.0.0.1:6000");
    EXPECT_EQ(config->log.level, "debug");
    EXPECT_EQ(config->log.file, "logs/books.txt");
}

TEST(ServerConfigTest, FlagsOverrideEnvironment) {
    auto config = ServerConfig::load(
        {"--listen", "[::]:7000", "--log-level", "warn"},
        fakeEnv({{"BOOKS_LISTEN_ADDR", "127.0.0.1:6000"}, {"BOOKS_LOG_LEVEL", "debug"}}));
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->listenAddress, "[::]:7000");
    EXPECT_EQ(config->log.level, "warn");
}

TEST(ServerConfigTest, UnknownFlagIsRejected) {
    auto config = ServerConfig::load({"--port", "50052"}, fakeEnv({}));
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidArg);
    EXPECT_EQ(config.error().what, "Unknown argument: --port");
}

TEST(ServerConfigTest, SeedingCannotBeSwitchedOff) {
    auto config = ServerConfig::load({"--no-seed"}, fakeEnv({}));
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidArg);
    EXPECT_EQ(config.error().what, "Unknown argument: --no-seed");
}

TEST(ServerConfigTest, MissingFlagValueIsRejected) {
    auto config = ServerConfig::load({"--listen"}, fakeEnv({}));
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidArg);
}

TEST(ServerConfigTest, BadValuesAreRejected) {
    EXPECT_FALSE(ServerConfig::load({"--log-level", "chatty"}, fakeEnv({})).has_value());
    EXPECT_FALSE(ServerConfig::load({"--listen", "localhost"}, fakeEnv({})).has_value());
}

TEST(LoggingTest, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("debug").value(), spdlog::level::debug);
    EXPECT_EQ(parseLogLevel("off").value(), spdlog::level::off);
    auto bad = parseLogLevel("loud");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidArg);
}
