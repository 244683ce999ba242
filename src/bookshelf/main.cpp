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
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "catalog/BookCatalog.hpp"
#include "common/Logging.hpp"
#include "server/BookCatalogServiceImpl.hpp"
#include "server/ServerConfig.hpp"
#include "server/Signals.hpp"
#include "storage/InMemoryBookStore.hpp"

using bookshelf::BookCatalog;
using bookshelf::BookCatalogServer;
using bookshelf::BookCatalogServiceImpl;
using bookshelf::InMemoryBookStore;
using bookshelf::ServerConfig;

int main(int argc, char** argv) {
    // Must run before initLogging starts the spdlog worker thread.
    const auto signals = bookshelf::blockTerminationSignals();
    if (!signals.has_value()) {
        std::cerr << signals.error().what << '\n';
        return 1;
    }

    const std::vector<std::string> args(argv + 1, argv + argc);
    auto config = ServerConfig::load(args, bookshelf::processEnvironment());
    if (!config.has_value()) {
        std::cerr << config.error().what << '\n' << bookshelf::usage() << '\n';
        return 2;
    }
    if (auto logging = bookshelf::initLogging(config->log); !logging.has_value()) {
        std::cerr << logging.error().what << '\n';
        return 1;
    }

    spdlog::info("Bookshelf starting...");
    InMemoryBookStore store {};
    BookCatalog catalog {store};
    if (auto seeded = catalog.seed(); !seeded.has_value()) {
        spdlog::critical("Failed to seed catalog: {}", seeded.error().what);
        spdlog::shutdown();
        return 1;
    }
    BookCatalogServiceImpl service {catalog};
    try {
        BookCatalogServer server {config->listenAddress, service};
        if (auto received = bookshelf::waitForTerminationSignal(signals.value()); received.has_value()) {
            spdlog::info("Received signal {}, stopping", received.value());
        } else {
            spdlog::error("{}, stopping", received.error().what);
        }
        server.shutdown();
    } catch (const std::runtime_error& e) {
        spdlog::critical("{}", e.what());
        spdlog::shutdown();
        return 1;
    }
    spdlog::shutdown();
    return 0;
}
