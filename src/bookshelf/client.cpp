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
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <spdlog/spdlog.h>
#include "client/BookCatalogClient.hpp"
#include "client/ClientConfig.hpp"
#include "common/Error.hpp"
#include "common/Logging.hpp"
#include "common/Types.hpp"

using bookshelf::Book;
using bookshelf::BookCatalogClient;
using bookshelf::BookFields;
using bookshelf::ClientConfig;
using bookshelf::ListQuery;

namespace {

void printBook(const Book& b) {
    std::cout << "   ID: " << b.id << ", Title: " << b.fields.title << ", Author: " << b.fields.author
              << " (" << b.fields.genre << ")\n";
}

} // namespace

// Walks every BooksService call once against a running server.
int main(int argc, char** argv) {
    ClientConfig config {};
    if (argc > 1) {
        config.address = argv[1];
    }
    if (auto logging = bookshelf::initLogging(bookshelf::LogConfig {"warn", ""}); !logging.has_value()) {
        std::cerr << logging.error().what << '\n';
        return 1;
    }
    const BookCatalogClient client {config};
    std::cout << "=== Testing Books gRPC Service on " << client.address() << " ===\n\n";

    std::cout << "1. Getting all books:\n";
    auto all = client.all();
    if (!all.has_value()) {
        std::cout << "   Failed: " << all.error().what << '\n';
        spdlog::shutdown();
        return 1;
    }
    for (const auto& b : all->books) {
        printBook(b);
    }

    std::cout << "\n2. Getting book with ID 1:\n";
    if (auto one = client.get(1); one.has_value() && one->has_value()) {
        printBook(one->value());
    } else {
        std::cout << "   Book not found\n";
    }

    std::cout << "\n3. Creating a new book:\n";
    auto created = client.create(BookFields {"gRPC in Action", "Tech Writer", "978-1111111111", 2024,
        "Technology", "Learn gRPC with practical examples"});
    if (!created.has_value()) {
        std::cout << "   Failed: " << created.error().what << '\n';
    } else {
        std::cout << "   Created: " << created->fields.title << " with ID " << created->id << '\n';

        std::cout << "\n4. Updating the new book with field mask:\n";
        BookFields patch {};
        patch.title = "gRPC in Action - 2nd Edition";
        patch.publishedYear = 2025;
        auto updated = client.update(created->id, patch, {"title", "published_year"});
        if (updated.has_value()) {
            std::cout << "   Updated: " << updated->fields.title << " (" << updated->fields.publishedYear << ")\n";
        } else {
            std::cout << "   Failed: " << updated.error().what << '\n';
        }
    }

    std::cout << "\n5. Listing Technology books:\n";
    auto tech = client.list(ListQuery {"Technology", "", 10, 0});
    if (tech.has_value()) {
        std::cout << "   Found " << tech->totalCount << " Technology books\n";
        for (const auto& b : tech->books) {
            printBook(b);
        }
    } else {
        std::cout << "   Failed: " << tech.error().what << '\n';
    }

    if (created.has_value()) {
        std::cout << "\n6. Deleting the created book:\n";
        auto erased = client.erase(created->id);
        std::cout << "   " << (erased.has_value() ? "Book deleted successfully" : erased.error().what) << '\n';
    }

    std::cout << "\n=== All tests completed ===\n";
    spdlog::shutdown();
    return 0;
}
