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
#include "catalog/BookCatalog.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iterator>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>
#include "catalog/FieldMask.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"

namespace bookshelf {

namespace {

std::string toLower(const std::string& s) {
    std::string lowered {s};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

// Filters match case-insensitively anywhere in the field.
bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

Error isbnExists(const std::string& isbn, BookId id = 0) {
    return Error {ErrorCode::AlreadyExists, "Book with ISBN " + isbn + " already exists", id, isbn};
}

Error bookNotFound(BookId id) {
    return Error {ErrorCode::NotFound, "Book with ID " + std::to_string(id) + " not found", id, ""};
}

} // namespace

const std::vector<BookFields>& sampleBooks() {
    static const std::vector<BookFields> books {
        {"The Python Handbook", "Jane Doe", "978-1234567890", 2023, "Technology",
            "A comprehensive guide to Python programming"},
        {"Microservices Architecture", "John Smith", "978-0987654321", 2022, "Technology",
            "Building scalable distributed systems"},
        {"The Great Adventure", "Alice Johnson", "978-1122334455", 2021, "Fiction",
            "An epic tale of discovery"}
    };
    return books;
}

BookCatalog::BookCatalog(BookStore& s) : store {s}, m {} {}

std::expected<std::monostate, Error> BookCatalog::seed() {
    for (const auto& fields : sampleBooks()) {
        auto result = create(fields);
        if (!result.has_value()) {
            return std::unexpected {result.error()};
        }
    }
    spdlog::info("Seeded catalog with {} sample books", sampleBooks().size());
    return {};
}

std::expected<Book, Error> BookCatalog::create(const BookFields& fields) {
    if (fields.title.empty() || fields.author.empty()) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "Title and author are required"}};
    }
    const std::unique_lock lock {m};
    if (store.isbnConflict(fields.isbn, std::nullopt)) {
        return std::unexpected {isbnExists(fields.isbn)};
    }
    return store.insert(fields);
}

std::expected<std::optional<Book>, Error> BookCatalog::get(BookId id) const {
    const std::shared_lock lock {m};
    return store.get(id);
}

std::expected<BookPage, Error> BookCatalog::list(const ListQuery& query) const {
    auto snapshot = [this]() {
        const std::shared_lock lock {m};
        return store.all();
    }();
    if (!snapshot.has_value()) {
        return std::unexpected {snapshot.error()};
    }
    auto& books = snapshot.value();
    if (!query.genreFilter.empty()) {
        std::erase_if(books, [&](const Book& b) { return !containsIgnoreCase(b.fields.genre, query.genreFilter); });
    }
    if (!query.authorFilter.empty()) {
        std::erase_if(books, [&](const Book& b) { return !containsIgnoreCase(b.fields.author, query.authorFilter); });
    }

    const std::size_t total = books.size();
    const std::size_t start = std::min<std::size_t>(query.offset > 0 ? static_cast<std::size_t>(query.offset) : 0, total);
    const std::size_t end = query.limit > 0
        ? std::min<std::size_t>(start + static_cast<std::size_t>(query.limit), total)
        : total;

    BookPage page;
    page.totalCount = total;
    page.books.assign(std::make_move_iterator(books.begin() + static_cast<std::ptrdiff_t>(start)),
                      std::make_move_iterator(books.begin() + static_cast<std::ptrdiff_t>(end)));
    return page;
}

std::expected<BookPage, Error> BookCatalog::all() const {
    const std::shared_lock lock {m};
    auto books = store.all();
    if (!books.has_value()) {
        return std::unexpected {books.error()};
    }
    const auto count = books.value().size();
    return BookPage {std::move(books.value()), count};
}

std::expected<Book, Error> BookCatalog::update(BookId id, const BookFields& payload, const std::vector<std::string>& paths) {
    const std::unique_lock lock {m};
    auto current = store.get(id);
    if (!current.has_value()) {
        return std::unexpected {current.error()};
    }
    if (!current.value().has_value()) {
        return std::unexpected {bookNotFound(id)};
    }

    MaskResult result = [&]() {
        if (paths.empty()) {
            spdlog::warn("No field mask provided for book {}, falling back to non-empty field updates", id);
            return applyPopulatedFields(current.value().value(), payload);
        }
        return applyFieldMask(current.value().value(), payload, paths);
    }();
    for (const auto& path : result.ignoredPaths) {
        spdlog::warn("Ignoring unknown field path: {}", path);
    }

    // Nothing has been committed yet, so a conflict leaves the stored record as it was.
    if (result.isbnTouched && store.isbnConflict(result.book.fields.isbn, id)) {
        return std::unexpected {isbnExists(result.book.fields.isbn, id)};
    }
    return store.replace(result.book);
}

std::expected<std::monostate, Error> BookCatalog::erase(BookId id) {
    const std::unique_lock lock {m};
    auto removed = store.remove(id);
    if (!removed.has_value()) {
        return std::unexpected {removed.error()};
    }
    if (!removed.value()) {
        return std::unexpected {bookNotFound(id)};
    }
    return {};
}

} // namespace bookshelf
