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
#include "storage/InMemoryBookStore.hpp"
#include <expected>
#include <string>
#include <shared_mutex>
#include <mutex>
#include <algorithm>
#include <utility>
#include "common/Error.hpp"
#include "common/Types.hpp"

namespace bookshelf {

InMemoryBookStore::InMemoryBookStore(Clock c) : clock {std::move(c)}, books {}, nextId {1}, m {} {}

std::expected<Book, Error> InMemoryBookStore::insert(const BookFields& fields) {
    const std::unique_lock lock {m};
    const auto now = clock();
    const auto [i, inserted] = books.emplace(nextId, Book {nextId, fields, now, now});
    if (!inserted) {
        return std::unexpected {Error {ErrorCode::Internal, "Book id " + std::to_string(nextId) + " is already allocated", nextId, fields.isbn}};
    }
    ++nextId;
    return i->second;
}

std::expected<std::optional<Book>, Error> InMemoryBookStore::get(BookId id) const {
    const std::shared_lock lock {m};
    auto i = books.find(id);
    if (i == books.end()) {
        return std::nullopt;
    }
    return i->second;
}

std::expected<Book, Error> InMemoryBookStore::replace(const Book& book) {
    const std::unique_lock lock {m};
    auto i = books.find(book.id);
    if (i == books.end()) {
        return std::unexpected {Error {ErrorCode::NotFound, "Book with ID " + std::to_string(book.id) + " not found", book.id, book.fields.isbn}};
    }
    const auto createdAt = i->second.createdAt;
    i->second = Book {book.id, book.fields, createdAt, std::max(clock(), createdAt)};
    return i->second;
}

std::expected<bool, Error> InMemoryBookStore::remove(BookId id) {
    const std::unique_lock lock {m};
    return books.erase(id) > 0;
}

std::expected<std::vector<Book>, Error> InMemoryBookStore::all() const {
    const std::shared_lock lock {m};
    std::vector<Book> snapshot;
    snapshot.reserve(books.size());
    for (const auto& [id, book] : books) {
        snapshot.push_back(book);
    }
    return snapshot;
}

bool InMemoryBookStore::isbnConflict(const std::string& isbn, std::optional<BookId> excludeId) const {
    if (isbn.empty()) {
        return false;
    }
    const std::shared_lock lock {m};
    return std::any_of(books.begin(), books.end(), [&](const auto& entry) {
        return entry.first != excludeId && entry.second.fields.isbn == isbn;
    });
}

size_t InMemoryBookStore::size() const {
    const std::shared_lock lock {m};
    return books.size();
}

} // namespace bookshelf
