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
#ifndef BOOKSHELF_STORAGE_BOOKSTORE_HPP
#define BOOKSHELF_STORAGE_BOOKSTORE_HPP

#include "common/Types.hpp"
#include "common/Error.hpp"
#include <expected>
#include <optional>
#include <string>
#include <vector>
#include <cstddef>

namespace bookshelf {

class BookStore {
public:
    virtual ~BookStore() = default;

    // Allocates the next id and stamps both timestamps with the same instant.
    virtual std::expected<Book, Error> insert(const BookFields& fields) = 0;
    virtual std::expected<std::optional<Book>, Error> get(BookId id) const = 0;
    // Swaps in a new version of an existing record and refreshes updatedAt.
    virtual std::expected<Book, Error> replace(const Book& book) = 0;
    virtual std::expected<bool, Error> remove(BookId id) = 0;
    // Snapshot in insertion order.
    virtual std::expected<std::vector<Book>, Error> all() const = 0;
    virtual bool isbnConflict(const std::string& isbn, std::optional<BookId> excludeId) const = 0;
    virtual size_t size() const = 0;
};

} // namespace bookshelf

#endif // BOOKSHELF_STORAGE_BOOKSTORE_HPP
