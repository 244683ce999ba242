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
#ifndef BOOKSHELF_CATALOG_BOOKCATALOG_HPP
#define BOOKSHELF_CATALOG_BOOKCATALOG_HPP

#include <string>
#include <vector>
#include <expected>
#include <optional>
#include <variant>
#include <shared_mutex>
#include "common/Error.hpp"
#include "common/Types.hpp"
#include "storage/BookStore.hpp"

namespace bookshelf {

// The sample records every fresh catalog starts with.
const std::vector<BookFields>& sampleBooks();

class BookCatalog {
public:
    explicit BookCatalog(BookStore& s);
    BookCatalog(const BookCatalog&) = delete;
    BookCatalog& operator=(const BookCatalog&) = delete;

    std::expected<std::monostate, Error> seed();

    [[nodiscard]] std::expected<Book, Error> create(const BookFields& fields);
    [[nodiscard]] std::expected<std::optional<Book>, Error> get(BookId id) const;
    [[nodiscard]] std::expected<BookPage, Error> list(const ListQuery& query) const;
    [[nodiscard]] std::expected<BookPage, Error> all() const;
    // An empty path list falls back to copying every populated payload field.
    [[nodiscard]] std::expected<Book, Error> update(BookId id, const BookFields& payload, const std::vector<std::string>& paths);
    [[nodiscard]] std::expected<std::monostate, Error> erase(BookId id);
private:
    BookStore& store;
    // Serializes check-then-write sequences across RPC threads.
    mutable std::shared_mutex m;
};

} // namespace bookshelf

#endif // BOOKSHELF_CATALOG_BOOKCATALOG_HPP
