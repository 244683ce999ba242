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
#ifndef BOOKSHELF_STORAGE_INMEMORYBOOKSTORE_HPP
#define BOOKSHELF_STORAGE_INMEMORYBOOKSTORE_HPP

#include <map>
#include <string>
#include <vector>
#include <shared_mutex>
#include <expected>
#include <optional>
#include "common/Error.hpp"
#include "common/Types.hpp"
#include "storage/BookStore.hpp"

namespace bookshelf {

class InMemoryBookStore : public BookStore {
public:
    explicit InMemoryBookStore(Clock c = systemNow);
    std::expected<Book, Error> insert(const BookFields& fields) override;
    std::expected<std::optional<Book>, Error> get(BookId id) const override;
    std::expected<Book, Error> replace(const Book& book) override;
    std::expected<bool, Error> remove(BookId id) override;
    std::expected<std::vector<Book>, Error> all() const override;
    bool isbnConflict(const std::string& isbn, std::optional<BookId> excludeId) const override;
    size_t size() const override;
private:
    Clock clock;
    // Ids only grow, so key order is insertion order.
    std::map<BookId, Book> books;
    BookId nextId;
    mutable std::shared_mutex m;
};

} // namespace bookshelf

#endif // BOOKSHELF_STORAGE_INMEMORYBOOKSTORE_HPP
