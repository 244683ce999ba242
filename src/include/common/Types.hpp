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
#ifndef BOOKSHELF_COMMON_TYPES_HPP
#define BOOKSHELF_COMMON_TYPES_HPP

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <functional>
#include "proto/books.pb.h"

namespace bookshelf {

using BookId = int64_t;
using Timestamp = std::chrono::system_clock::time_point;
using Clock = std::function<Timestamp()>;

Timestamp systemNow();

// Empty strings and a zero year mean "not set".
struct BookFields {
    std::string title;
    std::string author;
    std::string isbn;
    int32_t publishedYear = 0;
    std::string genre;
    std::string description;

    BookFields() = default;
    BookFields(std::string t, std::string a, std::string i = {}, int32_t y = 0, std::string g = {}, std::string d = {});
    explicit BookFields(const books::Book& protoBook);
    explicit BookFields(const books::CreateBookRequest& request);

    bool operator==(const BookFields& other) const {
        return title == other.title && author == other.author && isbn == other.isbn &&
               publishedYear == other.publishedYear && genre == other.genre && description == other.description;
    }
};

struct Book {
    BookId id = 0;
    BookFields fields;
    Timestamp createdAt {};
    Timestamp updatedAt {};

    Book() = default;
    Book(BookId i, BookFields f, Timestamp created, Timestamp updated);
    explicit Book(const books::Book& protoBook);

    void toProto(books::Book* protoBook) const;

    bool operator==(const Book& other) const {
        return id == other.id && fields == other.fields &&
               createdAt == other.createdAt && updatedAt == other.updatedAt;
    }
};

struct ListQuery {
    std::string genreFilter;
    std::string authorFilter;
    int32_t limit = 0;
    int32_t offset = 0;
};

struct BookPage {
    std::vector<Book> books;
    std::size_t totalCount = 0;
};

} // namespace bookshelf

#endif // BOOKSHELF_COMMON_TYPES_HPP
