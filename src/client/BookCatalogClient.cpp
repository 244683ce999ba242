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
#include "client/BookCatalogClient.hpp"
#include <spdlog/spdlog.h>
#include <google/protobuf/empty.pb.h>
#include <string>
#include <vector>
#include "proto/books.pb.h"
#include "proto/books.grpc.pb.h"
#include "common/Error.hpp"
#include "common/Types.hpp"

namespace bookshelf {

namespace {

BookPage toPage(const books::ListBooksResponse& reply) {
    BookPage page;
    page.totalCount = static_cast<std::size_t>(reply.total_count());
    page.books.reserve(reply.books_size());
    for (const auto& b : reply.books()) {
        page.books.emplace_back(b);
    }
    return page;
}

} // namespace

BookCatalogClient::BookCatalogClient(const ClientConfig& c)
    : config {c},
      channel {grpc::CreateChannel(c.address, grpc::InsecureChannelCredentials())},
      stub {books::BooksService::NewStub(channel)} {}

const std::string& BookCatalogClient::address() const {
    return config.address;
}

std::expected<Book, Error> BookCatalogClient::create(const BookFields& fields) const {
    books::CreateBookRequest request;
    request.set_title(fields.title);
    request.set_author(fields.author);
    request.set_isbn(fields.isbn);
    request.set_published_year(fields.publishedYear);
    request.set_genre(fields.genre);
    request.set_description(fields.description);
    auto t = call<books::CreateBookResponse>("CreateBook", [&](grpc::ClientContext* ctx, books::CreateBookResponse* reply) {
        return stub->CreateBook(ctx, request, reply);
    });
    if (!t.has_value()) {
        return std::unexpected {t.error()};
    }
    if (!t.value().success()) {
        return std::unexpected {Error {ErrorCode::Rejected, t.value().message(), 0, fields.isbn}};
    }
    return Book {t.value().book()};
}

std::expected<std::optional<Book>, Error> BookCatalogClient::get(BookId id) const {
    books::BookId request;
    request.set_id(id);
    auto t = call<books::GetBookResponse>("GetBook", [&](grpc::ClientContext* ctx, books::GetBookResponse* reply) {
        return stub->GetBook(ctx, request, reply);
    });
    if (!t.has_value()) {
        return std::unexpected {t.error()};
    }
    if (!t.value().found()) {
        return std::nullopt;
    }
    return Book {t.value().book()};
}

std::expected<Book, Error> BookCatalogClient::update(BookId id, const BookFields& fields, const std::vector<std::string>& paths) const {
    books::UpdateBookRequest request;
    request.set_id(id);
    auto* book = request.mutable_book();
    book->set_title(fields.title);
    book->set_author(fields.author);
    book->set_isbn(fields.isbn);
    book->set_published_year(fields.publishedYear);
    book->set_genre(fields.genre);
    book->set_description(fields.description);
    for (const auto& path : paths) {
        request.mutable_update_mask()->add_paths(path);
    }
    auto t = call<books::UpdateBookResponse>("UpdateBook", [&](grpc::ClientContext* ctx, books::UpdateBookResponse* reply) {
        return stub->UpdateBook(ctx, request, reply);
    });
    if (!t.has_value()) {
        return std::unexpected {t.error()};
    }
    if (!t.value().success()) {
        return std::unexpected {Error {ErrorCode::Rejected, t.value().message(), id, fields.isbn}};
    }
    return Book {t.value().book()};
}

std::expected<std::monostate, Error> BookCatalogClient::erase(BookId id) const {
    books::BookId request;
    request.set_id(id);
    auto t = call<books::DeleteBookResponse>("DeleteBook", [&](grpc::ClientContext* ctx, books::DeleteBookResponse* reply) {
        return stub->DeleteBook(ctx, request, reply);
    });
    if (!t.has_value()) {
        return std::unexpected {t.error()};
    }
    if (!t.value().success()) {
        return std::unexpected {Error {ErrorCode::Rejected, t.value().message(), id, ""}};
    }
    return {};
}

std::expected<BookPage, Error> BookCatalogClient::list(const ListQuery& query) const {
    books::ListBooksRequest request;
    request.set_genre_filter(query.genreFilter);
    request.set_author_filter(query.authorFilter);
    request.set_limit(query.limit);
    request.set_offset(query.offset);
    auto t = call<books::ListBooksResponse>("ListBooks", [&](grpc::ClientContext* ctx, books::ListBooksResponse* reply) {
        return stub->ListBooks(ctx, request, reply);
    });
    if (!t.has_value()) {
        return std::unexpected {t.error()};
    }
    return toPage(t.value());
}

std::expected<BookPage, Error> BookCatalogClient::all() const {
    const google::protobuf::Empty request;
    auto t = call<books::ListBooksResponse>("GetAllBooks", [&](grpc::ClientContext* ctx, books::ListBooksResponse* reply) {
        return stub->GetAllBooks(ctx, request, reply);
    });
    if (!t.has_value()) {
        return std::unexpected {t.error()};
    }
    return toPage(t.value());
}

} // namespace bookshelf
