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
#ifndef BOOKSHELF_SERVER_BOOKCATALOGSERVICEIMPL_HPP
#define BOOKSHELF_SERVER_BOOKCATALOGSERVICEIMPL_HPP

#include <grpcpp/grpcpp.h>
#include <google/protobuf/empty.pb.h>
#include "proto/books.grpc.pb.h"
#include "server/RPCServer.hpp"
#include "catalog/BookCatalog.hpp"

namespace bookshelf {

// Business failures travel in the reply payload; only unexpected faults in
// the read paths turn into a non-OK status.
class BookCatalogServiceImpl final : public books::BooksService::Service {
public:
    explicit BookCatalogServiceImpl(BookCatalog& c);
    grpc::Status CreateBook(
        grpc::ServerContext* context,
        const books::CreateBookRequest* request,
        books::CreateBookResponse* reply) override;
    grpc::Status GetBook(
        grpc::ServerContext* context,
        const books::BookId* request,
        books::GetBookResponse* reply) override;
    grpc::Status UpdateBook(
        grpc::ServerContext* context,
        const books::UpdateBookRequest* request,
        books::UpdateBookResponse* reply) override;
    grpc::Status DeleteBook(
        grpc::ServerContext* context,
        const books::BookId* request,
        books::DeleteBookResponse* reply) override;
    grpc::Status ListBooks(
        grpc::ServerContext* context,
        const books::ListBooksRequest* request,
        books::ListBooksResponse* reply) override;
    grpc::Status GetAllBooks(
        grpc::ServerContext* context,
        const google::protobuf::Empty* request,
        books::ListBooksResponse* reply) override;
private:
    BookCatalog& catalog;
};

using BookCatalogServer = RPCServer<BookCatalogServiceImpl>;

} // namespace bookshelf

#endif // BOOKSHELF_SERVER_BOOKCATALOGSERVICEIMPL_HPP
