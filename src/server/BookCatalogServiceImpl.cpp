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
#include "server/BookCatalogServiceImpl.hpp"
#include <spdlog/spdlog.h>
#include <grpcpp/support/status.h>
#include <exception>
#include <string>
#include <tuple>
#include <vector>
#include "proto/books.pb.h"
#include "common/Error.hpp"
#include "common/ErrorConverter.hpp"
#include "common/Types.hpp"

namespace bookshelf {

namespace {

std::string internalMessage(const std::string& what) {
    return "Internal error: " + what;
}

// Payload failures carry the catalog's message; anything unexpected is prefixed.
std::string failureMessage(const Error& error) {
    if (error.code == ErrorCode::Internal || error.code == ErrorCode::Unknown) {
        return internalMessage(error.what);
    }
    return error.what;
}

void fillBooks(const BookPage& page, books::ListBooksResponse* reply) {
    for (const auto& book : page.books) {
        book.toProto(reply->add_books());
    }
    reply->set_total_count(static_cast<int32_t>(page.totalCount));
}

} // namespace

BookCatalogServiceImpl::BookCatalogServiceImpl(BookCatalog& c)
    : catalog {c} {}

grpc::Status BookCatalogServiceImpl::CreateBook(
    grpc::ServerContext* context,
    const books::CreateBookRequest* request,
    books::CreateBookResponse* reply) {
    std::ignore = context;
    spdlog::info("Creating book: {} by {}", request->title(), request->author());
    try {
        auto result = catalog.create(BookFields {*request});
        if (!result.has_value()) {
            spdlog::warn("Create rejected ({}): {}", toString(result.error().code), result.error().what);
            reply->set_success(false);
            reply->set_message(failureMessage(result.error()));
            return grpc::Status::OK;
        }
        spdlog::info("Book created with ID: {}", result.value().id);
        result.value().toProto(reply->mutable_book());
        reply->set_success(true);
        reply->set_message("Book created successfully");
    } catch (const std::exception& e) {
        spdlog::error("Error creating book: {}", e.what());
        reply->Clear();
        reply->set_success(false);
        reply->set_message(internalMessage(e.what()));
    }
    return grpc::Status::OK;
}

grpc::Status BookCatalogServiceImpl::GetBook(
    grpc::ServerContext* context,
    const books::BookId* request,
    books::GetBookResponse* reply) {
    std::ignore = context;
    spdlog::info("Getting book with ID: {}", request->id());
    try {
        auto result = catalog.get(request->id());
        if (!result.has_value()) {
            spdlog::error("Error getting book: {}", result.error().what);
            return toGrpcStatus(Error {ErrorCode::Internal, internalMessage(result.error().what), request->id(), ""});
        }
        if (!result.value().has_value()) {
            reply->set_found(false);
            return grpc::Status::OK;
        }
        result.value()->toProto(reply->mutable_book());
        reply->set_found(true);
        return grpc::Status::OK;
    } catch (const std::exception& e) {
        spdlog::error("Error getting book: {}", e.what());
        return toGrpcStatus(Error {ErrorCode::Internal, internalMessage(e.what()), request->id(), ""});
    }
}

grpc::Status BookCatalogServiceImpl::UpdateBook(
    grpc::ServerContext* context,
    const books::UpdateBookRequest* request,
    books::UpdateBookResponse* reply) {
    std::ignore = context;
    spdlog::info("Updating book with ID: {}", request->id());
    try {
        const std::vector<std::string> paths(request->update_mask().paths().begin(), request->update_mask().paths().end());
        auto result = catalog.update(request->id(), BookFields {request->book()}, paths);
        if (!result.has_value()) {
            spdlog::warn("Update of book {} rejected ({}): {}", request->id(), toString(result.error().code), result.error().what);
            reply->set_success(false);
            reply->set_message(failureMessage(result.error()));
            return grpc::Status::OK;
        }
        spdlog::info("Book {} updated successfully", request->id());
        result.value().toProto(reply->mutable_book());
        reply->set_success(true);
        reply->set_message("Book updated successfully");
    } catch (const std::exception& e) {
        spdlog::error("Error updating book: {}", e.what());
        reply->Clear();
        reply->set_success(false);
        reply->set_message(internalMessage(e.what()));
    }
    return grpc::Status::OK;
}

grpc::Status BookCatalogServiceImpl::DeleteBook(
    grpc::ServerContext* context,
    const books::BookId* request,
    books::DeleteBookResponse* reply) {
    std::ignore = context;
    spdlog::info("Deleting book with ID: {}", request->id());
    try {
        auto result = catalog.erase(request->id());
        if (!result.has_value()) {
            spdlog::warn("Delete of book {} rejected ({}): {}", request->id(), toString(result.error().code), result.error().what);
            reply->set_success(false);
            reply->set_message(failureMessage(result.error()));
            return grpc::Status::OK;
        }
        reply->set_success(true);
        reply->set_message("Book deleted successfully");
    } catch (const std::exception& e) {
        spdlog::error("Error deleting book: {}", e.what());
        reply->set_success(false);
        reply->set_message(internalMessage(e.what()));
    }
    return grpc::Status::OK;
}

grpc::Status BookCatalogServiceImpl::ListBooks(
    grpc::ServerContext* context,
    const books::ListBooksRequest* request,
    books::ListBooksResponse* reply) {
    std::ignore = context;
    spdlog::info("Listing books - limit: {}, offset: {}", request->limit(), request->offset());
    try {
        const ListQuery query {request->genre_filter(), request->author_filter(), request->limit(), request->offset()};
        auto result = catalog.list(query);
        if (!result.has_value()) {
            spdlog::error("Error listing books: {}", result.error().what);
            return toGrpcStatus(Error {ErrorCode::Internal, internalMessage(result.error().what)});
        }
        fillBooks(result.value(), reply);
        return grpc::Status::OK;
    } catch (const std::exception& e) {
        spdlog::error("Error listing books: {}", e.what());
        return toGrpcStatus(Error {ErrorCode::Internal, internalMessage(e.what())});
    }
}

grpc::Status BookCatalogServiceImpl::GetAllBooks(
    grpc::ServerContext* context,
    const google::protobuf::Empty* request,
    books::ListBooksResponse* reply) {
    std::ignore = context;
    std::ignore = request;
    spdlog::info("Getting all books");
    try {
        auto result = catalog.all();
        if (!result.has_value()) {
            spdlog::error("Error getting all books: {}", result.error().what);
            return toGrpcStatus(Error {ErrorCode::Internal, internalMessage(result.error().what)});
        }
        fillBooks(result.value(), reply);
        return grpc::Status::OK;
    } catch (const std::exception& e) {
        spdlog::error("Error getting all books: {}", e.what());
        return toGrpcStatus(Error {ErrorCode::Internal, internalMessage(e.what())});
    }
}

} // namespace bookshelf
