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
#ifndef BOOKSHELF_CLIENT_BOOKCATALOGCLIENT_HPP
#define BOOKSHELF_CLIENT_BOOKCATALOGCLIENT_HPP

#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>
#include "client/ClientConfig.hpp"
#include "common/Error.hpp"
#include "common/ErrorConverter.hpp"
#include "common/Types.hpp"
#include "proto/books.grpc.pb.h"

namespace bookshelf {

// Replies with success = false come back as ErrorCode::Rejected carrying the service message.
class BookCatalogClient {
public:
    explicit BookCatalogClient(const ClientConfig& c);
    BookCatalogClient(const BookCatalogClient&) = delete;
    BookCatalogClient& operator=(const BookCatalogClient&) = delete;
    [[nodiscard]] std::expected<Book, Error> create(const BookFields& fields) const;
    [[nodiscard]] std::expected<std::optional<Book>, Error> get(BookId id) const;
    [[nodiscard]] std::expected<Book, Error> update(BookId id, const BookFields& fields, const std::vector<std::string>& paths) const;
    [[nodiscard]] std::expected<std::monostate, Error> erase(BookId id) const;
    [[nodiscard]] std::expected<BookPage, Error> list(const ListQuery& query) const;
    [[nodiscard]] std::expected<BookPage, Error> all() const;
    const std::string& address() const;
private:
    template<typename Rep, typename F>
    std::expected<Rep, Error> call(const std::string& op, F&& f) const {
        grpc::ClientContext context;
        context.set_deadline(std::chrono::system_clock::now() + config.timeout);
        Rep reply;
        auto status = f(&context, &reply);
        if (!status.ok()) {
            spdlog::error("{} on {} failed: {}", op, config.address, status.error_message());
        }
        return toExpected(status, std::move(reply));
    }
    ClientConfig config;
    std::shared_ptr<grpc::Channel> channel;
    std::unique_ptr<books::BooksService::Stub> stub;
};

} // namespace bookshelf

#endif // BOOKSHELF_CLIENT_BOOKCATALOGCLIENT_HPP
