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
#include "common/Types.hpp"
#include <utility>
#include <chrono>
#include <google/protobuf/util/time_util.h>
#include "proto/books.pb.h"

namespace bookshelf {

namespace {

Timestamp fromProtoTimestamp(const google::protobuf::Timestamp& ts) {
    const auto nanos = google::protobuf::util::TimeUtil::TimestampToNanoseconds(ts);
    return Timestamp {std::chrono::duration_cast<Timestamp::duration>(std::chrono::nanoseconds {nanos})};
}

void toProtoTimestamp(const Timestamp& t, google::protobuf::Timestamp* ts) {
    const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(t.time_since_epoch()).count();
    *ts = google::protobuf::util::TimeUtil::NanosecondsToTimestamp(nanos);
}

} // namespace

Timestamp systemNow() {
    return std::chrono::system_clock::now();
}

BookFields::BookFields(std::string t, std::string a, std::string i, int32_t y, std::string g, std::string d)
    : title {std::move(t)},
      author {std::move(a)},
      isbn {std::move(i)},
      publishedYear {y},
      genre {std::move(g)},
      description {std::move(d)} {}

BookFields::BookFields(const books::Book& protoBook)
    : title {protoBook.title()},
      author {protoBook.author()},
      isbn {protoBook.isbn()},
      publishedYear {protoBook.published_year()},
      genre {protoBook.genre()},
      description {protoBook.description()} {}

BookFields::BookFields(const books::CreateBookRequest& request)
    : title {request.title()},
      author {request.author()},
      isbn {request.isbn()},
      publishedYear {request.published_year()},
      genre {request.genre()},
      description {request.description()} {}

Book::Book(BookId i, BookFields f, Timestamp created, Timestamp updated)
    : id {i}, fields {std::move(f)}, createdAt {created}, updatedAt {updated} {}

Book::Book(const books::Book& protoBook)
    : id {protoBook.id()},
      fields {protoBook},
      createdAt {fromProtoTimestamp(protoBook.created_at())},
      updatedAt {fromProtoTimestamp(protoBook.updated_at())} {}

void Book::toProto(books::Book* protoBook) const {
    protoBook->set_id(id);
    protoBook->set_title(fields.title);
    protoBook->set_author(fields.author);
    protoBook->set_isbn(fields.isbn);
    protoBook->set_published_year(fields.publishedYear);
    protoBook->set_genre(fields.genre);
    protoBook->set_description(fields.description);
    toProtoTimestamp(createdAt, protoBook->mutable_created_at());
    toProtoTimestamp(updatedAt, protoBook->mutable_updated_at());
}

} // namespace bookshelf
