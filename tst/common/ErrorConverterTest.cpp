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
#include <gtest/gtest.h>
#include "common/Error.hpp"
#include <expected>
#include <stdexcept>
#include <tuple>
#include "common/ErrorConverter.hpp"
#include <grpcpp/support/status.h>

using bookshelf::ErrorCode;
using bookshelf::Error;
using bookshelf::toGrpcStatusCode;
using bookshelf::toGrpcStatus;
using bookshelf::toError;
using bookshelf::toExpected;

TEST(ErrorConverterTest, ToGrpcStatusCodeAllCodes) {
    EXPECT_EQ(toGrpcStatusCode(ErrorCode::NotFound), grpc::StatusCode::NOT_FOUND);
    EXPECT_EQ(toGrpcStatusCode(ErrorCode::InvalidArg), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(toGrpcStatusCode(ErrorCode::AlreadyExists), grpc::StatusCode::ALREADY_EXISTS);
    EXPECT_EQ(toGrpcStatusCode(ErrorCode::Internal), grpc::StatusCode::INTERNAL);
    EXPECT_EQ(toGrpcStatusCode(ErrorCode::Unavailable), grpc::StatusCode::UNAVAILABLE);
    EXPECT_EQ(toGrpcStatusCode(ErrorCode::Timeout), grpc::StatusCode::DEADLINE_EXCEEDED);
    EXPECT_EQ(toGrpcStatusCode(ErrorCode::Rejected), grpc::StatusCode::FAILED_PRECONDITION);
    EXPECT_EQ(toGrpcStatusCode(ErrorCode::Unknown), grpc::StatusCode::UNKNOWN);
}

TEST(ErrorConverterTest, ToGrpcStatusKeepsMessage) {
    const Error err(ErrorCode::Internal, "Internal error: store unavailable");
    const grpc::Status status = toGrpcStatus(err);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INTERNAL);
    EXPECT_EQ(status.error_message(), "Internal error: store unavailable");
    EXPECT_FALSE(status.ok());
}

TEST(ErrorConverterTest, ToGrpcStatusFromExpected) {
    const std::expected<int, Error> ok = 42;
    const std::expected<int, Error> err = std::unexpected(Error(ErrorCode::InvalidArg, "bad arg"));
    EXPECT_EQ(toGrpcStatus(ok).error_code(), grpc::StatusCode::OK);
    const grpc::Status status = toGrpcStatus(err);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(status.error_message(), "bad arg");
}

TEST(ErrorConverterTest, OkErrorCannotBecomeStatus) {
    EXPECT_THROW(std::ignore = toGrpcStatus(Error {ErrorCode::OK}), std::logic_error);
}

TEST(ErrorConverterTest, DetailsRoundTripThroughStatus) {
    const Error err(ErrorCode::AlreadyExists, "Book with ISBN 978-1 already exists", 5, "978-1");
    const Error back = toError(toGrpcStatus(err));
    EXPECT_EQ(back.code, ErrorCode::AlreadyExists);
    EXPECT_EQ(back.what, "Book with ISBN 978-1 already exists");
    EXPECT_EQ(back.id, 5);
    EXPECT_EQ(back.isbn, "978-1");
}

TEST(ErrorConverterTest, ToErrorAllGrpcCodes) {
    const Error e1 = toError(grpc::Status(grpc::StatusCode::NOT_FOUND, "nf"));
    const Error e2 = toError(grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "inv"));
    const Error e3 = toError(grpc::Status(grpc::StatusCode::UNAVAILABLE, "unavail"));
    const Error e4 = toError(grpc::Status(grpc::StatusCode::INTERNAL, "int"));
    const Error e5 = toError(grpc::Status(grpc::StatusCode::DEADLINE_EXCEEDED, "late"));
    const Error e6 = toError(grpc::Status(grpc::StatusCode::PERMISSION_DENIED, "denied"));
    EXPECT_EQ(e1.code, ErrorCode::NotFound);
    EXPECT_EQ(e2.code, ErrorCode::InvalidArg);
    EXPECT_EQ(e3.code, ErrorCode::Unavailable);
    EXPECT_EQ(e4.code, ErrorCode::Internal);
    EXPECT_EQ(e5.code, ErrorCode::Timeout);
    EXPECT_EQ(e6.code, ErrorCode::Unknown);
    EXPECT_EQ(e1.what, "nf");
    EXPECT_EQ(e4.what, "int");
    EXPECT_EQ(e6.what, "denied");
}

TEST(ErrorConverterTest, ToErrorRejectsOk) {
    EXPECT_THROW(std::ignore = toError(grpc::Status::OK), std::logic_error);
}

TEST(ErrorConverterTest, ToExpectedValueAndError) {
    const grpc::Status ok(grpc::StatusCode::OK, "");
    const grpc::Status err(grpc::StatusCode::INVALID_ARGUMENT, "bad");
    auto v = toExpected(ok, 123);
    EXPECT_TRUE(v.has_value());
    EXPECT_EQ(v.value(), 123);
    auto e = toExpected(err, 123);
    EXPECT_FALSE(e.has_value());
    EXPECT_EQ(e.error().code, ErrorCode::InvalidArg);
    EXPECT_EQ(e.error().what, "bad");
}

TEST(ErrorConverterTest, ToExpectedVoid) {
    const grpc::Status ok(grpc::StatusCode::OK, "");
    const grpc::Status err(grpc::StatusCode::NOT_FOUND, "nf");
    auto v = toExpected(ok);
    EXPECT_TRUE(v.has_value());
    auto e = toExpected(err);
    EXPECT_FALSE(e.has_value());
    EXPECT_EQ(e.error().code, ErrorCode::NotFound);
    EXPECT_EQ(e.error().what, "nf");
}

TEST(ErrorConverterTest, ErrorCodeNames) {
    EXPECT_EQ(toString(ErrorCode::AlreadyExists), "AlreadyExists");
    EXPECT_EQ(toString(ErrorCode::InvalidArg), "InvalidArgument");
    EXPECT_EQ(Error {ErrorCode::NotFound}.what, "NotFound");
}
