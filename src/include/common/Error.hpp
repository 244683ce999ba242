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
#ifndef BOOKSHELF_COMMON_ERROR_HPP
#define BOOKSHELF_COMMON_ERROR_HPP

#include <string>
#include <ostream>
#include <cstdint>
#include <proto/error.pb.h>

namespace bookshelf {

enum class ErrorCode {
    OK = 0,
    InvalidArg = 1,
    AlreadyExists = 2,
    NotFound = 3,
    Internal = 4,
    Unavailable = 5,
    Timeout = 6,
    Cancelled = 7,
    Rejected = 8,
    Unknown = 128
};

std::ostream& operator<<(std::ostream& os, const ErrorCode& code);

std::string toString(const ErrorCode& code);

struct Error {
    ErrorCode code;
    std::string what;
    int64_t id;
    std::string isbn;

    Error(const ErrorCode& c, std::string w);
    Error(const ErrorCode& c, std::string w, int64_t i, std::string is);
    explicit Error(const ErrorCode& c);
    explicit Error(const proto::ErrorDetails& details);
};

} // namespace bookshelf

#endif // BOOKSHELF_COMMON_ERROR_HPP
