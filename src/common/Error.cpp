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
#include "common/Error.hpp"
#include <utility>
#include <string>
#include <ostream>
#include <proto/error.pb.h>

namespace bookshelf {

std::ostream& operator<<(std::ostream& os, const ErrorCode& code) {
    os << toString(code);
    return os;
}

std::string toString(const ErrorCode& code) {
    switch (code)
    {
        case ErrorCode::OK: return "OK";
        case ErrorCode::InvalidArg: return "InvalidArgument";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::Internal: return "Internal";
        case ErrorCode::Unavailable: return "Unavailable";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::Rejected: return "Rejected";
        case ErrorCode::Unknown: return "Unknown";
    }
    std::unreachable();
}

Error::Error(const ErrorCode& c, std::string w, int64_t i, std::string is)
    : code {c}, what {std::move(w)}, id {i}, isbn {std::move(is)} {}
Error::Error(const ErrorCode& c, std::string w) : code {c}, what {std::move(w)}, id {}, isbn {} {}
Error::Error(const ErrorCode& c) : code {c}, what {toString(c)}, id {}, isbn {} {}
Error::Error(const proto::ErrorDetails& details)
    : code {static_cast<ErrorCode>(details.code())},
      what {details.what()},
      id {details.id()},
      isbn {details.isbn()} {}

} // namespace bookshelf
