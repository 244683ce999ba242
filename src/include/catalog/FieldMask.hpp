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
#ifndef BOOKSHELF_CATALOG_FIELDMASK_HPP
#define BOOKSHELF_CATALOG_FIELDMASK_HPP

#include <string>
#include <vector>
#include <functional>
#include <unordered_map>
#include "common/Types.hpp"

namespace bookshelf {

struct FieldUpdater {
    // Copies the field from the payload onto the record.
    std::function<void(Book&, const BookFields&)> assign;
    // True when the payload carries a non-empty / non-zero value.
    std::function<bool(const BookFields&)> populated;
};

inline const std::string kIsbnPath {"isbn"};

// title, author, isbn, published_year, genre, description
const std::unordered_map<std::string, FieldUpdater>& getFieldUpdaters();

struct MaskResult {
    Book book;
    bool isbnTouched = false;
    std::vector<std::string> ignoredPaths;
};

// Applies exactly the named paths, including empty values. Unknown paths are collected, not applied.
MaskResult applyFieldMask(const Book& current, const BookFields& payload, const std::vector<std::string>& paths);

// Applies every populated payload field. Cannot clear a field.
MaskResult applyPopulatedFields(const Book& current, const BookFields& payload);

} // namespace bookshelf

#endif // BOOKSHELF_CATALOG_FIELDMASK_HPP
