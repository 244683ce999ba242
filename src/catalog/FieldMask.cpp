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
#include "catalog/FieldMask.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include "common/Types.hpp"

namespace bookshelf {

const std::unordered_map<std::string, FieldUpdater>& getFieldUpdaters() {
    static const std::unordered_map<std::string, FieldUpdater> map {
        { "title", {
            [](Book& b, const BookFields& p) { b.fields.title = p.title; },
            [](const BookFields& p) { return !p.title.empty(); }
        }},
        { "author", {
            [](Book& b, const BookFields& p) { b.fields.author = p.author; },
            [](const BookFields& p) { return !p.author.empty(); }
        }},
        { kIsbnPath, {
            [](Book& b, const BookFields& p) { b.fields.isbn = p.isbn; },
            [](const BookFields& p) { return !p.isbn.empty(); }
        }},
        { "published_year", {
            [](Book& b, const BookFields& p) { b.fields.publishedYear = p.publishedYear; },
            [](const BookFields& p) { return p.publishedYear != 0; }
        }},
        { "genre", {
            [](Book& b, const BookFields& p) { b.fields.genre = p.genre; },
            [](const BookFields& p) { return !p.genre.empty(); }
        }},
        { "description", {
            [](Book& b, const BookFields& p) { b.fields.description = p.description; },
            [](const BookFields& p) { return !p.description.empty(); }
        }}
    };
    return map;
}

MaskResult applyFieldMask(const Book& current, const BookFields& payload, const std::vector<std::string>& paths) {
    MaskResult result {current, false, {}};
    const auto& updaters = getFieldUpdaters();
    for (const auto& path : paths) {
        auto i = updaters.find(path);
        if (i == updaters.end()) {
            result.ignoredPaths.push_back(path);
            continue;
        }
        i->second.assign(result.book, payload);
        if (path == kIsbnPath) {
            result.isbnTouched = true;
        }
    }
    return result;
}

MaskResult applyPopulatedFields(const Book& current, const BookFields& payload) {
    MaskResult result {current, false, {}};
    for (const auto& [path, updater] : getFieldUpdaters()) {
        if (!updater.populated(payload)) {
            continue;
        }
        updater.assign(result.book, payload);
        if (path == kIsbnPath) {
            result.isbnTouched = true;
        }
    }
    return result;
}

} // namespace bookshelf
