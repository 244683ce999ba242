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
#include <chrono>
#include <string>
#include <vector>
#include "storage/InMemoryBookStore.hpp"
#include "common/Types.hpp"
#include "common/Error.hpp"

using bookshelf::Book;
using bookshelf::BookFields;
using bookshelf::ErrorCode;
using bookshelf::InMemoryBookStore;
using bookshelf::Timestamp;

class InMemoryBookStoreTest : public ::testing::Test {
protected:
    Timestamp now {std::chrono::seconds {1700000000L}};
    InMemoryBookStore store {[this]() { return now; }};
};

TEST_F(InMemoryBookStoreTest, InsertAssignsIdAndTimestamps) {
    auto inserted = store.insert(BookFields {"Dune", "Frank Herbert", "978-0441013593", 1965, "Fiction", "Spice"});
    ASSERT_TRUE(inserted.has_value());
    EXPECT_EQ(inserted.value().id, 1);
    EXPECT_EQ(inserted.value().fields.title, "Dune");
    EXPECT_EQ(inserted.value().createdAt, now);
    EXPECT_EQ(inserted.value().updatedAt, inserted.value().createdAt);
    EXPECT_EQ(store.size(), 1);
}

TEST_F(InMemoryBookStoreTest, GetNonExistentId) {
    auto got = store.get(42);
    ASSERT_TRUE(got.has_value());
    EXPECT_FALSE(got.value().has_value());
}

TEST_F(InMemoryBookStoreTest, GetReturnsStoredRecord) {
    auto inserted = store.insert(BookFields {"Dune", "Frank Herbert"});
    ASSERT_TRUE(inserted.has_value());
    auto got = store.get(inserted.value().id);
    ASSERT_TRUE(got.has_value());
    ASSERT_TRUE(got.value().has_value());
    EXPECT_EQ(got.value().value(), inserted.value());
}

TEST_F(InMemoryBookStoreTest, IdsAreNeverReused) {
    auto a = store.insert(BookFields {"A", "X"});
    auto b = store.insert(BookFields {"B", "X"});
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    auto removed = store.remove(b.value().id);
    ASSERT_TRUE(removed.has_value());
    EXPECT_TRUE(removed.value());
    auto c = store.insert(BookFields {"C", "X"});
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(a.value().id, 1);
    EXPECT_EQ(b.value().id, 2);
    EXPECT_EQ(c.value().id, 3);
}

TEST_F(InMemoryBookStoreTest, RemoveMissingReturnsFalse) {
    auto removed = store.remove(7);
    ASSERT_TRUE(removed.has_value());
    EXPECT_FALSE(removed.value());
}

TEST_F(InMemoryBookStoreTest, AllPreservesInsertionOrder) {
    ASSERT_TRUE(store.insert(BookFields {"First", "X"}).has_value());
    ASSERT_TRUE(store.insert(BookFields {"Second", "X"}).has_value());
    ASSERT_TRUE(store.insert(BookFields {"Third", "X"}).has_value());
    ASSERT_TRUE(store.remove(2).has_value());
    auto all = store.all();
    ASSERT_TRUE(all.has_value());
    ASSERT_EQ(all.value().size(), 2);
    EXPECT_EQ(all.value()[0].fields.title, "First");
    EXPECT_EQ(all.value()[1].fields.title, "Third");
}

TEST_F(InMemoryBookStoreTest, ReplaceRefreshesUpdatedAtOnly) {
    auto inserted = store.insert(BookFields {"Dune", "Frank Herbert"});
    ASSERT_TRUE(inserted.has_value());
    const auto createdAt = inserted.value().createdAt;
    now += std::chrono::seconds {30L};
    Book changed = inserted.value();
    changed.fields.genre = "Science Fiction";
    changed.createdAt = Timestamp {};
    auto replaced = store.replace(changed);
    ASSERT_TRUE(replaced.has_value());
    EXPECT_EQ(replaced.value().fields.genre, "Science Fiction");
    EXPECT_EQ(replaced.value().createdAt, createdAt);
    EXPECT_EQ(replaced.value().updatedAt, now);
}

TEST_F(InMemoryBookStoreTest, ReplaceNeverMovesUpdatedAtBeforeCreatedAt) {
    auto inserted = store.insert(BookFields {"Dune", "Frank Herbert"});
    ASSERT_TRUE(inserted.has_value());
    now -= std::chrono::hours {1L};
    auto replaced = store.replace(inserted.value());
    ASSERT_TRUE(replaced.has_value());
    EXPECT_GE(replaced.value().updatedAt, replaced.value().createdAt);
}

TEST_F(InMemoryBookStoreTest, ReplaceMissingIsNotFound) {
    Book ghost {99, BookFields {"Ghost", "Nobody"}, now, now};
    auto replaced = store.replace(ghost);
    ASSERT_FALSE(replaced.has_value());
    EXPECT_EQ(replaced.error().code, ErrorCode::NotFound);
    EXPECT_EQ(store.size(), 0);
}

TEST_F(InMemoryBookStoreTest, IsbnConflictIsExactAndExcludesSelf) {
    auto inserted = store.insert(BookFields {"Dune", "Frank Herbert", "978-0441013593"});
    ASSERT_TRUE(inserted.has_value());
    EXPECT_TRUE(store.isbnConflict("978-0441013593", std::nullopt));
    EXPECT_FALSE(store.isbnConflict("978-0441013593", inserted.value().id));
    EXPECT_FALSE(store.isbnConflict("978-0441013594", std::nullopt));
    EXPECT_FALSE(store.isbnConflict("", std::nullopt));
}

TEST_F(InMemoryBookStoreTest, IsbnConflictIsCaseSensitive) {
    ASSERT_TRUE(store.insert(BookFields {"Manual", "Vendor", "isbn-abc"}).has_value());
    EXPECT_TRUE(store.isbnConflict("isbn-abc", std::nullopt));
    EXPECT_FALSE(store.isbnConflict("ISBN-ABC", std::nullopt));
}

TEST_F(InMemoryBookStoreTest, EmptyIsbnNeverConflicts) {
    ASSERT_TRUE(store.insert(BookFields {"A", "X"}).has_value());
    ASSERT_TRUE(store.insert(BookFields {"B", "X"}).has_value());
    EXPECT_FALSE(store.isbnConflict("", std::nullopt));
}
