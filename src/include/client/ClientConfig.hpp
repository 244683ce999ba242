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
#ifndef BOOKSHELF_CLIENT_CLIENTCONFIG_HPP
#define BOOKSHELF_CLIENT_CLIENTCONFIG_HPP

#include <string>
#include <chrono>

namespace bookshelf {

struct ClientConfig {
    std::string address {"localhost:50052"};
    std::chrono::milliseconds timeout {5000L};
};

} // namespace bookshelf

#endif // BOOKSHELF_CLIENT_CLIENTCONFIG_HPP
