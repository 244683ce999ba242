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
#include "server/Signals.hpp"
#include <csignal>
#include <cstring>
#include <string>
#include <pthread.h>
#include "common/Error.hpp"

namespace bookshelf {

std::expected<sigset_t, Error> blockTerminationSignals() {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (const int rc = pthread_sigmask(SIG_BLOCK, &signals, nullptr); rc != 0) {
        return std::unexpected {Error {ErrorCode::Internal, std::string {"pthread_sigmask failed: "} + std::strerror(rc)}};
    }
    return signals;
}

std::expected<int, Error> waitForTerminationSignal(const sigset_t& signals) {
    int received = 0;
    if (const int rc = sigwait(&signals, &received); rc != 0) {
        return std::unexpected {Error {ErrorCode::Internal, std::string {"sigwait failed: "} + std::strerror(rc)}};
    }
    return received;
}

} // namespace bookshelf
