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
#ifndef BOOKSHELF_SERVER_RPCSERVER_HPP
#define BOOKSHELF_SERVER_RPCSERVER_HPP

#include <memory>
#include <string>
#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>
#include <thread>
#include <stdexcept>
#include <chrono>

namespace bookshelf {

template<typename Service>
class RPCServer {
public:
    // Port 0 binds any free port; address() reports the one chosen.
    RPCServer(const std::string& address, Service& s);
    ~RPCServer();
    RPCServer(const RPCServer&) = delete;
    RPCServer& operator=(const RPCServer&) = delete;
    RPCServer(RPCServer&&) = delete;
    RPCServer& operator=(RPCServer&&) = delete;
    const std::string& address() const;
    int port() const;
    void shutdown();
private:
    std::string addr;
    Service& service;
    int selectedPort;
    std::unique_ptr<grpc::Server> server;
    std::thread serverThread;
};

template<typename Service>
RPCServer<Service>::RPCServer(const std::string& address, Service& s)
    : addr{address}, service {s}, selectedPort {0} {
    grpc::ServerBuilder sb{};
    sb.AddListeningPort(addr, grpc::InsecureServerCredentials(), &selectedPort);
    sb.RegisterService(&service);
    server = sb.BuildAndStart();
    if (!server || selectedPort == 0) {
        throw std::runtime_error("Failed to start gRPC server on address: " + address);
    }
    addr = addr.substr(0, addr.rfind(':')) + ":" + std::to_string(selectedPort);
    spdlog::info("gRPC server listening on {}", addr);
    serverThread = std::thread([this]() { server->Wait(); });
}

template<typename Service>
const std::string& RPCServer<Service>::address() const {
    return addr;
}

template<typename Service>
int RPCServer<Service>::port() const {
    return selectedPort;
}

template<typename Service>
void RPCServer<Service>::shutdown() {
    if (server) {
        spdlog::info("Shutting down gRPC server on {}", addr);
        auto deadline = std::chrono::system_clock::now() + std::chrono::seconds{5L};
        server->Shutdown(deadline);
    }
    if (serverThread.joinable()) {
        serverThread.join();
    }
    server.reset();
}

template<typename Service>
RPCServer<Service>::~RPCServer() {
    shutdown();
}

} // namespace bookshelf

#endif // BOOKSHELF_SERVER_RPCSERVER_HPP
