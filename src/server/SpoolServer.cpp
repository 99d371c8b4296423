// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * Spool a resilient, durable telemetry relay.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include "server/SpoolServer.hpp"
#include <spdlog/spdlog.h>
#include <grpcpp/grpcpp.h>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace spool {

SpoolServer::SpoolServer(const std::string& addr, const std::vector<grpc::Service*>& services,
                         std::chrono::milliseconds drainPeriod)
    : address{addr},
      drain{drainPeriod} {
    if (services.empty()) {
        throw std::invalid_argument("SpoolServer: no services to serve on " + address);
    }
    grpc::ServerBuilder builder;
    builder.AddListeningPort(address, grpc::InsecureServerCredentials(), &boundPort);
    for (auto* service : services) {
        builder.RegisterService(service);
    }
    server = builder.BuildAndStart();
    if (!server || boundPort == 0) {
        throw std::runtime_error("SpoolServer: cannot listen on " + address);
    }
    spdlog::info("SpoolServer: serving {} service(s) on {} (port {})", services.size(), address, boundPort);
}

SpoolServer::~SpoolServer() {
    shutdown();
}

int SpoolServer::port() const {
    return boundPort;
}

void SpoolServer::shutdown() {
    std::lock_guard lock{m};
    if (!server) {
        return;
    }
    server->Shutdown(std::chrono::system_clock::now() + drain);
    server->Wait();
    server.reset();
    spdlog::info("SpoolServer: stopped listening on {}", address);
}

} // namespace spool
