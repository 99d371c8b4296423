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
#ifndef SPOOL_SERVER_SPOOL_SERVER_HPP
#define SPOOL_SERVER_SPOOL_SERVER_HPP

#include <grpcpp/grpcpp.h>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace spool {

// Listening endpoint for the relay's gRPC services. The synchronous gRPC
// server runs handlers on its own pool, so construction returns as soon as
// the port is bound.
class SpoolServer {
public:
    static constexpr std::chrono::milliseconds defaultDrain {1000};

    // Throws std::runtime_error when the address cannot be bound.
    SpoolServer(const std::string& address, const std::vector<grpc::Service*>& services,
                std::chrono::milliseconds drain = defaultDrain);
    SpoolServer(const SpoolServer&) = delete;
    SpoolServer& operator=(const SpoolServer&) = delete;
    ~SpoolServer();

    // Port actually bound; differs from the address when it asked for port 0.
    [[nodiscard]] int port() const;
    // Refuses new calls and cancels whatever is still running after the
    // drain period. Idempotent.
    void shutdown();
private:
    const std::string address;
    const std::chrono::milliseconds drain;
    int boundPort {0};
    std::mutex m;
    std::unique_ptr<grpc::Server> server;
};

} // namespace spool

#endif // SPOOL_SERVER_SPOOL_SERVER_HPP
