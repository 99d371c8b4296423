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
#ifndef SPOOL_CLIENT_GRPC_SINK_HPP
#define SPOOL_CLIENT_GRPC_SINK_HPP

#include "client/Sink.hpp"
#include "proto/spool.grpc.pb.h"
#include <grpcpp/grpcpp.h>
#include <memory>
#include <string>

namespace spool {

// Forwards records to a remote SinkService, authenticating with a bearer token.
class GrpcSink : public Sink {
public:
    GrpcSink(const std::string& address, std::string token);
    GrpcSink(std::shared_ptr<grpc::Channel> channel, std::string token);
    grpc::Status deliver(const TelemetryRecord& record, std::chrono::system_clock::time_point deadline) override;
    [[nodiscard]] std::string address() const;
private:
    std::string addr;
    std::string bearer;
    std::shared_ptr<grpc::Channel> channel;
    std::unique_ptr<proto::SinkService::Stub> stub;
};

} // namespace spool

#endif // SPOOL_CLIENT_GRPC_SINK_HPP
