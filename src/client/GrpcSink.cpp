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
#include "client/GrpcSink.hpp"
#include "proto/spool.pb.h"
#include <grpcpp/grpcpp.h>
#include <grpcpp/security/credentials.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <utility>

namespace spool {

GrpcSink::GrpcSink(const std::string& address, std::string token)
    : GrpcSink(grpc::CreateChannel(address, grpc::InsecureChannelCredentials()), std::move(token)) {
    addr = address;
}

GrpcSink::GrpcSink(std::shared_ptr<grpc::Channel> c, std::string token)
    : bearer{std::move(token)},
      channel{std::move(c)},
      stub{proto::SinkService::NewStub(channel)} {}

grpc::Status GrpcSink::deliver(const TelemetryRecord& record, std::chrono::system_clock::time_point deadline) {
    proto::DeliverRequest request;
    auto* r = request.mutable_record();
    r->set_payload(record.payload);
    if (record.correlationId.has_value()) {
        r->set_correlationid(record.correlationId.value());
    }
    r->set_timestamp(record.enqueuedAt);
    proto::DeliverReply reply;
    grpc::ClientContext ctx;
    ctx.set_deadline(deadline);
    if (!bearer.empty()) {
        ctx.AddMetadata("authorization", "Bearer " + bearer);
    }
    auto status = stub->deliver(&ctx, request, &reply);
    if (!status.ok()) {
        spdlog::debug("GrpcSink: deliver to {} failed: {} {}", addr, static_cast<int>(status.error_code()), status.error_message());
    }
    return status;
}

std::string GrpcSink::address() const {
    return addr;
}

} // namespace spool
