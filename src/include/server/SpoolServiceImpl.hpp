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
#ifndef SPOOL_SERVER_SPOOL_SERVICE_IMPL_HPP
#define SPOOL_SERVER_SPOOL_SERVICE_IMPL_HPP

#include <grpcpp/grpcpp.h>
#include <chrono>
#include <cstdint>
#include "proto/spool.grpc.pb.h"
#include "relay/Relay.hpp"
#include "common/CircuitBreaker.hpp"

namespace spool {

void toProto(const CircuitSnapshot& snapshot, uint32_t failureThreshold,
             std::chrono::milliseconds resetTimeout, proto::CircuitStatus* out);
void toProto(const RelayStatus& status, proto::StatusReply* out);

class SpoolServiceImpl final : public proto::SpoolService::Service {
public:
    SpoolServiceImpl(Relay& relay, CircuitBreaker& breaker);
    grpc::Status enqueue(
        grpc::ServerContext* context,
        const proto::EnqueueRequest* request,
        proto::EnqueueReply* reply) override;
    grpc::Status status(
        grpc::ServerContext* context,
        const proto::StatusRequest* request,
        proto::StatusReply* reply) override;
    grpc::Status resetCircuit(
        grpc::ServerContext* context,
        const proto::ResetRequest* request,
        proto::ResetReply* reply) override;
private:
    Relay& relay;
    CircuitBreaker& breaker;
};

} // namespace spool

#endif // SPOOL_SERVER_SPOOL_SERVICE_IMPL_HPP
