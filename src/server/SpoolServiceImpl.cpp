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
#include "server/SpoolServiceImpl.hpp"
#include "common/ErrorConverter.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"
#include <grpcpp/support/status.h>
#include "proto/spool.pb.h"
#include <spdlog/spdlog.h>
#include <optional>
#include <string>
#include <tuple>
#include <utility>

namespace spool {

void toProto(const CircuitSnapshot& snapshot, uint32_t failureThreshold,
             std::chrono::milliseconds resetTimeout, proto::CircuitStatus* out) {
    out->set_state(toString(snapshot.state));
    out->set_failurecount(snapshot.failureCount);
    out->set_laststatechangetime(snapshot.lastStateChangeTime);
    out->set_failurethreshold(failureThreshold);
    out->set_resettimeoutms(resetTimeout.count());
}

void toProto(const RelayStatus& status, proto::StatusReply* out) {
    out->set_uptimems(status.uptimeMs);
    toProto(status.circuit, status.failureThreshold, status.resetTimeout, out->mutable_circuit());
    auto* b = out->mutable_buffer();
    b->set_memorycount(status.buffer.memoryCount);
    b->set_diskcount(status.buffer.diskCount);
    b->set_diskfilecount(status.buffer.diskFileCount);
    b->set_totalbytes(status.buffer.totalBytes);
    b->set_evicted(status.buffer.evicted);
    b->set_dropped(status.buffer.dropped);
    b->set_lasterror(status.buffer.lastError);
    auto* r = out->mutable_replay();
    r->set_isreplaying(status.replay.isReplaying);
    r->set_processed(status.replay.processed);
    r->set_errors(status.replay.errors);
    r->set_interrupted(status.replay.interrupted);
    r->set_started(status.replay.started);
    r->set_completed(status.replay.completed);
    auto* t = out->mutable_transmitter();
    t->set_sent(status.transmitter.sent);
    t->set_failed(status.transmitter.failed);
    t->set_rejected(status.transmitter.rejected);
    t->set_timeouts(status.transmitter.timeouts);
    t->set_lasterror(status.transmitter.lastError);
}

SpoolServiceImpl::SpoolServiceImpl(Relay& r, CircuitBreaker& b)
    : relay {r}, breaker {b} {}

grpc::Status SpoolServiceImpl::enqueue(
    grpc::ServerContext* context,
    const proto::EnqueueRequest* request,
    proto::EnqueueReply* reply) {
    std::ignore = context;
    std::ignore = reply;
    if (!request->has_record()) {
        return toGrpcStatus(Error {ErrorCode::InvalidArgument, "enqueue request carries no record"});
    }
    const auto& r = request->record();
    RecordMetadata metadata;
    if (!r.correlationid().empty()) {
        metadata.correlationId = r.correlationid();
    }
    metadata.timestamp = r.timestamp();
    relay.enqueue(r.payload(), std::move(metadata));
    return grpc::Status::OK;
}

grpc::Status SpoolServiceImpl::status(
    grpc::ServerContext* context,
    const proto::StatusRequest* request,
    proto::StatusReply* reply) {
    std::ignore = context;
    std::ignore = request;
    toProto(relay.status(), reply);
    return grpc::Status::OK;
}

grpc::Status SpoolServiceImpl::resetCircuit(
    grpc::ServerContext* context,
    const proto::ResetRequest* request,
    proto::ResetReply* reply) {
    std::ignore = context;
    std::ignore = request;
    spdlog::info("SpoolService: circuit reset requested");
    breaker.reset();
    toProto(breaker.snapshot(), breaker.failureThreshold(), breaker.resetTimeout(), reply->mutable_circuit());
    return grpc::Status::OK;
}

} // namespace spool
