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
#include <gtest/gtest.h>
#include "server/SpoolServer.hpp"
#include "server/SpoolServiceImpl.hpp"
#include "relay/Relay.hpp"
#include "relay/ReplayCoordinator.hpp"
#include "relay/Transmitter.hpp"
#include "common/CircuitBreaker.hpp"
#include "common/Config.hpp"
#include "common/ErrorConverter.hpp"
#include "storage/DurableBuffer.hpp"
#include "proto/spool.grpc.pb.h"
#include "fakes/TestSupport.hpp"
#include <grpcpp/grpcpp.h>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

using spool::CircuitBreaker;
using spool::CircuitState;
using spool::Config;
using spool::DurableBuffer;
using spool::ErrorCode;
using spool::Relay;
using spool::ReplayCoordinator;
using spool::SpoolServer;
using spool::SpoolServiceImpl;
using spool::Transmitter;
using spool::test::FakeSink;
using spool::test::InMemoryPersister;
using spool::test::TempDir;

class SpoolServiceImplTest : public ::testing::Test {
protected:
    TempDir tmp;
    Config config;
    InMemoryPersister persister;
    CircuitBreaker breaker {3, std::chrono::seconds{60}, persister};
    DurableBuffer buffer {tmp.path(), 100, 100ULL * 1024 * 1024};
    std::shared_ptr<FakeSink> sink = std::make_shared<FakeSink>();
    Transmitter transmitter {breaker, sink, std::chrono::milliseconds{100}};
    ReplayCoordinator coordinator {buffer, transmitter, breaker, 10, std::chrono::milliseconds{1}};
    Relay relay {breaker, buffer, transmitter, coordinator, config};
    SpoolServiceImpl service {relay, breaker};
    SpoolServer server {"127.0.0.1:0", {&service}};
    std::unique_ptr<spool::proto::SpoolService::Stub> stub;

    void SetUp() override {
        auto channel = grpc::CreateChannel("127.0.0.1:" + std::to_string(server.port()), grpc::InsecureChannelCredentials());
        stub = spool::proto::SpoolService::NewStub(channel);
    }

    static std::unique_ptr<grpc::ClientContext> context() {
        auto ctx = std::make_unique<grpc::ClientContext>();
        ctx->set_deadline(std::chrono::system_clock::now() + std::chrono::seconds{5});
        return ctx;
    }
};

TEST_F(SpoolServiceImplTest, EnqueueAcceptsRecord) {
    spool::proto::EnqueueRequest request;
    request.mutable_record()->set_payload("metric=1");
    request.mutable_record()->set_correlationid("c-1");
    request.mutable_record()->set_timestamp(99);
    spool::proto::EnqueueReply reply;
    auto ctx = context();
    const auto status = stub->enqueue(ctx.get(), request, &reply);
    ASSERT_TRUE(status.ok()) << status.error_message();
    const auto entries = buffer.drain(10);
    ASSERT_EQ(entries.size(), 1U);
    EXPECT_EQ(entries[0].record.payload, "metric=1");
    EXPECT_EQ(entries[0].record.correlationId, "c-1");
    EXPECT_EQ(entries[0].record.enqueuedAt, 99);
}

TEST_F(SpoolServiceImplTest, EnqueueAcceptsWhileSinkDown) {
    sink->set(FakeSink::Mode::Down);
    for (int i = 0; i < 3; ++i) {
        breaker.recordFailure();
    }
    spool::proto::EnqueueRequest request;
    request.mutable_record()->set_payload("x");
    spool::proto::EnqueueReply reply;
    auto ctx = context();
    EXPECT_TRUE(stub->enqueue(ctx.get(), request, &reply).ok());
    EXPECT_EQ(buffer.count(), 1U);
}

TEST_F(SpoolServiceImplTest, EnqueueWithoutRecordIsRejected) {
    const spool::proto::EnqueueRequest request;
    spool::proto::EnqueueReply reply;
    auto ctx = context();
    const auto status = stub->enqueue(ctx.get(), request, &reply);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(spool::toError(status).code, ErrorCode::InvalidArgument);
}

TEST_F(SpoolServiceImplTest, StatusReportsCircuitAndBuffer) {
    breaker.recordFailure();
    buffer.enqueue(spool::test::makeRecord("a"));
    buffer.enqueue(spool::test::makeRecord("b"));
    const spool::proto::StatusRequest request;
    spool::proto::StatusReply reply;
    auto ctx = context();
    ASSERT_TRUE(stub->status(ctx.get(), request, &reply).ok());
    EXPECT_EQ(reply.circuit().state(), "CLOSED");
    EXPECT_EQ(reply.circuit().failurecount(), 1U);
    EXPECT_EQ(reply.circuit().failurethreshold(), 3U);
    EXPECT_EQ(reply.circuit().resettimeoutms(), 60000);
    EXPECT_EQ(reply.buffer().memorycount(), 2U);
    EXPECT_EQ(reply.buffer().diskcount(), 0U);
    EXPECT_FALSE(reply.replay().isreplaying());
    EXPECT_GE(reply.uptimems(), 0);
}

TEST_F(SpoolServiceImplTest, ResetCircuitClosesOpenBreaker) {
    for (int i = 0; i < 3; ++i) {
        breaker.recordFailure();
    }
    ASSERT_EQ(breaker.currentState(), CircuitState::Open);
    const spool::proto::ResetRequest request;
    spool::proto::ResetReply reply;
    auto ctx = context();
    ASSERT_TRUE(stub->resetCircuit(ctx.get(), request, &reply).ok());
    EXPECT_EQ(reply.circuit().state(), "CLOSED");
    EXPECT_EQ(reply.circuit().failurecount(), 0U);
    EXPECT_EQ(breaker.currentState(), CircuitState::Closed);
}

TEST_F(SpoolServiceImplTest, ShutdownStopsServingAndIsIdempotent) {
    server.shutdown();
    server.shutdown();
    spool::proto::StatusReply reply;
    auto ctx = std::make_unique<grpc::ClientContext>();
    ctx->set_deadline(std::chrono::system_clock::now() + std::chrono::milliseconds{500});
    EXPECT_FALSE(stub->status(ctx.get(), spool::proto::StatusRequest{}, &reply).ok());
}

TEST(SpoolServerTest, NeedsAtLeastOneService) {
    EXPECT_THROW({ SpoolServer s("127.0.0.1:0", {}); }, std::invalid_argument);
}

TEST(SpoolServerTest, UnusableAddressThrows) {
    spool::proto::SinkService::Service service;
    EXPECT_THROW({ SpoolServer s("256.0.0.1:1", {&service}); }, std::runtime_error);
}
