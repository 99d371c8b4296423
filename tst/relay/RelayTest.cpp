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
#include "relay/Relay.hpp"
#include "relay/ReplayCoordinator.hpp"
#include "relay/Transmitter.hpp"
#include "common/CircuitBreaker.hpp"
#include "common/Config.hpp"
#include "storage/DurableBuffer.hpp"
#include "fakes/TestSupport.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <algorithm>
#include <tuple>
#include <utility>
#include <vector>

using spool::CircuitBreaker;
using spool::CircuitState;
using spool::Config;
using spool::DurableBuffer;
using spool::RecordMetadata;
using spool::Relay;
using spool::ReplayCoordinator;
using spool::Transmitter;
using spool::test::FakeSink;
using spool::test::InMemoryPersister;
using spool::test::TempDir;
using spool::test::numbered;
using spool::test::waitFor;

namespace {

Config testConfig() {
    Config c;
    c.failureThreshold = 2;
    c.resetTimeout = std::chrono::milliseconds{200};
    c.memoryCapacity = 10;
    c.sendTimeout = std::chrono::milliseconds{100};
    c.batchSize = 10;
    c.flushInterval = std::chrono::milliseconds{50};
    c.replayPause = std::chrono::milliseconds{1};
    c.shutdownGrace = std::chrono::seconds{2};
    return c;
}

} // namespace

// The relay stack, rebuilt per restart on the same directory.
struct Stack {
    Stack(const Config& c, const TempDir& dir, std::shared_ptr<FakeSink> s)
        : breaker {c.failureThreshold, c.resetTimeout, persister},
          buffer {dir.path(), c.memoryCapacity, c.diskCapacityBytes},
          transmitter {breaker, std::move(s), c.sendTimeout},
          coordinator {buffer, transmitter, breaker, c.batchSize, c.replayPause},
          relay {breaker, buffer, transmitter, coordinator, c} {}
    InMemoryPersister persister;
    CircuitBreaker breaker;
    DurableBuffer buffer;
    Transmitter transmitter;
    ReplayCoordinator coordinator;
    Relay relay;
};

class RelayTest : public ::testing::Test {
protected:
    TempDir tmp;
    Config config = testConfig();
    std::shared_ptr<FakeSink> sink = std::make_shared<FakeSink>();
    std::unique_ptr<Stack> stack;

    void SetUp() override {
        stack = std::make_unique<Stack>(config, tmp, sink);
    }

    void restart() {
        stack.reset();
        stack = std::make_unique<Stack>(config, tmp, sink);
    }

    void enqueue(int from, int to) {
        for (const auto& p : numbered("r", from, to)) {
            stack->relay.enqueue(p);
        }
    }
};

TEST_F(RelayTest, PeriodicDrainDeliversInOrder) {
    stack->relay.start();
    enqueue(0, 25);
    ASSERT_TRUE(waitFor([this] { return sink->payloads().size() == 25; }, std::chrono::seconds{5}));
    EXPECT_EQ(sink->payloads(), numbered("r", 0, 25));
    EXPECT_EQ(stack->buffer.count(), 0U);
}

TEST_F(RelayTest, EagerSendBeatsTheTimer) {
    config.flushInterval = std::chrono::seconds{30};
    restart();
    stack->relay.start();
    stack->relay.enqueue("hello", RecordMetadata {"corr-7", 1234});
    ASSERT_TRUE(waitFor([this] { return sink->payloads().size() == 1; }, std::chrono::seconds{2}));
    const auto r = sink->received().front();
    EXPECT_EQ(r.correlationId, "corr-7");
    EXPECT_EQ(r.enqueuedAt, 1234);
}

TEST_F(RelayTest, EnqueueStampsMissingTimestamp) {
    config.flushInterval = std::chrono::seconds{30};
    restart();
    const auto before = spool::nowMillis();
    stack->relay.enqueue("x");
    const auto entries = stack->buffer.drain(1);
    ASSERT_EQ(entries.size(), 1U);
    EXPECT_GE(entries[0].record.enqueuedAt, before);
    EXPECT_FALSE(entries[0].record.correlationId.has_value());
}

TEST_F(RelayTest, EnqueueStaysFastWhileSinkHangs) {
    sink->set(FakeSink::Mode::Hang);
    stack->relay.start();
    // Keep segment reads going alongside the relay's own drains.
    std::atomic<bool> done {false};
    std::thread reader([this, &done] {
        while (!done) {
            std::ignore = stack->buffer.drain(100);
        }
    });
    auto worst = std::chrono::steady_clock::duration::zero();
    for (const auto& p : numbered("r", 0, 200)) {
        const auto start = std::chrono::steady_clock::now();
        stack->relay.enqueue(p);
        worst = std::max(worst, std::chrono::steady_clock::now() - start);
    }
    done = true;
    reader.join();
    EXPECT_LT(worst, std::chrono::milliseconds{5});
    EXPECT_EQ(stack->buffer.count(), 200U);
    sink->set(FakeSink::Mode::Up);
}

TEST_F(RelayTest, OutageThenRecoveryDeliversEverythingOnce) {
    sink->set(FakeSink::Mode::Down);
    stack->relay.start();
    enqueue(0, 15);
    ASSERT_TRUE(waitFor([this] { return stack->breaker.currentState() == CircuitState::Open; }, std::chrono::seconds{2}));
    EXPECT_EQ(stack->buffer.count(), 15U);
    sink->set(FakeSink::Mode::Up);
    ASSERT_TRUE(waitFor([this] { return stack->buffer.count() == 0; }, std::chrono::seconds{5}));
    EXPECT_EQ(sink->payloads(), numbered("r", 0, 15));
    EXPECT_EQ(stack->breaker.currentState(), CircuitState::Closed);
}

TEST_F(RelayTest, ShutdownFlushesMemoryTier) {
    sink->set(FakeSink::Mode::Down);
    enqueue(0, 5);
    EXPECT_EQ(stack->buffer.stats().memoryCount, 5U);
    stack->relay.shutdown();
    EXPECT_EQ(stack->buffer.stats().memoryCount, 0U);
    EXPECT_EQ(stack->buffer.stats().diskCount, 5U);
    restart();
    EXPECT_EQ(stack->buffer.count(), 5U);
}

TEST_F(RelayTest, ShutdownKeepsToGraceWithSlowSink) {
    config.sendTimeout = std::chrono::seconds{1};
    restart();
    sink->slowDown(std::chrono::milliseconds{300});
    stack->relay.start();
    enqueue(0, 30);
    ASSERT_TRUE(waitFor([this] { return sink->callCount() >= 1; }, std::chrono::seconds{2}));
    const auto start = std::chrono::steady_clock::now();
    stack->relay.shutdown(std::chrono::milliseconds{500});
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds{1500});
    const auto delivered = sink->payloads().size();
    EXPECT_LT(delivered, 30U);
    EXPECT_EQ(stack->buffer.stats().memoryCount, 0U);
    restart();
    EXPECT_EQ(stack->buffer.count(), 30U - delivered);
}

TEST_F(RelayTest, BreakerOutlivingRelayIsSafe) {
    InMemoryPersister persister;
    CircuitBreaker breaker {config.failureThreshold, config.resetTimeout, persister};
    int transitions = 0;
    breaker.onTransition([&transitions](CircuitState, CircuitState) { ++transitions; });
    {
        DurableBuffer buffer {tmp.path() / "outlived", config.memoryCapacity, config.diskCapacityBytes};
        Transmitter transmitter {breaker, sink, config.sendTimeout};
        ReplayCoordinator coordinator {buffer, transmitter, breaker, config.batchSize, config.replayPause};
        Relay relay {breaker, buffer, transmitter, coordinator, config};
        relay.start();
    }
    for (uint32_t i = 0; i < config.failureThreshold; ++i) {
        breaker.recordFailure();
    }
    breaker.reset();
    EXPECT_EQ(breaker.currentState(), CircuitState::Closed);
    EXPECT_EQ(transitions, 2);
}

TEST_F(RelayTest, StartReplaysBacklogFromPreviousRun) {
    sink->set(FakeSink::Mode::Down);
    enqueue(0, 23);
    restart();
    EXPECT_EQ(stack->buffer.count(), 23U);
    sink->set(FakeSink::Mode::Up);
    stack->relay.start();
    ASSERT_TRUE(waitFor([this] { return stack->buffer.count() == 0; }, std::chrono::seconds{5}));
    EXPECT_EQ(sink->payloads(), numbered("r", 0, 23));
}

TEST_F(RelayTest, StatusReportsAllComponents) {
    stack->relay.start();
    enqueue(0, 3);
    ASSERT_TRUE(waitFor([this] { return stack->buffer.count() == 0; }, std::chrono::seconds{2}));
    const auto s = stack->relay.status();
    EXPECT_GE(s.uptimeMs, 0);
    EXPECT_EQ(s.circuit.state, CircuitState::Closed);
    EXPECT_EQ(s.failureThreshold, 2U);
    EXPECT_EQ(s.resetTimeout, std::chrono::milliseconds{200});
    EXPECT_EQ(s.buffer.memoryCount, 0U);
    EXPECT_EQ(s.transmitter.sent, 3U);
}

TEST_F(RelayTest, ShutdownIsIdempotent) {
    stack->relay.start();
    stack->relay.shutdown();
    stack->relay.shutdown();
    stack->relay.enqueue("late");
    EXPECT_EQ(stack->buffer.count(), 1U);
}
