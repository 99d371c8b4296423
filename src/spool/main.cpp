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
#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <ctime>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <signal.h>
#include <spdlog/spdlog.h>
#include "client/GrpcSink.hpp"
#include "common/CircuitBreaker.hpp"
#include "common/Config.hpp"
#include "common/Logging.hpp"
#include "relay/Relay.hpp"
#include "relay/ReplayCoordinator.hpp"
#include "relay/Transmitter.hpp"
#include "server/SpoolServer.hpp"
#include "server/SpoolServiceImpl.hpp"
#include "storage/DurableBuffer.hpp"
#include "storage/FilePersister.hpp"

using spool::CircuitBreaker;
using spool::Config;
using spool::DurableBuffer;
using spool::FilePersister;
using spool::GrpcSink;
using spool::Relay;
using spool::ReplayCoordinator;
using spool::SpoolServer;
using spool::SpoolServiceImpl;
using spool::Transmitter;

namespace {

void logStats(Relay& relay) {
    const auto s = relay.status();
    spdlog::info("stats: circuit={} failures={} memory={} disk={} files={} bytes={} evicted={} dropped={} sent={} failed={} replaying={}",
                 spool::toString(s.circuit.state), s.circuit.failureCount,
                 s.buffer.memoryCount, s.buffer.diskCount, s.buffer.diskFileCount, s.buffer.totalBytes,
                 s.buffer.evicted, s.buffer.dropped, s.transmitter.sent, s.transmitter.failed,
                 s.replay.isReplaying);
}

// Blocks until SIGINT or SIGTERM arrives, logging stats every interval.
int waitForSignal(const sigset_t& signals, std::chrono::milliseconds interval, Relay& relay) {
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(interval);
    const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(interval - secs);
    const timespec timeout {static_cast<time_t>(secs.count()), static_cast<long>(nanos.count())};
    while (true) {
        const int sig = sigtimedwait(&signals, nullptr, &timeout);
        if (sig == SIGINT || sig == SIGTERM) {
            return sig;
        }
        if (sig < 0 && errno != EAGAIN && errno != EINTR) {
            spdlog::error("sigtimedwait failed: {}", std::strerror(errno));
            return SIGTERM;
        }
        if (sig < 0 && errno == EAGAIN) {
            logStats(relay);
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [config.json]" << '\n';
        return 1;
    }
    std::optional<std::string> configPath;
    if (argc == 2) {
        configPath = argv[1];
    }

    Config config;
    try {
        config = spool::loadConfig(configPath);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid configuration: " << e.what() << '\n';
        return 1;
    }
    // Signals are consumed by sigtimedwait below; every thread started from
    // here on, the logger's included, inherits the blocked mask.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    spool::installLogger(spool::LogOptions{config.logPath});
    spdlog::info("Spool! Starting...");

    int rc = 0;
    try {
        FilePersister persister {config.statePath};
        CircuitBreaker breaker {config.failureThreshold, config.resetTimeout, persister};
        DurableBuffer buffer {config.bufferPath, config.memoryCapacity, config.diskCapacityBytes};
        auto sink = std::make_shared<GrpcSink>(config.sinkAddress, config.sinkToken);
        Transmitter transmitter {breaker, sink, config.sendTimeout};
        ReplayCoordinator coordinator {buffer, transmitter, breaker, config.batchSize, config.replayPause};
        Relay relay {breaker, buffer, transmitter, coordinator, config};
        SpoolServiceImpl service {relay, breaker};
        SpoolServer server {config.listenAddress, {&service}};
        relay.start();
        spdlog::info("Relaying to {}, buffering in {}", config.sinkAddress, config.bufferPath);

        const int sig = waitForSignal(signals, config.statsInterval, relay);
        spdlog::info("Received signal {}, shutting down", sig);
        server.shutdown();
        relay.shutdown();
        logStats(relay);
    } catch (const std::exception& e) {
        spdlog::error("Spool failed: {}", e.what());
        rc = 1;
    }
    spdlog::shutdown();
    return rc;
}
