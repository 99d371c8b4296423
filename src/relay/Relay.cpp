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
#include "relay/Relay.hpp"
#include "common/Util.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <exception>
#include <string>
#include <utility>

namespace spool {

Relay::Relay(CircuitBreaker& b, DurableBuffer& buf, Transmitter& t, ReplayCoordinator& c, const Config& config)
    : breaker{b},
      buffer{buf},
      transmitter{t},
      coordinator{c},
      interval{config.flushInterval},
      eagerThreshold{config.eagerSendThreshold},
      shutdownGrace{config.shutdownGrace},
      startedAt{nowMillis()} {}

Relay::~Relay() {
    shutdown();
}

void Relay::start() {
    if (started.exchange(true)) {
        return;
    }
    listener = breaker.onTransition([this](CircuitState from, CircuitState to) {
        if (to == CircuitState::Closed && from != CircuitState::Closed && !stopped) {
            spdlog::info("Relay: circuit closed, replaying buffered records");
            coordinator.trigger();
        }
    });
    if (buffer.hasDiskBacklog()) {
        spdlog::info("Relay: found {} buffered records from a previous run", buffer.count());
        coordinator.trigger();
    }
    timer.start([this] { return interval; }, [this] {
        if (buffer.count() > 0) {
            coordinator.drainOnce();
        }
    });
}

void Relay::enqueue(std::string payload, RecordMetadata metadata) noexcept {
    try {
        const auto ts = metadata.timestamp != 0 ? metadata.timestamp : nowMillis();
        buffer.enqueue(TelemetryRecord{std::move(payload), std::move(metadata.correlationId), ts});
        if (buffer.count() <= eagerThreshold && !breaker.isOpen()) {
            timer.poke();
        }
    } catch (const std::exception& e) {
        spdlog::error("Relay: failed to accept record: {}", e.what());
    }
}

RelayStatus Relay::status() {
    RelayStatus s;
    s.uptimeMs = nowMillis() - startedAt;
    s.circuit = breaker.snapshot();
    s.failureThreshold = breaker.failureThreshold();
    s.resetTimeout = breaker.resetTimeout();
    s.buffer = buffer.stats();
    s.replay = coordinator.status();
    s.transmitter = transmitter.stats();
    return s;
}

void Relay::shutdown() {
    shutdown(shutdownGrace);
}

void Relay::shutdown(std::chrono::milliseconds grace) {
    if (stopped.exchange(true)) {
        return;
    }
    spdlog::info("Relay: shutting down");
    const auto deadline = std::chrono::steady_clock::now() + grace;
    if (!coordinator.stop(deadline)) {
        spdlog::warn("Relay: replay did not finish within {}ms", grace.count());
    }
    // Save the memory tier before waiting on the timer, whose callback may
    // still be finishing a send.
    buffer.flushToDisk();
    timer.stop();
    buffer.flushToDisk();
    if (listener) {
        breaker.removeTransitionListener(*listener);
        listener.reset();
    }
    spdlog::info("Relay: shutdown complete, {} records buffered", buffer.count());
}

} // namespace spool
