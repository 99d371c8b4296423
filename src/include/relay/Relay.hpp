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
#ifndef SPOOL_RELAY_RELAY_HPP
#define SPOOL_RELAY_RELAY_HPP

#include "common/AsyncTimer.hpp"
#include "common/CircuitBreaker.hpp"
#include "common/Config.hpp"
#include "common/Types.hpp"
#include "relay/ReplayCoordinator.hpp"
#include "relay/Transmitter.hpp"
#include "storage/DurableBuffer.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace spool {

struct RelayStatus {
    int64_t uptimeMs = 0;
    CircuitSnapshot circuit;
    uint32_t failureThreshold = 0;
    std::chrono::milliseconds resetTimeout{0};
    BufferStats buffer;
    ReplayStatus replay;
    TransmitterStats transmitter;
};

// Producer-facing side of the relay. Accepts records into the buffer and
// keeps a background drain going: on a timer, early while the buffer is
// nearly empty, and as a full replay whenever the breaker closes.
class Relay {
public:
    Relay(CircuitBreaker& breaker, DurableBuffer& buffer, Transmitter& transmitter,
          ReplayCoordinator& coordinator, const Config& config);
    Relay(const Relay&) = delete;
    Relay& operator=(const Relay&) = delete;
    ~Relay();

    void start();
    void enqueue(std::string payload, RecordMetadata metadata = {}) noexcept;
    [[nodiscard]] RelayStatus status();
    // Stops background work, writes the memory tier to disk and detaches from
    // the breaker. Idempotent; also run by the destructor.
    void shutdown();
    void shutdown(std::chrono::milliseconds grace);
private:
    CircuitBreaker& breaker;
    DurableBuffer& buffer;
    Transmitter& transmitter;
    ReplayCoordinator& coordinator;
    const std::chrono::milliseconds interval;
    const std::size_t eagerThreshold;
    const std::chrono::milliseconds shutdownGrace;
    const int64_t startedAt;
    std::atomic<bool> started {false};
    std::atomic<bool> stopped {false};
    std::optional<CircuitBreaker::ListenerId> listener;
    AsyncTimer timer;
};

} // namespace spool

#endif // SPOOL_RELAY_RELAY_HPP
