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
#ifndef SPOOL_RELAY_TRANSMITTER_HPP
#define SPOOL_RELAY_TRANSMITTER_HPP

#include "client/Sink.hpp"
#include "common/CircuitBreaker.hpp"
#include "common/Types.hpp"
#include <grpcpp/support/status.h>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace spool {

struct TransmitterStats {
    uint64_t sent = 0;
    uint64_t failed = 0;
    uint64_t rejected = 0;
    uint64_t timeouts = 0;
    std::string lastError;
};

class Transmitter {
public:
    Transmitter(CircuitBreaker& breaker, std::shared_ptr<Sink> sink, std::chrono::milliseconds sendTimeout);
    Transmitter(const Transmitter&) = delete;
    Transmitter& operator=(const Transmitter&) = delete;
    // Waits, bounded by sendTimeout plus a grace period, for Sink calls that
    // outlived their deadline.
    ~Transmitter();

    // False without any I/O when the breaker refuses the call. Otherwise the
    // Sink call is bounded by sendTimeout and its outcome recorded in the breaker.
    [[nodiscard]] bool trySend(const TelemetryRecord& record);
    // Sends entries in order and stops at the first failure, or before the
    // next send once cancelled returns true. Returns how many leading entries
    // were delivered.
    std::size_t transmit(const std::vector<BufferEntry>& entries, const std::function<bool()>& cancelled = {});
    [[nodiscard]] TransmitterStats stats();
private:
    // Sender threads share this with the Transmitter, so it outlives both.
    struct Senders {
        std::mutex m;
        std::condition_variable idle;
        std::size_t running = 0;
    };

    grpc::Status call(const TelemetryRecord& record);

    CircuitBreaker& breaker;
    std::shared_ptr<Sink> sink;
    const std::chrono::milliseconds timeout;
    std::shared_ptr<Senders> senders;
    std::mutex m;
    TransmitterStats counters;
};

} // namespace spool

#endif // SPOOL_RELAY_TRANSMITTER_HPP
