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
#ifndef SPOOL_RELAY_REPLAY_COORDINATOR_HPP
#define SPOOL_RELAY_REPLAY_COORDINATOR_HPP

#include "common/CircuitBreaker.hpp"
#include "relay/Transmitter.hpp"
#include "storage/DurableBuffer.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <thread>

namespace spool {

struct ReplayStatus {
    bool isReplaying = false;
    uint64_t processed = 0;
    uint64_t errors = 0;
    bool interrupted = false;
    int64_t started = 0;
    int64_t completed = 0;
};

/**
 * Drains the DurableBuffer through the Transmitter in FIFO batches.
 *
 * Only one drain runs at a time: replay(), trigger() and drainOnce() all
 * compete for the same flag and return immediately when it is taken. A run
 * stops as soon as the breaker is open or a send fails; whatever was not
 * delivered stays buffered.
 */
class ReplayCoordinator {
public:
    ReplayCoordinator(DurableBuffer& buffer, Transmitter& transmitter, CircuitBreaker& breaker,
                      std::size_t batchSize, std::chrono::milliseconds batchPause);
    ReplayCoordinator(const ReplayCoordinator&) = delete;
    ReplayCoordinator& operator=(const ReplayCoordinator&) = delete;
    ~ReplayCoordinator();

    // Runs a full replay on the calling thread. Returns false if another
    // drain was already active.
    bool replay();
    // Starts a full replay on the coordinator's worker thread.
    void trigger();
    // Sends at most one batch. Returns the number of records delivered.
    std::size_t drainOnce();
    // Asks an active run to stop and waits for the worker. Returns false if
    // the run was still going at the deadline. The worker is joined either
    // way; a run notices the stop request after its current send.
    bool stop(std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max());
    // Waits until no drain is active or the deadline passes.
    bool waitIdle(std::chrono::steady_clock::time_point deadline);

    [[nodiscard]] bool isReplaying() const;
    [[nodiscard]] ReplayStatus status();
private:
    bool tryBegin();
    void end();
    void run();
    bool pause();

    DurableBuffer& buffer;
    Transmitter& transmitter;
    CircuitBreaker& breaker;
    const std::size_t batchSize;
    const std::chrono::milliseconds batchPause;

    std::atomic<bool> active {false};
    std::atomic<bool> replaying {false};
    std::atomic<bool> stopping {false};
    std::mutex m;
    std::condition_variable cv;
    ReplayStatus last;
    std::mutex workerMutex;
    std::thread worker;
};

} // namespace spool

#endif // SPOOL_RELAY_REPLAY_COORDINATOR_HPP
