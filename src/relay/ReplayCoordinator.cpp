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
#include "relay/ReplayCoordinator.hpp"
#include "common/Util.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

namespace spool {

ReplayCoordinator::ReplayCoordinator(DurableBuffer& b, Transmitter& t, CircuitBreaker& cb,
                                     std::size_t size, std::chrono::milliseconds pauseBetweenBatches)
    : buffer{b},
      transmitter{t},
      breaker{cb},
      batchSize{size},
      batchPause{pauseBetweenBatches} {}

ReplayCoordinator::~ReplayCoordinator() {
    stop();
}

bool ReplayCoordinator::tryBegin() {
    bool expected = false;
    return active.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
}

void ReplayCoordinator::end() {
    {
        std::lock_guard lock{m};
        active.store(false, std::memory_order_release);
    }
    cv.notify_all();
}

bool ReplayCoordinator::pause() {
    std::unique_lock lock{m};
    return !cv.wait_for(lock, batchPause, [this] { return stopping.load(); });
}

void ReplayCoordinator::run() {
    {
        std::lock_guard lock{m};
        last = ReplayStatus{};
        last.isReplaying = true;
        last.started = nowMillis();
    }
    replaying = true;
    spdlog::info("ReplayCoordinator: starting replay of {} buffered records", buffer.count());
    uint64_t processed = 0;
    uint64_t errors = 0;
    bool interrupted = false;
    std::size_t batches = 0;
    while (!stopping) {
        if (breaker.isOpen()) {
            spdlog::info("ReplayCoordinator: circuit open, stopping replay");
            interrupted = true;
            break;
        }
        auto batch = buffer.drain(batchSize);
        if (batch.empty()) {
            break;
        }
        ++batches;
        spdlog::debug("ReplayCoordinator: processing batch {} ({} records)", batches, batch.size());
        std::vector<SequenceId> delivered;
        bool failed = false;
        for (const auto& e : batch) {
            if (stopping) {
                break;
            }
            if (breaker.isOpen()) {
                spdlog::info("ReplayCoordinator: circuit opened mid-batch, stopping replay");
                interrupted = true;
                break;
            }
            if (!transmitter.trySend(e.record)) {
                ++errors;
                failed = true;
                break;
            }
            delivered.push_back(e.id);
            ++processed;
        }
        buffer.acknowledge(delivered);
        {
            std::lock_guard lock{m};
            last.processed = processed;
            last.errors = errors;
        }
        if (failed) {
            interrupted = interrupted || breaker.isOpen();
            break;
        }
        if (interrupted) {
            break;
        }
        if (batch.size() == batchSize && !pause()) {
            break;
        }
    }
    int64_t elapsed = 0;
    {
        std::lock_guard lock{m};
        last.isReplaying = false;
        last.processed = processed;
        last.errors = errors;
        last.interrupted = interrupted;
        last.completed = nowMillis();
        elapsed = last.completed - last.started;
    }
    replaying = false;
    spdlog::info("ReplayCoordinator: replay complete: {} processed, {} errors, {}ms{}",
                 processed, errors, elapsed, interrupted ? " (interrupted)" : "");
}

bool ReplayCoordinator::replay() {
    if (!tryBegin()) {
        spdlog::debug("ReplayCoordinator: drain already in progress, replay skipped");
        return false;
    }
    run();
    end();
    return true;
}

void ReplayCoordinator::trigger() {
    if (stopping || !tryBegin()) {
        return;
    }
    std::lock_guard lock{workerMutex};
    if (worker.joinable()) {
        if (worker.get_id() == std::this_thread::get_id()) {
            worker.detach();
        } else {
            worker.join();
        }
    }
    worker = std::thread([this] {
        run();
        end();
    });
}

std::size_t ReplayCoordinator::drainOnce() {
    if (stopping || !tryBegin()) {
        return 0;
    }
    std::size_t delivered = 0;
    if (!breaker.isOpen()) {
        auto batch = buffer.drain(batchSize);
        delivered = transmitter.transmit(batch, [this] { return stopping.load(); });
        std::vector<SequenceId> ids;
        ids.reserve(delivered);
        for (std::size_t i = 0; i < delivered; ++i) {
            ids.push_back(batch[i].id);
        }
        buffer.acknowledge(ids);
        if (delivered > 0) {
            spdlog::debug("ReplayCoordinator: delivered {} of {} records", delivered, batch.size());
        }
    }
    end();
    // A full batch went through, so there is likely more waiting.
    if (delivered == batchSize && buffer.count() > 0) {
        trigger();
    }
    return delivered;
}

bool ReplayCoordinator::stop(std::chrono::steady_clock::time_point deadline) {
    {
        std::lock_guard lock{m};
        stopping = true;
    }
    cv.notify_all();
    const bool idle = waitIdle(deadline);
    if (!idle) {
        spdlog::warn("ReplayCoordinator: drain still running at shutdown deadline");
    }
    std::lock_guard lock{workerMutex};
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
        worker.join();
    }
    return idle;
}

bool ReplayCoordinator::waitIdle(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock lock{m};
    if (deadline == std::chrono::steady_clock::time_point::max()) {
        cv.wait(lock, [this] { return !active.load(); });
        return true;
    }
    return cv.wait_until(lock, deadline, [this] { return !active.load(); });
}

bool ReplayCoordinator::isReplaying() const {
    return replaying.load();
}

ReplayStatus ReplayCoordinator::status() {
    std::lock_guard lock{m};
    auto s = last;
    s.isReplaying = replaying.load();
    return s;
}

} // namespace spool
