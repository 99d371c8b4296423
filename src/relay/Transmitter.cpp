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
#include "relay/Transmitter.hpp"
#include "common/Error.hpp"
#include "common/ErrorConverter.hpp"
#include <spdlog/spdlog.h>
#include <grpcpp/support/status.h>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace spool {

namespace {

constexpr std::chrono::seconds senderGrace {1};

} // namespace

Transmitter::Transmitter(CircuitBreaker& b, std::shared_ptr<Sink> s, std::chrono::milliseconds sendTimeout)
    : breaker{b},
      sink{std::move(s)},
      timeout{sendTimeout},
      senders{std::make_shared<Senders>()} {}

Transmitter::~Transmitter() {
    std::unique_lock lock{senders->m};
    if (!senders->idle.wait_for(lock, timeout + senderGrace, [this] { return senders->running == 0; })) {
        spdlog::warn("Transmitter: {} Sink calls still running at shutdown", senders->running);
    }
}

grpc::Status Transmitter::call(const TelemetryRecord& record) {
    const auto deadline = std::chrono::system_clock::now() + timeout;
    auto promise = std::make_shared<std::promise<grpc::Status>>();
    auto future = promise->get_future();
    {
        std::lock_guard lock{senders->m};
        ++senders->running;
    }
    // The worker owns copies of everything it touches so it can outlive a
    // call that has already timed out. The destructor waits on running.
    try {
        std::thread([s = sink, record, deadline, promise, state = senders] {
            try {
                promise->set_value(s->deliver(record, deadline));
            } catch (const std::exception& e) {
                promise->set_value(grpc::Status(grpc::StatusCode::INTERNAL, e.what()));
            }
            {
                std::lock_guard lock{state->m};
                --state->running;
            }
            state->idle.notify_all();
        }).detach();
    } catch (const std::system_error& e) {
        {
            std::lock_guard lock{senders->m};
            --senders->running;
        }
        return toGrpcStatus(Error{ErrorCode::Internal, std::string{"cannot start sender thread: "} + e.what()});
    }
    if (future.wait_until(deadline) == std::future_status::timeout) {
        return toGrpcStatus(Error{ErrorCode::Timeout, "Sink did not answer within " + std::to_string(timeout.count()) + "ms"});
    }
    return future.get();
}

bool Transmitter::trySend(const TelemetryRecord& record) {
    if (!breaker.isAvailable()) {
        std::lock_guard lock{m};
        ++counters.rejected;
        spdlog::debug("Transmitter: circuit open, send skipped");
        return false;
    }
    // isAvailable may have taken the half-open trial, so every path below
    // must record an outcome.
    grpc::Status status;
    try {
        status = call(record);
    } catch (const std::exception& e) {
        status = toGrpcStatus(Error{ErrorCode::Internal, e.what()});
    }
    if (status.ok()) {
        breaker.recordSuccess();
        std::lock_guard lock{m};
        ++counters.sent;
        return true;
    }
    breaker.recordFailure();
    const auto error = toError(status);
    spdlog::warn("Transmitter: send failed: {} {}", toString(error.code), error.what);
    std::lock_guard lock{m};
    ++counters.failed;
    if (error.code == ErrorCode::Timeout) {
        ++counters.timeouts;
    }
    counters.lastError = toString(error.code) + ": " + error.what;
    return false;
}

std::size_t Transmitter::transmit(const std::vector<BufferEntry>& entries, const std::function<bool()>& cancelled) {
    std::size_t delivered = 0;
    for (const auto& e : entries) {
        if (cancelled && cancelled()) {
            break;
        }
        if (!trySend(e.record)) {
            break;
        }
        ++delivered;
    }
    return delivered;
}

TransmitterStats Transmitter::stats() {
    std::lock_guard lock{m};
    return counters;
}

} // namespace spool
