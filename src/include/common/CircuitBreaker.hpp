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
#ifndef SPOOL_COMMON_CIRCUIT_BREAKER_HPP
#define SPOOL_COMMON_CIRCUIT_BREAKER_HPP

#include "common/Types.hpp"
#include "storage/Persister.hpp"
#include <functional>
#include <optional>
#include <utility>
#include <vector>
#include <chrono>
#include <cstdint>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace spool {

/**
 * Consecutive-failure circuit breaker guarding calls to a Sink.
 *
 * Closed lets calls through and opens after failureThreshold consecutive
 * failures. Open rejects calls until resetTimeout has elapsed since it was
 * entered, then becomes HalfOpen. HalfOpen admits exactly one trial call:
 * its success closes the breaker, its failure reopens it for another full
 * resetTimeout.
 *
 * Every state change is written through the Persister. No member throws.
 */
class CircuitBreaker {
public:
    using State = CircuitState;
    using TransitionListener = std::function<void(State from, State to)>;
    using ListenerId = uint64_t;

    CircuitBreaker(uint32_t failureThreshold, std::chrono::milliseconds resetTimeout, Persister& persister);
    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    void recordSuccess() noexcept;
    void recordFailure() noexcept;
    // Admission check for a call. In HalfOpen the first caller takes the
    // trial slot; everyone else is refused until the trial is recorded.
    [[nodiscard]] bool isAvailable() noexcept;
    // True while Open and inside the cool-down. Does not take the trial slot.
    [[nodiscard]] bool isOpen() noexcept;
    [[nodiscard]] State currentState() noexcept;
    [[nodiscard]] CircuitSnapshot snapshot() noexcept;
    // Operator override back to Closed.
    void reset() noexcept;
    // Listeners run on the thread that caused the transition, after the
    // breaker lock has been released.
    ListenerId onTransition(TransitionListener listener);
    // Once this returns the listener is not running on another thread and
    // will not be called again. Unknown ids are ignored.
    void removeTransitionListener(ListenerId id);

    [[nodiscard]] uint32_t failureThreshold() const noexcept;
    [[nodiscard]] std::chrono::milliseconds resetTimeout() const noexcept;
private:
    using Transition = std::optional<std::pair<State, State>>;

    Transition advanceLocked();
    Transition moveToLocked(State to);
    void persistLocked() noexcept;
    void notify(const Transition& t) noexcept;

    std::mutex m;
    const uint32_t threshold;
    const std::chrono::milliseconds cooldown;
    Persister& persister;
    CircuitSnapshot current;
    bool trialInFlight {false};
    std::vector<std::pair<ListenerId, TransitionListener>> listeners;
    ListenerId nextListenerId {1};
    // Threads currently inside notify, one entry per call.
    std::vector<std::thread::id> notifying;
    std::condition_variable notified;
};

} // namespace spool

#endif // SPOOL_COMMON_CIRCUIT_BREAKER_HPP
