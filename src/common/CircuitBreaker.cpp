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
#include "common/CircuitBreaker.hpp"
#include "common/Util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <functional>
#include <chrono>
#include <thread>
#include <exception>
#include <mutex>
#include <utility>
#include <vector>

namespace spool {

CircuitBreaker::CircuitBreaker(uint32_t failureThreshold, std::chrono::milliseconds resetTimeout, Persister& p)
    : threshold{failureThreshold},
      cooldown{resetTimeout},
      persister{p},
      current{CircuitState::Closed, 0, nowMillis()} {
    std::optional<CircuitSnapshot> restored;
    try {
        restored = persister.load();
    } catch (const std::exception& e) {
        spdlog::warn("CircuitBreaker: failed to load persisted state ({}), starting Closed", e.what());
    }
    if (!restored.has_value()) {
        return;
    }
    std::lock_guard lock{m};
    current = restored.value();
    if (current.state == State::Open &&
        nowMillis() - current.lastStateChangeTime >= cooldown.count()) {
        spdlog::info("CircuitBreaker: persisted Open state outlived its cool-down, resuming HalfOpen");
        current.state = State::HalfOpen;
        current.lastStateChangeTime = nowMillis();
        persistLocked();
    } else {
        spdlog::info("CircuitBreaker: restored state {} with {} failures", toString(current.state), current.failureCount);
    }
}

CircuitBreaker::Transition CircuitBreaker::moveToLocked(State to) {
    const auto from = current.state;
    current.state = to;
    current.lastStateChangeTime = nowMillis();
    trialInFlight = false;
    persistLocked();
    spdlog::info("CircuitBreaker: {} -> {} (failures: {})", toString(from), toString(to), current.failureCount);
    return std::make_pair(from, to);
}

CircuitBreaker::Transition CircuitBreaker::advanceLocked() {
    if (current.state == State::Open &&
        nowMillis() - current.lastStateChangeTime >= cooldown.count()) {
        return moveToLocked(State::HalfOpen);
    }
    return std::nullopt;
}

void CircuitBreaker::persistLocked() noexcept {
    try {
        persister.save(current);
    } catch (const std::exception& e) {
        spdlog::error("CircuitBreaker: failed to persist state {}: {}", toString(current.state), e.what());
    }
}

void CircuitBreaker::notify(const Transition& t) noexcept {
    if (!t.has_value()) {
        return;
    }
    const auto self = std::this_thread::get_id();
    std::vector<std::pair<ListenerId, TransitionListener>> ls;
    {
        std::lock_guard lock{m};
        ls = listeners;
        notifying.push_back(self);
    }
    for (const auto& [id, l] : ls) {
        try {
            l(t->first, t->second);
        } catch (const std::exception& e) {
            spdlog::error("CircuitBreaker: transition listener {} failed: {}", id, e.what());
        }
    }
    {
        std::lock_guard lock{m};
        notifying.erase(std::find(notifying.begin(), notifying.end(), self));
    }
    notified.notify_all();
}

void CircuitBreaker::recordSuccess() noexcept {
    Transition t;
    {
        std::lock_guard lock{m};
        switch (current.state) {
            case State::HalfOpen:
                current.failureCount = 0;
                t = moveToLocked(State::Closed);
                break;
            case State::Closed:
                if (current.failureCount > 0) {
                    current.failureCount = 0;
                    persistLocked();
                }
                break;
            case State::Open:
                spdlog::debug("CircuitBreaker: late success ignored while Open");
                break;
        }
    }
    notify(t);
}

void CircuitBreaker::recordFailure() noexcept {
    Transition t;
    {
        std::lock_guard lock{m};
        ++current.failureCount;
        switch (current.state) {
            case State::HalfOpen:
                t = moveToLocked(State::Open);
                break;
            case State::Closed:
                if (current.failureCount >= threshold) {
                    t = moveToLocked(State::Open);
                } else {
                    persistLocked();
                }
                break;
            case State::Open:
                persistLocked();
                break;
        }
    }
    notify(t);
}

bool CircuitBreaker::isAvailable() noexcept {
    Transition t;
    bool available = false;
    {
        std::lock_guard lock{m};
        t = advanceLocked();
        switch (current.state) {
            case State::Closed:
                available = true;
                break;
            case State::Open:
                available = false;
                break;
            case State::HalfOpen:
                available = !trialInFlight;
                trialInFlight = true;
                break;
        }
    }
    notify(t);
    return available;
}

bool CircuitBreaker::isOpen() noexcept {
    Transition t;
    bool open = false;
    {
        std::lock_guard lock{m};
        t = advanceLocked();
        open = current.state == State::Open;
    }
    notify(t);
    return open;
}

CircuitBreaker::State CircuitBreaker::currentState() noexcept {
    return snapshot().state;
}

CircuitSnapshot CircuitBreaker::snapshot() noexcept {
    Transition t;
    CircuitSnapshot s;
    {
        std::lock_guard lock{m};
        t = advanceLocked();
        s = current;
    }
    notify(t);
    return s;
}

void CircuitBreaker::reset() noexcept {
    Transition t;
    {
        std::lock_guard lock{m};
        current.failureCount = 0;
        if (current.state != State::Closed) {
            t = moveToLocked(State::Closed);
        } else {
            persistLocked();
        }
    }
    spdlog::info("CircuitBreaker: manually reset");
    notify(t);
}

CircuitBreaker::ListenerId CircuitBreaker::onTransition(TransitionListener listener) {
    std::lock_guard lock{m};
    const auto id = nextListenerId++;
    listeners.emplace_back(id, std::move(listener));
    return id;
}

void CircuitBreaker::removeTransitionListener(ListenerId id) {
    std::unique_lock lock{m};
    std::erase_if(listeners, [id](const auto& entry) { return entry.first == id; });
    // A listener removing itself must not wait for its own notify.
    const auto self = std::this_thread::get_id();
    notified.wait(lock, [this, self] {
        return std::all_of(notifying.begin(), notifying.end(), [self](std::thread::id t) { return t == self; });
    });
}

uint32_t CircuitBreaker::failureThreshold() const noexcept {
    return threshold;
}

std::chrono::milliseconds CircuitBreaker::resetTimeout() const noexcept {
    return cooldown;
}

} // namespace spool
