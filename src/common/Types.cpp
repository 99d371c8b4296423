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
#include "common/Types.hpp"
#include "common/Util.hpp"
#include <string>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace spool {

namespace {
// Sequence id, tier tag, timestamp and container overhead.
constexpr std::size_t entryOverhead = 64;
} // namespace

std::string toString(StorageTier tier) {
    return tier == StorageTier::Memory ? "memory" : "disk";
}

std::size_t BufferEntry::footprint() const {
    return record.payload.size() + record.correlationId.value_or("").size() + entryOverhead;
}

void to_json(nlohmann::json& j, const BufferEntry& entry) {
    j = nlohmann::json{
        {"seq", entry.id},
        {"payload", base64Encode(entry.record.payload)},
        {"enqueuedAt", entry.record.enqueuedAt}
    };
    if (entry.record.correlationId.has_value()) {
        j["correlationId"] = entry.record.correlationId.value();
    }
}

void from_json(const nlohmann::json& j, BufferEntry& entry) {
    entry.id = j.at("seq").get<SequenceId>();
    auto payload = base64Decode(j.at("payload").get<std::string>());
    if (!payload.has_value()) {
        throw std::invalid_argument("BufferEntry: payload is not valid base64");
    }
    entry.record.payload = std::move(payload.value());
    entry.record.enqueuedAt = j.at("enqueuedAt").get<int64_t>();
    if (auto it = j.find("correlationId"); it != j.end() && it->is_string()) {
        entry.record.correlationId = it->get<std::string>();
    } else {
        entry.record.correlationId.reset();
    }
    entry.tier = StorageTier::Disk;
}

std::string toString(CircuitState state) {
    switch (state) {
        case CircuitState::Closed: return "CLOSED";
        case CircuitState::Open: return "OPEN";
        case CircuitState::HalfOpen: return "HALF_OPEN";
    }
    return "CLOSED";
}

std::optional<CircuitState> parseCircuitState(const std::string& s) {
    if (s == "CLOSED") {
        return CircuitState::Closed;
    }
    if (s == "OPEN") {
        return CircuitState::Open;
    }
    if (s == "HALF_OPEN") {
        return CircuitState::HalfOpen;
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, CircuitState state) {
    os << toString(state);
    return os;
}

void to_json(nlohmann::json& j, const CircuitSnapshot& snapshot) {
    j = nlohmann::json{
        {"state", toString(snapshot.state)},
        {"failureCount", snapshot.failureCount},
        {"lastStateChangeTime", snapshot.lastStateChangeTime}
    };
}

void from_json(const nlohmann::json& j, CircuitSnapshot& snapshot) {
    auto state = parseCircuitState(j.at("state").get<std::string>());
    if (!state.has_value()) {
        throw std::invalid_argument("CircuitSnapshot: unknown state " + j.at("state").dump());
    }
    snapshot.state = state.value();
    snapshot.failureCount = j.at("failureCount").get<uint32_t>();
    snapshot.lastStateChangeTime = j.at("lastStateChangeTime").get<int64_t>();
}

} // namespace spool
