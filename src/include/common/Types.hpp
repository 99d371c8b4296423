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
#ifndef SPOOL_COMMON_TYPES_HPP
#define SPOOL_COMMON_TYPES_HPP

#include <string>
#include <optional>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <ostream>
#include <utility>
#include <nlohmann/json.hpp>

namespace spool {

struct RecordMetadata {
    std::optional<std::string> correlationId;
    int64_t timestamp = 0;
};

struct TelemetryRecord {
    std::string payload;
    std::optional<std::string> correlationId;
    int64_t enqueuedAt = 0;

    TelemetryRecord() = default;
    TelemetryRecord(std::string p, std::optional<std::string> c, int64_t t)
        : payload(std::move(p)), correlationId(std::move(c)), enqueuedAt(t) {}

    bool operator==(const TelemetryRecord& other) const = default;
};

enum class StorageTier : char {
    Memory,
    Disk
};

std::string toString(StorageTier tier);

using SequenceId = uint64_t;

struct BufferEntry {
    SequenceId id = 0;
    StorageTier tier = StorageTier::Memory;
    TelemetryRecord record;

    // Approximate in-memory footprint, used against the byte ceiling.
    [[nodiscard]] std::size_t footprint() const;
};

void to_json(nlohmann::json& j, const BufferEntry& entry);
void from_json(const nlohmann::json& j, BufferEntry& entry);

struct BufferStats {
    std::size_t memoryCount = 0;
    std::size_t diskCount = 0;
    std::size_t diskFileCount = 0;
    std::size_t totalBytes = 0;
    uint64_t evicted = 0;
    uint64_t dropped = 0;
    std::string lastError;
};

enum class CircuitState : char {
    Closed,
    Open,
    HalfOpen
};

std::string toString(CircuitState state);
std::optional<CircuitState> parseCircuitState(const std::string& s);
std::ostream& operator<<(std::ostream& os, CircuitState state);

// The persisted state document of a circuit breaker.
struct CircuitSnapshot {
    CircuitState state = CircuitState::Closed;
    uint32_t failureCount = 0;
    int64_t lastStateChangeTime = 0;

    bool operator==(const CircuitSnapshot& other) const = default;
};

void to_json(nlohmann::json& j, const CircuitSnapshot& snapshot);
void from_json(const nlohmann::json& j, CircuitSnapshot& snapshot);

} // namespace spool

#endif // SPOOL_COMMON_TYPES_HPP
