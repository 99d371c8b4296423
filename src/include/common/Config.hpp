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
#ifndef SPOOL_COMMON_CONFIG_HPP
#define SPOOL_COMMON_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace spool {

struct Config {
    uint32_t failureThreshold{5};
    std::chrono::milliseconds resetTimeout{std::chrono::seconds{60}};
    std::size_t memoryCapacity{100};
    uint64_t diskCapacityBytes{100ULL * 1024 * 1024};
    std::chrono::milliseconds sendTimeout{std::chrono::seconds{5}};
    std::size_t batchSize{100};
    std::chrono::milliseconds flushInterval{std::chrono::seconds{5}};
    std::chrono::milliseconds replayPause{100};
    std::chrono::milliseconds shutdownGrace{std::chrono::seconds{30}};
    // enqueue() wakes the drain loop while the buffer holds at most this many entries.
    std::size_t eagerSendThreshold{10};
    std::chrono::milliseconds statsInterval{std::chrono::seconds{60}};
    std::string bufferPath{"/var/lib/spool/buffer"};
    std::string statePath{"/var/lib/spool/circuit-breaker-state.json"};
    std::string sinkAddress{"localhost:50061"};
    std::string sinkToken;
    std::string listenAddress{"0.0.0.0:50051"};
    std::string logPath{"logs/spool.txt"};

    // Throws std::invalid_argument naming the first offending setting.
    void validate() const;
};

// Applies the keys present in j over config.
void applyJson(Config& config, const nlohmann::json& j);

// Applies SPOOL_* environment variables over config.
void applyEnvironment(Config& config);

// Defaults, then the JSON file at path (if given), then the environment.
// The result is validated; any problem is reported as std::invalid_argument.
Config loadConfig(const std::optional<std::string>& path);

} // namespace spool

#endif // SPOOL_COMMON_CONFIG_HPP
