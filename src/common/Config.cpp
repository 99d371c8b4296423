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
#include "common/Config.hpp"
#include "common/Util.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>
#include <chrono>
#include <functional>
#include <utility>
#include <vector>
#include <system_error>

namespace spool {

namespace {

uint64_t parseUnsigned(const std::string& name, const std::string& value) {
    if (value.empty() || value.front() == '-') {
        throw std::invalid_argument(name + " must be a non-negative integer, got '" + value + "'");
    }
    try {
        std::size_t pos = 0;
        auto v = std::stoull(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument(name + " has trailing characters: '" + value + "'");
        }
        return v;
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(name + " is out of range: '" + value + "'");
    } catch (const std::invalid_argument&) {
        throw std::invalid_argument(name + " must be a non-negative integer, got '" + value + "'");
    }
}

uint64_t jsonUnsigned(const nlohmann::json& j, const std::string& key) {
    const auto& v = j.at(key);
    if (!v.is_number_unsigned() && !(v.is_number_integer() && v.get<int64_t>() >= 0)) {
        throw std::invalid_argument(key + " must be a non-negative integer");
    }
    return v.get<uint64_t>();
}

std::string jsonString(const nlohmann::json& j, const std::string& key) {
    const auto& v = j.at(key);
    if (!v.is_string()) {
        throw std::invalid_argument(key + " must be a string");
    }
    return v.get<std::string>();
}

uint32_t toUint32(const std::string& key, uint64_t v) {
    if (v > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument(key + " is out of range: " + std::to_string(v));
    }
    return static_cast<uint32_t>(v);
}

std::chrono::milliseconds scaledMillis(const std::string& key, uint64_t v, uint64_t unit) {
    const auto limit = static_cast<uint64_t>(std::chrono::milliseconds::max().count()) / unit;
    if (v > limit) {
        throw std::invalid_argument(key + " is out of range: " + std::to_string(v));
    }
    return std::chrono::milliseconds{static_cast<int64_t>(v * unit)};
}

std::chrono::milliseconds secondsValue(const std::string& key, uint64_t v) {
    return scaledMillis(key, v, 1000);
}

std::chrono::milliseconds millisValue(const std::string& key, uint64_t v) {
    return scaledMillis(key, v, 1);
}

struct Setting {
    std::string key;
    std::string env;
    std::function<void(Config&, uint64_t)> setNumber;
    std::function<void(Config&, std::string)> setString;
};

const std::vector<Setting>& settings() {
    static const std::vector<Setting> s {
        {"failureThreshold", "SPOOL_FAILURE_THRESHOLD",
            [](Config& c, uint64_t v) { c.failureThreshold = toUint32("failureThreshold", v); }, nullptr},
        {"resetTimeoutSeconds", "SPOOL_RESET_TIMEOUT_SECONDS",
            [](Config& c, uint64_t v) { c.resetTimeout = secondsValue("resetTimeoutSeconds", v); }, nullptr},
        {"memoryCapacity", "SPOOL_MEMORY_CAPACITY",
            [](Config& c, uint64_t v) { c.memoryCapacity = v; }, nullptr},
        {"diskCapacityBytes", "SPOOL_DISK_CAPACITY_BYTES",
            [](Config& c, uint64_t v) { c.diskCapacityBytes = v; }, nullptr},
        {"sendTimeoutSeconds", "SPOOL_SEND_TIMEOUT_SECONDS",
            [](Config& c, uint64_t v) { c.sendTimeout = secondsValue("sendTimeoutSeconds", v); }, nullptr},
        {"batchSize", "SPOOL_BATCH_SIZE",
            [](Config& c, uint64_t v) { c.batchSize = v; }, nullptr},
        {"flushIntervalSeconds", "SPOOL_FLUSH_INTERVAL_SECONDS",
            [](Config& c, uint64_t v) { c.flushInterval = secondsValue("flushIntervalSeconds", v); }, nullptr},
        {"replayPauseMilliseconds", "SPOOL_REPLAY_PAUSE_MILLISECONDS",
            [](Config& c, uint64_t v) { c.replayPause = millisValue("replayPauseMilliseconds", v); }, nullptr},
        {"shutdownGraceSeconds", "SPOOL_SHUTDOWN_GRACE_SECONDS",
            [](Config& c, uint64_t v) { c.shutdownGrace = secondsValue("shutdownGraceSeconds", v); }, nullptr},
        {"eagerSendThreshold", "SPOOL_EAGER_SEND_THRESHOLD",
            [](Config& c, uint64_t v) { c.eagerSendThreshold = v; }, nullptr},
        {"statsIntervalSeconds", "SPOOL_STATS_INTERVAL_SECONDS",
            [](Config& c, uint64_t v) { c.statsInterval = secondsValue("statsIntervalSeconds", v); }, nullptr},
        {"bufferPath", "SPOOL_BUFFER_PATH", nullptr,
            [](Config& c, std::string v) { c.bufferPath = std::move(v); }},
        {"statePath", "SPOOL_STATE_PATH", nullptr,
            [](Config& c, std::string v) { c.statePath = std::move(v); }},
        {"sinkAddress", "SPOOL_SINK_ADDRESS", nullptr,
            [](Config& c, std::string v) { c.sinkAddress = std::move(v); }},
        {"sinkToken", "SPOOL_SINK_TOKEN", nullptr,
            [](Config& c, std::string v) { c.sinkToken = std::move(v); }},
        {"listenAddress", "SPOOL_LISTEN_ADDRESS", nullptr,
            [](Config& c, std::string v) { c.listenAddress = std::move(v); }},
        {"logPath", "SPOOL_LOG_PATH", nullptr,
            [](Config& c, std::string v) { c.logPath = std::move(v); }},
    };
    return s;
}

} // namespace

void Config::validate() const {
    if (failureThreshold == 0) {
        throw std::invalid_argument("Failure threshold must be > zero.");
    }
    if (resetTimeout < std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Reset timeout must be >= zero.");
    }
    if (memoryCapacity == 0) {
        throw std::invalid_argument("Memory capacity must be > zero.");
    }
    if (diskCapacityBytes == 0) {
        throw std::invalid_argument("Disk capacity must be > zero.");
    }
    if (sendTimeout <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Send timeout must be > zero.");
    }
    if (batchSize == 0) {
        throw std::invalid_argument("Batch size must be > zero.");
    }
    if (flushInterval <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Flush interval must be > zero.");
    }
    if (replayPause < std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Replay pause must be >= zero.");
    }
    if (shutdownGrace < std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Shutdown grace must be >= zero.");
    }
    if (statsInterval <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Stats interval must be > zero.");
    }
    if (bufferPath.empty()) {
        throw std::invalid_argument("Buffer path must not be empty.");
    }
    if (statePath.empty()) {
        throw std::invalid_argument("State path must not be empty.");
    }
    if (sinkAddress.empty()) {
        throw std::invalid_argument("Sink address must not be empty.");
    }
}

void applyJson(Config& config, const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Configuration must be a JSON object");
    }
    for (const auto& s : settings()) {
        if (!j.contains(s.key)) {
            continue;
        }
        if (s.setNumber) {
            s.setNumber(config, jsonUnsigned(j, s.key));
        } else {
            s.setString(config, jsonString(j, s.key));
        }
    }
}

void applyEnvironment(Config& config) {
    for (const auto& s : settings()) {
        const char* value = std::getenv(s.env.c_str());
        if (value == nullptr) {
            continue;
        }
        if (s.setNumber) {
            s.setNumber(config, parseUnsigned(s.env, value));
        } else {
            s.setString(config, value);
        }
        spdlog::debug("Config: {} overridden from environment", s.key);
    }
}

Config loadConfig(const std::optional<std::string>& path) {
    Config config{};
    if (path.has_value()) {
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(readFile(path.value()));
        } catch (const nlohmann::json::exception& e) {
            throw std::invalid_argument("Cannot parse configuration " + path.value() + ": " + e.what());
        } catch (const std::system_error& e) {
            throw std::invalid_argument("Cannot read configuration " + path.value() + ": " + e.what());
        }
        applyJson(config, j);
        spdlog::info("Config: loaded {}", path.value());
    }
    applyEnvironment(config);
    config.validate();
    return config;
}

} // namespace spool
