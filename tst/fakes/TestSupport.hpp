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
#ifndef SPOOL_TST_FAKES_TEST_SUPPORT_HPP
#define SPOOL_TST_FAKES_TEST_SUPPORT_HPP

#include "client/Sink.hpp"
#include "common/Types.hpp"
#include "common/Util.hpp"
#include "storage/Persister.hpp"
#include <grpcpp/support/status.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace spool::test {

// A fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir()
        : dir{std::filesystem::temp_directory_path() / ("spool-test-" + generate_random_alphanumeric_string(12))} {
        std::filesystem::create_directories(dir);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    [[nodiscard]] const std::filesystem::path& path() const { return dir; }
    [[nodiscard]] std::filesystem::path operator/(const std::string& name) const { return dir / name; }
private:
    std::filesystem::path dir;
};

class InMemoryPersister : public Persister {
public:
    std::optional<CircuitSnapshot> load() override {
        std::lock_guard lock{m};
        if (failLoad) {
            throw std::runtime_error("load failed");
        }
        return stored;
    }
    void save(const CircuitSnapshot& snapshot) override {
        std::lock_guard lock{m};
        ++saves;
        if (failSave) {
            throw std::runtime_error("save failed");
        }
        stored = snapshot;
    }
    std::optional<CircuitSnapshot> stored;
    bool failLoad = false;
    bool failSave = false;
    int saves = 0;
private:
    std::mutex m;
};

// Sink whose availability is switched by the test. Delivered records are
// kept in arrival order. Slow accepts every record after the configured delay.
class FakeSink : public Sink {
public:
    enum class Mode { Up, Down, Hang, Slow };

    grpc::Status deliver(const TelemetryRecord& record, std::chrono::system_clock::time_point deadline) override {
        Mode current;
        std::chrono::milliseconds wait;
        {
            std::lock_guard lock{m};
            ++calls;
            ++running;
            current = mode;
            wait = delay;
        }
        auto status = answer(current, wait, record, deadline);
        {
            std::lock_guard lock{m};
            --running;
        }
        return status;
    }

    void set(Mode next) {
        {
            std::lock_guard lock{m};
            mode = next;
        }
        cv.notify_all();
    }

    void slowDown(std::chrono::milliseconds d) {
        {
            std::lock_guard lock{m};
            delay = d;
        }
        set(Mode::Slow);
    }

    // Accept only n more records, then fail until the budget is lifted.
    void failAfter(std::optional<int> n) {
        std::lock_guard lock{m};
        budget = n;
    }

    [[nodiscard]] int callCount() {
        std::lock_guard lock{m};
        return calls;
    }

    // Calls that have entered deliver and not returned yet.
    [[nodiscard]] int inFlight() {
        std::lock_guard lock{m};
        return running;
    }

    [[nodiscard]] std::vector<TelemetryRecord> received() {
        std::lock_guard lock{m};
        return delivered;
    }

    [[nodiscard]] std::vector<std::string> payloads() {
        std::lock_guard lock{m};
        std::vector<std::string> out;
        out.reserve(delivered.size());
        for (const auto& r : delivered) {
            out.push_back(r.payload);
        }
        return out;
    }
private:
    grpc::Status answer(Mode current, std::chrono::milliseconds wait, const TelemetryRecord& record,
                        std::chrono::system_clock::time_point deadline) {
        switch (current) {
            case Mode::Slow:
                std::this_thread::sleep_for(wait);
                [[fallthrough]];
            case Mode::Up: {
                std::lock_guard lock{m};
                if (budget.has_value()) {
                    if (budget.value() == 0) {
                        return {grpc::StatusCode::UNAVAILABLE, "sink budget exhausted"};
                    }
                    --budget.value();
                }
                delivered.push_back(record);
                return grpc::Status::OK;
            }
            case Mode::Down:
                return {grpc::StatusCode::UNAVAILABLE, "sink down"};
            case Mode::Hang: {
                std::unique_lock lock{m};
                cv.wait_until(lock, deadline + std::chrono::milliseconds{200}, [this] { return mode != Mode::Hang; });
                return {grpc::StatusCode::DEADLINE_EXCEEDED, "sink hung"};
            }
        }
        return {grpc::StatusCode::INTERNAL, "unreachable"};
    }

    std::mutex m;
    std::condition_variable cv;
    Mode mode = Mode::Up;
    std::chrono::milliseconds delay {0};
    int calls = 0;
    int running = 0;
    std::optional<int> budget;
    std::vector<TelemetryRecord> delivered;
};

inline TelemetryRecord makeRecord(const std::string& payload, std::optional<std::string> correlationId = std::nullopt) {
    return TelemetryRecord{payload, std::move(correlationId), nowMillis()};
}

inline std::vector<std::string> numbered(const std::string& prefix, int from, int to) {
    std::vector<std::string> out;
    for (int i = from; i < to; ++i) {
        out.push_back(prefix + std::to_string(i));
    }
    return out;
}

// Polls until pred holds or timeout elapses.
inline bool waitFor(const std::function<bool()>& pred, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }
    return pred();
}

} // namespace spool::test

#endif // SPOOL_TST_FAKES_TEST_SUPPORT_HPP
