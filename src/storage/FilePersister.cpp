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
#include "storage/FilePersister.hpp"
#include "common/Util.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <optional>

namespace spool {

FilePersister::FilePersister(const std::filesystem::path& filename)
    : file{filename} {}

std::optional<CircuitSnapshot> FilePersister::load() {
    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) {
        spdlog::info("FilePersister: no persisted state at {}, starting fresh", file.string());
        return std::nullopt;
    }
    try {
        auto j = nlohmann::json::parse(readFile(file));
        auto snapshot = j.get<CircuitSnapshot>();
        spdlog::info("FilePersister: loaded persisted state {} with {} failures", toString(snapshot.state), snapshot.failureCount);
        return snapshot;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("FilePersister: corrupt state file {} ({}), starting fresh", file.string(), e.what());
    } catch (const std::invalid_argument& e) {
        spdlog::warn("FilePersister: corrupt state file {} ({}), starting fresh", file.string(), e.what());
    } catch (const std::system_error& e) {
        spdlog::warn("FilePersister: unreadable state file {} ({}), starting fresh", file.string(), e.what());
    }
    return std::nullopt;
}

void FilePersister::save(const CircuitSnapshot& snapshot) {
    if (file.has_parent_path()) {
        std::filesystem::create_directories(file.parent_path());
    }
    const nlohmann::json j = snapshot;
    writeFileAtomically(file, j.dump());
}

const std::filesystem::path& FilePersister::path() const {
    return file;
}

} // namespace spool
