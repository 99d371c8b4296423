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

#ifndef SPOOL_STORAGE_FILE_PERSISTER_HPP
#define SPOOL_STORAGE_FILE_PERSISTER_HPP

#include "storage/Persister.hpp"
#include <filesystem>
#include <optional>

namespace spool {

// Keeps the circuit breaker state document in a single JSON file, replaced
// atomically on every save.
class FilePersister : public Persister {
public:
    explicit FilePersister(const std::filesystem::path& filename);
    std::optional<CircuitSnapshot> load() override;
    void save(const CircuitSnapshot& snapshot) override;
    [[nodiscard]] const std::filesystem::path& path() const;
    ~FilePersister() override = default;
private:
    std::filesystem::path file;
};

} // namespace spool

#endif // SPOOL_STORAGE_FILE_PERSISTER_HPP
