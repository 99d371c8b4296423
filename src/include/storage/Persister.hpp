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
#ifndef SPOOL_STORAGE_PERSISTER_HPP
#define SPOOL_STORAGE_PERSISTER_HPP

#include "common/Types.hpp"
#include <optional>

namespace spool {

class Persister {
public:
    // std::nullopt when nothing usable has been persisted.
    virtual std::optional<CircuitSnapshot> load() = 0;
    // Throws on failure.
    virtual void save(const CircuitSnapshot& snapshot) = 0;
    virtual ~Persister() = default;
};

} // namespace spool

#endif // SPOOL_STORAGE_PERSISTER_HPP
