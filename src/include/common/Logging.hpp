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
#ifndef SPOOL_COMMON_LOGGING_HPP
#define SPOOL_COMMON_LOGGING_HPP

#include <spdlog/common.h>
#include <cstddef>
#include <string>

namespace spool {

struct LogOptions {
    std::string path;
    spdlog::level::level_enum level = spdlog::level::info;
    // Echo to stdout as well as the rotating file.
    bool console = true;
    std::size_t maxFileBytes = 5 * 1024 * 1024;
    std::size_t maxFiles = 3;
};

// Makes an asynchronous logger writing to options.path the spdlog default.
// Pair with spdlog::shutdown() before exit so queued lines are written.
void installLogger(const LogOptions& options);

} // namespace spool

#endif // SPOOL_COMMON_LOGGING_HPP
