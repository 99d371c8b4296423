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
#ifndef SPOOL_COMMON_ERROR_HPP
#define SPOOL_COMMON_ERROR_HPP

#include <string>
#include <ostream>
#include <functional>
#include <type_traits>
#include <unordered_set>

namespace spool {

enum class ErrorCode {
    OK = 0,
    InvalidConfig = 1,
    SinkUnavailable = 2,
    Timeout = 3,
    CircuitOpen = 4,
    Persistence = 5,
    CorruptState = 6,
    Cancelled = 7,
    Internal = 8,
    InvalidArgument = 9,
    Unknown = 128
};

struct ErrorCodeHash {
    std::size_t operator()(const ErrorCode& code) const noexcept {
        return std::hash<std::underlying_type_t<ErrorCode>>{}(static_cast<std::underlying_type_t<ErrorCode>>(code));
    }
};

// Sink failures that leave the record buffered for another attempt.
extern const std::unordered_set<ErrorCode, ErrorCodeHash> transientErrorCodes;
bool isTransient(const ErrorCode& code);

std::ostream& operator<<(std::ostream& os, const ErrorCode& code);

std::string toString(const ErrorCode& code);

struct Error {
    ErrorCode code;
    std::string what;

    Error(const ErrorCode& c, std::string w);
    explicit Error(const ErrorCode& c);
};

std::ostream& operator<<(std::ostream& os, const Error& error);

} // namespace spool

#endif // SPOOL_COMMON_ERROR_HPP
