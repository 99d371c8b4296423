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
#include "common/Error.hpp"
#include <utility>
#include <string>
#include <ostream>
#include <unordered_set>

namespace spool {

std::ostream& operator<<(std::ostream& os, const ErrorCode& code) {
    os << toString(code);
    return os;
}

std::string toString(const ErrorCode& code) {
    switch (code)
    {
        case ErrorCode::OK: return "OK";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
        case ErrorCode::SinkUnavailable: return "SinkUnavailable";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::CircuitOpen: return "CircuitOpen";
        case ErrorCode::Persistence: return "Persistence";
        case ErrorCode::CorruptState: return "CorruptState";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::Internal: return "Internal";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::Unknown: return "Unknown";
    }
    return "Unknown";
}

const std::unordered_set<ErrorCode, ErrorCodeHash> transientErrorCodes = {
    ErrorCode::SinkUnavailable,
    ErrorCode::Timeout,
    ErrorCode::CircuitOpen,
    ErrorCode::Unknown,
};

bool isTransient(const ErrorCode& code) {
    return transientErrorCodes.contains(code);
}

Error::Error(const ErrorCode& c, std::string w) : code {c}, what {std::move(w)} {}
Error::Error(const ErrorCode& c) : code {c}, what {toString(c)} {}

std::ostream& operator<<(std::ostream& os, const Error& error) {
    os << toString(error.code) << ": " << error.what;
    return os;
}

} // namespace spool
