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
#ifndef SPOOL_COMMON_UTIL_HPP
#define SPOOL_COMMON_UTIL_HPP

#include <random>
#include <array>
#include <algorithm>
#include <functional>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <chrono>
#include <cstdint>

namespace spool {

template <typename T = std::mt19937>
auto random_generator() -> T {
    auto constexpr seed_bytes = sizeof(typename T::result_type) * T::state_size;
    auto constexpr seed_len = seed_bytes / sizeof(std::seed_seq::result_type);
    auto seed = std::array<std::seed_seq::result_type, seed_len>();
    auto dev = std::random_device();
    std::generate_n(begin(seed), seed_len, std::ref(dev));
    auto seed_seq = std::seed_seq(begin(seed), end(seed));
    return T{seed_seq};
}

std::string generate_random_alphanumeric_string(std::size_t len);

// Milliseconds since the Unix epoch.
int64_t nowMillis();
int64_t toMillis(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point fromMillis(int64_t ms);

std::string base64Encode(std::string_view bytes);
// std::nullopt on malformed input.
std::optional<std::string> base64Decode(std::string_view text);

// Writes content to a temp file beside path, fsyncs it, renames it over path
// and fsyncs the directory. Throws std::system_error on failure; the temp file
// never survives a failed call.
void writeFileAtomically(const std::filesystem::path& path, std::string_view content);

// Throws std::system_error when the file cannot be read.
std::string readFile(const std::filesystem::path& path);

} // namespace spool

#endif // SPOOL_COMMON_UTIL_HPP
