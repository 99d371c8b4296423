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
#include "common/Util.hpp"
#include <algorithm>
#include <random>
#include <string_view>
#include <cstring>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <system_error>
#include <spdlog/spdlog.h>
#include <absl/strings/escaping.h>
#include <absl/strings/string_view.h>
#include <fcntl.h>
#include <unistd.h>

namespace spool {

namespace {

[[noreturn]] void throwErrno(const std::string& what) {
    throw std::system_error(errno, std::generic_category(), what);
}

void writeAll(int fd, std::string_view content, const std::string& path) {
    const char* p = content.data();
    auto remaining = content.size();
    while (remaining > 0) {
        auto n = ::write(fd, p, remaining);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throwErrno("write " + path);
        }
        p += n;
        remaining -= static_cast<std::size_t>(n);
    }
}

} // namespace

std::string generate_random_alphanumeric_string(std::size_t len) {
    static constexpr auto chars =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";
    thread_local auto rng = random_generator<>();
    auto dist = std::uniform_int_distribution{{}, std::strlen(chars) - 1};
    auto result = std::string(len, '\0');
    std::generate_n(begin(result), len, [&]() { return chars[dist(rng)]; });
    return result;
}

int64_t nowMillis() {
    return toMillis(std::chrono::system_clock::now());
}

int64_t toMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromMillis(int64_t ms) {
    return std::chrono::system_clock::time_point{std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds{ms})};
}

std::string base64Encode(std::string_view bytes) {
    return absl::Base64Escape(absl::string_view{bytes.data(), bytes.size()});
}

std::optional<std::string> base64Decode(std::string_view text) {
    // Segments are always written padded; anything else is damage.
    if (text.size() % 4 != 0) {
        return std::nullopt;
    }
    std::string out;
    if (!absl::Base64Unescape(absl::string_view{text.data(), text.size()}, &out)) {
        return std::nullopt;
    }
    return out;
}

void writeFileAtomically(const std::filesystem::path& path, std::string_view content) {
    const auto dir = path.has_parent_path() ? path.parent_path() : std::filesystem::path{"."};
    const auto tmp = dir / ("." + path.filename().string() + ".tmp-" + generate_random_alphanumeric_string(8));
    const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        throwErrno("open " + tmp.string());
    }
    try {
        writeAll(fd, content, tmp.string());
        if (::fsync(fd) != 0) {
            throwErrno("fsync " + tmp.string());
        }
    } catch (...) {
        ::close(fd);
        ::unlink(tmp.c_str());
        throw;
    }
    if (::close(fd) != 0) {
        const auto err = errno;
        ::unlink(tmp.c_str());
        throw std::system_error(err, std::generic_category(), "close " + tmp.string());
    }
    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        const auto err = errno;
        ::unlink(tmp.c_str());
        throw std::system_error(err, std::generic_category(), "rename " + tmp.string());
    }
    const int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dfd < 0) {
        spdlog::warn("writeFileAtomically: cannot open directory {} for fsync: {}", dir.string(), std::strerror(errno));
        return;
    }
    if (::fsync(dfd) != 0) {
        spdlog::warn("writeFileAtomically: fsync of directory {} failed: {}", dir.string(), std::strerror(errno));
    }
    ::close(dfd);
}

std::string readFile(const std::filesystem::path& path) {
    std::ifstream in{path, std::ios::binary};
    if (!in) {
        throw std::system_error(errno == 0 ? ENOENT : errno, std::generic_category(), "open " + path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        throw std::system_error(EIO, std::generic_category(), "read " + path.string());
    }
    return ss.str();
}

} // namespace spool
