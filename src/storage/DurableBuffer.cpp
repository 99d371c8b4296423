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
#include "storage/DurableBuffer.hpp"
#include "common/Util.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <iterator>
#include <memory>
#include <exception>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_set>
#include <utility>
#include <vector>

namespace spool {

namespace {

constexpr std::string_view segmentPrefix = "segment-";
constexpr std::string_view segmentSuffix = ".json";
constexpr std::chrono::milliseconds flushRetryInterval {1000};

bool isSegmentName(const std::string& name) {
    return name.size() > segmentPrefix.size() + segmentSuffix.size() &&
           name.starts_with(segmentPrefix) &&
           name.ends_with(segmentSuffix);
}

// Temp files left behind by a crash in the middle of an atomic write.
bool isStaleTempName(const std::string& name) {
    return name.starts_with(".") && name.find(".tmp-") != std::string::npos;
}

void removeFile(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        spdlog::error("DurableBuffer: cannot remove {}: {}", path.string(), ec.message());
    }
}

std::string serialize(const std::vector<BufferEntry>& entries) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& e : entries) {
        j.push_back(e);
    }
    return j.dump();
}

} // namespace

DurableBuffer::DurableBuffer(const std::filesystem::path& directory, std::size_t memCapacity, uint64_t capBytes)
    : dir{directory},
      memoryCapacity{memCapacity},
      capacityBytes{capBytes} {
    {
        std::lock_guard lock{m};
        try {
            recover();
        } catch (const std::filesystem::filesystem_error& e) {
            failLocked(std::string{"recovery of "} + dir.string() + " failed: " + e.what());
        }
        evictLocked();
    }
    flusher.start([] { return flushRetryInterval; }, [this] { sync(); });
    flusher.poke();
}

DurableBuffer::~DurableBuffer() {
    flusher.stop();
    sync();
}

std::filesystem::path DurableBuffer::segmentPath(SequenceId first) const {
    return dir / fmt::format("{}{:020}{}", segmentPrefix, first, segmentSuffix);
}

std::vector<BufferEntry> DurableBuffer::readSegment(const std::filesystem::path& path) const {
    auto j = nlohmann::json::parse(readFile(path));
    if (!j.is_array()) {
        throw std::invalid_argument("segment is not a JSON array");
    }
    std::vector<BufferEntry> entries;
    entries.reserve(j.size());
    for (const auto& item : j) {
        entries.push_back(item.get<BufferEntry>());
    }
    return entries;
}

void DurableBuffer::recover() {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        failLocked("cannot create buffer directory " + dir.string() + ": " + ec.message());
        return;
    }
    std::vector<std::filesystem::path> files;
    for (const auto& de : std::filesystem::directory_iterator(dir, ec)) {
        const auto name = de.path().filename().string();
        if (isStaleTempName(name)) {
            removeFile(de.path());
            spdlog::warn("DurableBuffer: removed incomplete write {}", name);
        } else if (de.is_regular_file() && isSegmentName(name)) {
            files.push_back(de.path());
        }
    }
    if (ec) {
        failLocked("cannot list buffer directory " + dir.string() + ": " + ec.message());
        return;
    }
    std::sort(files.begin(), files.end());

    std::size_t recovered = 0;
    for (const auto& f : files) {
        std::vector<BufferEntry> entries;
        try {
            entries = readSegment(f);
        } catch (const std::exception& e) {
            spdlog::error("DurableBuffer: discarding unreadable segment {}: {}", f.filename().string(), e.what());
            removeFile(f);
            continue;
        }
        if (entries.empty()) {
            removeFile(f);
            continue;
        }
        Segment s {f, {}, std::filesystem::file_size(f, ec)};
        if (ec) {
            s.bytes = 0;
        }
        for (const auto& e : entries) {
            s.ids.push_back(e.id);
            nextId = std::max(nextId, e.id + 1);
        }
        recovered += s.ids.size();
        diskBytes += s.bytes;
        segments.push_back(std::move(s));
    }
    if (!segments.empty()) {
        spdlog::info("DurableBuffer: recovered {} entries from {} segments in {}", recovered, segments.size(), dir.string());
    }
}

void DurableBuffer::failLocked(const std::string& error) {
    lastError = error;
    spdlog::error("DurableBuffer: {}", error);
}

void DurableBuffer::fail(const std::string& error) {
    std::lock_guard lock{m};
    failLocked(error);
}

void DurableBuffer::enqueue(TelemetryRecord record) noexcept {
    try {
        bool wake = false;
        {
            std::lock_guard lock{m};
            BufferEntry entry {nextId++, StorageTier::Memory, std::move(record)};
            memoryBytes += entry.footprint();
            memory.push_back(std::move(entry));
            if (memory.size() >= memoryCapacity) {
                spdlog::debug("DurableBuffer: memory tier full ({} entries), sealing it for disk", memory.size());
                wake = sealLocked();
            }
            evictLocked();
            wake = wake || !doomed.empty();
        }
        if (wake) {
            flusher.poke();
        }
    } catch (const std::exception& e) {
        spdlog::error("DurableBuffer: enqueue failed, record dropped: {}", e.what());
    }
}

bool DurableBuffer::sealLocked() {
    if (memory.empty()) {
        return false;
    }
    Sealed s {memory.front().id, {}, {}, 0};
    std::vector<BufferEntry> entries;
    entries.reserve(memory.size());
    s.ids.reserve(memory.size());
    for (auto& e : memory) {
        s.bytes += e.footprint();
        s.ids.push_back(e.id);
        entries.push_back(std::move(e));
    }
    memory.clear();
    s.entries = std::make_shared<const std::vector<BufferEntry>>(std::move(entries));
    sealed.push_back(std::move(s));
    return true;
}

void DurableBuffer::writeSealedIo() noexcept {
    while (true) {
        Sealed batch;
        {
            std::lock_guard lock{m};
            if (sealed.empty()) {
                return;
            }
            batch = sealed.front();
        }
        const auto path = segmentPath(batch.first);
        std::string content;
        try {
            const std::unordered_set<SequenceId> pending(batch.ids.begin(), batch.ids.end());
            std::vector<BufferEntry> entries;
            entries.reserve(pending.size());
            std::copy_if(batch.entries->begin(), batch.entries->end(), std::back_inserter(entries),
                         [&pending](const BufferEntry& e) { return pending.contains(e.id); });
            content = serialize(entries);
            writeFileAtomically(path, content);
        } catch (const std::exception& e) {
            fail(fmt::format("cannot write {} ({} records), keeping them in memory: {}", path.filename().string(), batch.ids.size(), e.what()));
            return;
        }
        std::lock_guard lock{m};
        if (!sealed.empty() && sealed.front().first == batch.first) {
            auto& b = sealed.front();
            spdlog::info("DurableBuffer: wrote {} entries to {}", b.ids.size(), path.filename().string());
            memoryBytes -= std::min(memoryBytes, b.bytes);
            diskBytes += content.size();
            segments.push_back(Segment{path, std::move(b.ids), content.size()});
            sealed.pop_front();
            evictLocked();
        } else {
            // Evicted while it was being written.
            doomed.push_back(path);
        }
    }
}

void DurableBuffer::removeDoomedIo() noexcept {
    std::vector<std::filesystem::path> paths;
    {
        std::lock_guard lock{m};
        paths.swap(doomed);
    }
    for (const auto& p : paths) {
        std::error_code ec;
        std::filesystem::remove(p, ec);
        if (ec) {
            fail("cannot remove segment " + p.string() + ": " + ec.message());
        }
    }
}

void DurableBuffer::discardSegmentIo(const Segment& segment, const std::string& reason) {
    {
        std::lock_guard lock{m};
        auto it = std::find_if(segments.begin(), segments.end(), [&segment](const Segment& s) { return s.path == segment.path; });
        if (it == segments.end()) {
            return;
        }
        failLocked(fmt::format("discarding unreadable segment {} ({} records): {}", it->path.filename().string(), it->ids.size(), reason));
        dropped += it->ids.size();
        diskBytes -= std::min(diskBytes, it->bytes);
        segments.erase(it);
    }
    removeFile(segment.path);
}

void DurableBuffer::evictLocked() noexcept {
    if (memoryBytes + diskBytes <= capacityBytes) {
        return;
    }
    uint64_t count = 0;
    while (memoryBytes + diskBytes > capacityBytes && !segments.empty()) {
        auto& s = segments.front();
        if (!s.ids.empty()) {
            evictedThrough = std::max(evictedThrough, s.ids.back());
        }
        count += s.ids.size();
        diskBytes -= std::min(diskBytes, s.bytes);
        doomed.push_back(std::move(s.path));
        segments.pop_front();
    }
    while (memoryBytes + diskBytes > capacityBytes && !sealed.empty()) {
        const auto& b = sealed.front();
        if (!b.ids.empty()) {
            evictedThrough = std::max(evictedThrough, b.ids.back());
        }
        count += b.ids.size();
        memoryBytes -= std::min(memoryBytes, b.bytes);
        sealed.pop_front();
    }
    while (memoryBytes + diskBytes > capacityBytes && !memory.empty()) {
        evictedThrough = std::max(evictedThrough, memory.front().id);
        memoryBytes -= std::min(memoryBytes, static_cast<uint64_t>(memory.front().footprint()));
        memory.pop_front();
        ++count;
    }
    evicted += count;
    spdlog::warn("DurableBuffer: capacity of {} bytes exceeded, evicted {} oldest records", capacityBytes, count);
}

std::vector<BufferEntry> DurableBuffer::drain(std::size_t maxBatch) {
    std::lock_guard io{ioMutex};
    std::vector<Segment> segs;
    std::vector<Sealed> seals;
    std::vector<BufferEntry> fresh;
    {
        std::lock_guard lock{m};
        std::size_t planned = 0;
        for (auto it = segments.begin(); it != segments.end() && planned < maxBatch; ++it) {
            segs.push_back(*it);
            planned += it->ids.size();
        }
        for (auto it = sealed.begin(); it != sealed.end() && planned < maxBatch; ++it) {
            seals.push_back(*it);
            planned += it->ids.size();
        }
        for (auto it = memory.begin(); it != memory.end() && planned < maxBatch; ++it) {
            fresh.push_back(*it);
            ++planned;
        }
    }

    std::vector<BufferEntry> out;
    for (const auto& seg : segs) {
        if (out.size() >= maxBatch) {
            break;
        }
        std::vector<BufferEntry> entries;
        try {
            entries = readSegment(seg.path);
        } catch (const std::exception& e) {
            discardSegmentIo(seg, e.what());
            continue;
        }
        const std::unordered_set<SequenceId> pending(seg.ids.begin(), seg.ids.end());
        for (auto& e : entries) {
            if (out.size() >= maxBatch) {
                break;
            }
            if (pending.contains(e.id)) {
                out.push_back(std::move(e));
            }
        }
    }
    for (const auto& b : seals) {
        const std::unordered_set<SequenceId> pending(b.ids.begin(), b.ids.end());
        for (const auto& e : *b.entries) {
            if (out.size() >= maxBatch) {
                break;
            }
            if (pending.contains(e.id)) {
                out.push_back(e);
            }
        }
    }
    for (auto& e : fresh) {
        if (out.size() >= maxBatch) {
            break;
        }
        out.push_back(std::move(e));
    }

    // Producers may have evicted part of the snapshot meanwhile.
    SequenceId gone = 0;
    {
        std::lock_guard lock{m};
        gone = evictedThrough;
    }
    std::erase_if(out, [gone](const BufferEntry& e) { return e.id <= gone; });
    return out;
}

void DurableBuffer::acknowledge(const std::vector<SequenceId>& ids) {
    if (ids.empty()) {
        return;
    }
    const std::unordered_set<SequenceId> acked(ids.begin(), ids.end());
    std::lock_guard io{ioMutex};
    std::vector<Segment> rewrites;
    {
        std::lock_guard lock{m};
        for (auto it = segments.begin(); it != segments.end();) {
            std::vector<SequenceId> remaining;
            for (auto id : it->ids) {
                if (!acked.contains(id)) {
                    remaining.push_back(id);
                }
            }
            if (remaining.size() == it->ids.size()) {
                ++it;
                continue;
            }
            if (remaining.empty()) {
                spdlog::debug("DurableBuffer: segment {} fully delivered", it->path.filename().string());
                diskBytes -= std::min(diskBytes, it->bytes);
                doomed.push_back(it->path);
                it = segments.erase(it);
                continue;
            }
            it->ids = std::move(remaining);
            rewrites.push_back(*it);
            ++it;
        }
        for (auto it = sealed.begin(); it != sealed.end();) {
            std::erase_if(it->ids, [&acked](SequenceId id) { return acked.contains(id); });
            if (it->ids.empty()) {
                memoryBytes -= std::min(memoryBytes, it->bytes);
                it = sealed.erase(it);
            } else {
                ++it;
            }
        }
        std::erase_if(memory, [this, &acked](const BufferEntry& e) {
            if (acked.contains(e.id)) {
                memoryBytes -= std::min(memoryBytes, static_cast<uint64_t>(e.footprint()));
                return true;
            }
            return false;
        });
    }
    removeDoomedIo();

    // Rewrite so a restart does not resend what was already delivered.
    for (const auto& seg : rewrites) {
        try {
            auto entries = readSegment(seg.path);
            const std::unordered_set<SequenceId> keep(seg.ids.begin(), seg.ids.end());
            std::erase_if(entries, [&keep](const BufferEntry& e) { return !keep.contains(e.id); });
            const auto content = serialize(entries);
            writeFileAtomically(seg.path, content);
            std::lock_guard lock{m};
            auto it = std::find_if(segments.begin(), segments.end(), [&seg](const Segment& s) { return s.path == seg.path; });
            if (it != segments.end()) {
                diskBytes -= std::min(diskBytes, it->bytes);
                it->bytes = content.size();
                diskBytes += it->bytes;
            }
        } catch (const std::exception& e) {
            fail(fmt::format("cannot rewrite segment {}, delivered records may be resent: {}", seg.path.filename().string(), e.what()));
        }
    }
}

void DurableBuffer::flushToDisk() noexcept {
    {
        std::lock_guard lock{m};
        sealLocked();
        evictLocked();
    }
    sync();
}

void DurableBuffer::sync() noexcept {
    std::lock_guard io{ioMutex};
    writeSealedIo();
    removeDoomedIo();
}

std::size_t DurableBuffer::diskCountLocked() const {
    std::size_t n = 0;
    for (const auto& s : segments) {
        n += s.ids.size();
    }
    return n;
}

std::size_t DurableBuffer::ramCountLocked() const {
    std::size_t n = memory.size();
    for (const auto& b : sealed) {
        n += b.ids.size();
    }
    return n;
}

std::size_t DurableBuffer::count() {
    std::lock_guard lock{m};
    return ramCountLocked() + diskCountLocked();
}

std::size_t DurableBuffer::sizeBytes() {
    std::lock_guard lock{m};
    return static_cast<std::size_t>(memoryBytes + diskBytes);
}

bool DurableBuffer::hasDiskBacklog() {
    std::lock_guard lock{m};
    return !segments.empty();
}

BufferStats DurableBuffer::stats() {
    std::lock_guard lock{m};
    BufferStats s;
    s.memoryCount = ramCountLocked();
    s.diskCount = diskCountLocked();
    s.diskFileCount = segments.size();
    s.totalBytes = static_cast<std::size_t>(memoryBytes + diskBytes);
    s.evicted = evicted;
    s.dropped = dropped;
    s.lastError = lastError;
    return s;
}

const std::filesystem::path& DurableBuffer::directory() const {
    return dir;
}

} // namespace spool
