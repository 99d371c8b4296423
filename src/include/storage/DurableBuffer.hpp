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
#ifndef SPOOL_STORAGE_DURABLE_BUFFER_HPP
#define SPOOL_STORAGE_DURABLE_BUFFER_HPP

#include "common/AsyncTimer.hpp"
#include "common/Types.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace spool {

/**
 * FIFO holding area for records that have not reached the Sink yet.
 *
 * Records accumulate in a bounded memory tier. When it reaches capacity the
 * tier is sealed and handed to a background flusher, which writes it
 * atomically to a new segment file in the buffer directory. A sealed tier
 * whose write fails stays in memory and is retried. Segment files are named
 * after their first sequence id, so directory order is insertion order, and
 * they are indexed again on construction so nothing written before a crash
 * is lost.
 *
 * Memory and disk together are capped at capacityBytes; past that the oldest
 * segments, then sealed tiers, then memory entries are evicted.
 *
 * All members are safe to call from several threads. File I/O never happens
 * under the mutex that enqueue takes: drain, acknowledge and the flusher
 * snapshot state under it, work on files under ioMutex, then re-lock to
 * commit. Lock order is ioMutex before m.
 */
class DurableBuffer {
public:
    DurableBuffer(const std::filesystem::path& directory, std::size_t memoryCapacity, uint64_t capacityBytes);
    // Writes sealed tiers still waiting for the flusher; the open memory tier is not saved.
    ~DurableBuffer();
    DurableBuffer(const DurableBuffer&) = delete;
    DurableBuffer& operator=(const DurableBuffer&) = delete;

    // Never throws and never waits on the Sink.
    void enqueue(TelemetryRecord record) noexcept;
    // Oldest entries first, at most maxBatch of them. Nothing is removed.
    [[nodiscard]] std::vector<BufferEntry> drain(std::size_t maxBatch);
    // Removes delivered entries; unknown ids are ignored.
    void acknowledge(const std::vector<SequenceId>& ids);
    // Seals the memory tier and writes everything sealed to disk now. Used on shutdown.
    void flushToDisk() noexcept;
    // Blocks until the sealed tiers are written, or their write failed.
    void sync() noexcept;

    [[nodiscard]] std::size_t count();
    [[nodiscard]] std::size_t sizeBytes();
    [[nodiscard]] bool hasDiskBacklog();
    [[nodiscard]] BufferStats stats();
    [[nodiscard]] const std::filesystem::path& directory() const;
private:
    struct Segment {
        std::filesystem::path path;
        std::vector<SequenceId> ids;
        uint64_t bytes;
    };
    // A full memory tier waiting to become a segment. first names the file,
    // ids are the entries not yet acknowledged. entries is never modified,
    // so snapshots share it instead of copying payloads under the lock.
    struct Sealed {
        SequenceId first;
        std::shared_ptr<const std::vector<BufferEntry>> entries;
        std::vector<SequenceId> ids;
        uint64_t bytes;
    };

    void recover();
    bool sealLocked();
    void evictLocked() noexcept;
    // The *Io members require ioMutex.
    void writeSealedIo() noexcept;
    void removeDoomedIo() noexcept;
    void discardSegmentIo(const Segment& segment, const std::string& reason);
    std::vector<BufferEntry> readSegment(const std::filesystem::path& path) const;
    std::filesystem::path segmentPath(SequenceId first) const;
    std::size_t diskCountLocked() const;
    std::size_t ramCountLocked() const;
    void failLocked(const std::string& error);
    void fail(const std::string& error);

    std::mutex ioMutex;
    std::mutex m;
    const std::filesystem::path dir;
    const std::size_t memoryCapacity;
    const uint64_t capacityBytes;
    std::deque<BufferEntry> memory;
    std::deque<Sealed> sealed;
    // memory plus sealed
    uint64_t memoryBytes {0};
    std::deque<Segment> segments;
    uint64_t diskBytes {0};
    // Files no longer indexed, removed later under ioMutex.
    std::vector<std::filesystem::path> doomed;
    SequenceId nextId {1};
    // Eviction is oldest first, so every id up to here is gone.
    SequenceId evictedThrough {0};
    uint64_t evicted {0};
    uint64_t dropped {0};
    std::string lastError;
    AsyncTimer flusher;
};

} // namespace spool

#endif // SPOOL_STORAGE_DURABLE_BUFFER_HPP
