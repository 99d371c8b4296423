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
#include <gtest/gtest.h>
#include "storage/DurableBuffer.hpp"
#include "common/Util.hpp"
#include "fakes/TestSupport.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

using spool::BufferEntry;
using spool::DurableBuffer;
using spool::SequenceId;
using spool::StorageTier;
using spool::test::TempDir;
using spool::test::makeRecord;
using spool::test::numbered;

namespace {

std::vector<std::string> payloadsOf(const std::vector<BufferEntry>& entries) {
    std::vector<std::string> out;
    for (const auto& e : entries) {
        out.push_back(e.record.payload);
    }
    return out;
}

std::vector<SequenceId> idsOf(const std::vector<BufferEntry>& entries) {
    std::vector<SequenceId> out;
    for (const auto& e : entries) {
        out.push_back(e.id);
    }
    return out;
}

std::size_t segmentFiles(const std::filesystem::path& dir) {
    std::size_t n = 0;
    for (const auto& de : std::filesystem::directory_iterator(dir)) {
        if (de.path().filename().string().starts_with("segment-")) {
            ++n;
        }
    }
    return n;
}

} // namespace

class DurableBufferTest : public ::testing::Test {
protected:
    static constexpr std::size_t memoryCapacity = 100;
    static constexpr uint64_t capacityBytes = 100ULL * 1024 * 1024;
    TempDir tmp;

    void fill(DurableBuffer& buffer, int from, int to) {
        for (const auto& p : numbered("r", from, to)) {
            buffer.enqueue(makeRecord(p));
        }
    }
};

TEST_F(DurableBufferTest, EmptyBufferDrainsNothing) {
    DurableBuffer buffer {tmp.path(), memoryCapacity, capacityBytes};
    EXPECT_TRUE(buffer.drain(10).empty());
    EXPECT_EQ(buffer.count(), 0U);
    EXPECT_FALSE(buffer.hasDiskBacklog());
}

TEST_F(DurableBufferTest, DrainIsFifoAndDoesNotRemove) {
    DurableBuffer buffer {tmp.path(), memoryCapacity, capacityBytes};
    fill(buffer, 0, 5);
    const auto first = buffer.drain(3);
    EXPECT_EQ(payloadsOf(first), numbered("r", 0, 3));
    EXPECT_EQ(first.front().tier, StorageTier::Memory);
    EXPECT_EQ(payloadsOf(buffer.drain(3)), numbered("r", 0, 3));
    EXPECT_EQ(buffer.count(), 5U);
}

TEST_F(DurableBufferTest, AcknowledgeRemovesOnlyGivenIds) {
    DurableBuffer buffer {tmp.path(), memoryCapacity, capacityBytes};
    fill(buffer, 0, 5);
    const auto batch = buffer.drain(2);
    buffer.acknowledge(idsOf(batch));
    EXPECT_EQ(buffer.count(), 3U);
    EXPECT_EQ(payloadsOf(buffer.drain(10)), numbered("r", 2, 5));
    buffer.acknowledge({9999});
    EXPECT_EQ(buffer.count(), 3U);
}

TEST_F(DurableBufferTest, SequenceIdsIncrease) {
    DurableBuffer buffer {tmp.path(), 4, capacityBytes};
    fill(buffer, 0, 10);
    const auto ids = idsOf(buffer.drain(10));
    ASSERT_EQ(ids.size(), 10U);
    for (std::size_t i = 1; i < ids.size(); ++i) {
        EXPECT_LT(ids[i - 1], ids[i]);
    }
}

TEST_F(DurableBufferTest, FullMemoryTierFlushesToSegment) {
    DurableBuffer buffer {tmp.path(), 10, capacityBytes};
    fill(buffer, 0, 10);
    buffer.sync();
    const auto s = buffer.stats();
    EXPECT_EQ(s.memoryCount, 0U);
    EXPECT_EQ(s.diskCount, 10U);
    EXPECT_EQ(s.diskFileCount, 1U);
    EXPECT_EQ(segmentFiles(tmp.path()), 1U);
    EXPECT_TRUE(buffer.hasDiskBacklog());
    const auto drained = buffer.drain(10);
    EXPECT_EQ(payloadsOf(drained), numbered("r", 0, 10));
    EXPECT_EQ(drained.front().tier, StorageTier::Disk);
}

TEST_F(DurableBufferTest, OverflowKeepsEverythingInOrder) {
    DurableBuffer buffer {tmp.path(), memoryCapacity, capacityBytes};
    fill(buffer, 0, 250);
    buffer.sync();
    const auto s = buffer.stats();
    EXPECT_EQ(s.diskFileCount, 2U);
    EXPECT_EQ(s.diskCount, 200U);
    EXPECT_EQ(s.memoryCount, 50U);
    EXPECT_EQ(buffer.count(), 250U);
    EXPECT_EQ(payloadsOf(buffer.drain(250)), numbered("r", 0, 250));
}

TEST_F(DurableBufferTest, DrainSpansSegmentsThenMemory) {
    DurableBuffer buffer {tmp.path(), 10, capacityBytes};
    fill(buffer, 0, 25);
    EXPECT_EQ(payloadsOf(buffer.drain(15)), numbered("r", 0, 15));
    EXPECT_EQ(payloadsOf(buffer.drain(100)), numbered("r", 0, 25));
}

TEST_F(DurableBufferTest, FullyAcknowledgedSegmentIsDeleted) {
    DurableBuffer buffer {tmp.path(), 10, capacityBytes};
    fill(buffer, 0, 15);
    buffer.sync();
    buffer.acknowledge(idsOf(buffer.drain(10)));
    EXPECT_EQ(segmentFiles(tmp.path()), 0U);
    EXPECT_EQ(buffer.stats().diskCount, 0U);
    EXPECT_EQ(payloadsOf(buffer.drain(100)), numbered("r", 10, 15));
}

TEST_F(DurableBufferTest, RecoversFlushedRecordsAfterRestart) {
    {
        DurableBuffer buffer {tmp.path(), 10, capacityBytes};
        fill(buffer, 0, 30);
    }
    DurableBuffer restarted {tmp.path(), 10, capacityBytes};
    EXPECT_EQ(restarted.count(), 30U);
    EXPECT_TRUE(restarted.hasDiskBacklog());
    const auto drained = restarted.drain(100);
    EXPECT_EQ(payloadsOf(drained), numbered("r", 0, 30));
    restarted.enqueue(makeRecord("after"));
    const auto all = restarted.drain(100);
    ASSERT_EQ(all.size(), 31U);
    EXPECT_EQ(all.back().record.payload, "after");
    EXPECT_GT(all.back().id, drained.back().id);
}

TEST_F(DurableBufferTest, UnflushedMemoryIsLostWithoutFlush) {
    {
        DurableBuffer buffer {tmp.path(), 10, capacityBytes};
        fill(buffer, 0, 15);
    }
    DurableBuffer restarted {tmp.path(), 10, capacityBytes};
    EXPECT_EQ(restarted.count(), 10U);
}

TEST_F(DurableBufferTest, FlushToDiskSurvivesRestart) {
    {
        DurableBuffer buffer {tmp.path(), 10, capacityBytes};
        fill(buffer, 0, 15);
        buffer.flushToDisk();
        EXPECT_EQ(buffer.stats().memoryCount, 0U);
    }
    DurableBuffer restarted {tmp.path(), 10, capacityBytes};
    EXPECT_EQ(payloadsOf(restarted.drain(100)), numbered("r", 0, 15));
}

TEST_F(DurableBufferTest, PartialAcknowledgeIsNotReplayedAfterRestart) {
    {
        DurableBuffer buffer {tmp.path(), 10, capacityBytes};
        fill(buffer, 0, 10);
        buffer.acknowledge(idsOf(buffer.drain(4)));
        EXPECT_EQ(buffer.count(), 6U);
    }
    DurableBuffer restarted {tmp.path(), 10, capacityBytes};
    EXPECT_EQ(payloadsOf(restarted.drain(100)), numbered("r", 4, 10));
}

TEST_F(DurableBufferTest, KeepsCorrelationIdAndTimestamp) {
    {
        DurableBuffer buffer {tmp.path(), 1, capacityBytes};
        buffer.enqueue(spool::TelemetryRecord {std::string{"\x01\x02\x00", 3}, "corr-1", 1234});
    }
    DurableBuffer restarted {tmp.path(), 1, capacityBytes};
    const auto drained = restarted.drain(1);
    ASSERT_EQ(drained.size(), 1U);
    EXPECT_EQ(drained[0].record, (spool::TelemetryRecord {std::string{"\x01\x02\x00", 3}, "corr-1", 1234}));
}

TEST_F(DurableBufferTest, SegmentStoresPayloadAsPaddedBase64) {
    DurableBuffer buffer {tmp.path(), 1, capacityBytes};
    buffer.enqueue(makeRecord("fo"));
    buffer.sync();
    const auto text = spool::readFile(tmp / "segment-00000000000000000001.json");
    EXPECT_NE(text.find("\"Zm8=\""), std::string::npos);
}

TEST_F(DurableBufferTest, UnreadableSegmentIsDiscardedOnRecovery) {
    {
        DurableBuffer buffer {tmp.path(), 10, capacityBytes};
        fill(buffer, 0, 20);
    }
    spool::writeFileAtomically(tmp / "segment-00000000000000000001.json", "not json");
    spool::writeFileAtomically(tmp / ".segment-00000000000000000099.json.tmp-abcdefgh", "[]");
    DurableBuffer restarted {tmp.path(), 10, capacityBytes};
    EXPECT_EQ(payloadsOf(restarted.drain(100)), numbered("r", 10, 20));
    EXPECT_FALSE(std::filesystem::exists(tmp / "segment-00000000000000000001.json"));
    EXPECT_FALSE(std::filesystem::exists(tmp / ".segment-00000000000000000099.json.tmp-abcdefgh"));
}

TEST_F(DurableBufferTest, EvictsOldestWhenOverCapacity) {
    constexpr uint64_t smallCapacity = 3000;
    DurableBuffer buffer {tmp.path(), 10, smallCapacity};
    fill(buffer, 0, 100);
    const auto s = buffer.stats();
    EXPECT_LE(buffer.sizeBytes(), smallCapacity);
    EXPECT_GT(s.evicted, 0U);
    EXPECT_EQ(s.evicted + buffer.count(), 100U);
    const auto remaining = payloadsOf(buffer.drain(100));
    ASSERT_FALSE(remaining.empty());
    EXPECT_NE(remaining.front(), "r0");
    EXPECT_EQ(remaining.back(), "r99");
    EXPECT_EQ(remaining, numbered("r", static_cast<int>(100 - remaining.size()), 100));
}

TEST_F(DurableBufferTest, ConcurrentProducersLoseNothing) {
    DurableBuffer buffer {tmp.path(), 16, capacityBytes};
    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&buffer, t] {
            for (const auto& p : numbered("t" + std::to_string(t) + "-", 0, 50)) {
                buffer.enqueue(makeRecord(p));
            }
        });
    }
    for (auto& p : producers) {
        p.join();
    }
    EXPECT_EQ(buffer.count(), 200U);
    const auto ids = idsOf(buffer.drain(200));
    ASSERT_EQ(ids.size(), 200U);
    for (std::size_t i = 1; i < ids.size(); ++i) {
        EXPECT_LT(ids[i - 1], ids[i]);
    }
}

TEST_F(DurableBufferTest, SealedTierIsServedBeforeItReachesDisk) {
    const auto file = tmp / "blocked";
    spool::writeFileAtomically(file, "x");
    DurableBuffer buffer {file, 4, capacityBytes};
    fill(buffer, 0, 6);
    EXPECT_EQ(buffer.stats().memoryCount, 6U);
    EXPECT_EQ(payloadsOf(buffer.drain(100)), numbered("r", 0, 6));
    buffer.acknowledge(idsOf(buffer.drain(2)));
    EXPECT_EQ(payloadsOf(buffer.drain(100)), numbered("r", 2, 6));
}

TEST_F(DurableBufferTest, FailedWriteKeepsRecordsAndRetries) {
    const auto dir = tmp / "later";
    spool::writeFileAtomically(dir, "x");
    DurableBuffer buffer {dir, 5, capacityBytes};
    fill(buffer, 0, 5);
    buffer.sync();
    auto s = buffer.stats();
    EXPECT_EQ(s.dropped, 0U);
    EXPECT_FALSE(s.lastError.empty());
    EXPECT_EQ(s.memoryCount, 5U);
    EXPECT_EQ(s.diskCount, 0U);
    EXPECT_EQ(buffer.count(), 5U);

    std::filesystem::remove(dir);
    std::filesystem::create_directories(dir);
    buffer.sync();
    s = buffer.stats();
    EXPECT_EQ(s.memoryCount, 0U);
    EXPECT_EQ(s.diskCount, 5U);
    EXPECT_EQ(segmentFiles(dir), 1U);
    EXPECT_EQ(payloadsOf(buffer.drain(100)), numbered("r", 0, 5));
}

TEST_F(DurableBufferTest, FailingDiskIsBoundedByEviction) {
    const auto file = tmp / "blocked";
    spool::writeFileAtomically(file, "x");
    constexpr uint64_t smallCapacity = 3000;
    DurableBuffer buffer {file, 10, smallCapacity};
    fill(buffer, 0, 100);
    buffer.sync();
    const auto s = buffer.stats();
    EXPECT_LE(buffer.sizeBytes(), smallCapacity);
    EXPECT_EQ(s.dropped, 0U);
    EXPECT_EQ(s.evicted + buffer.count(), 100U);
    EXPECT_EQ(payloadsOf(buffer.drain(100)).back(), "r99");
}

TEST_F(DurableBufferTest, EnqueueDoesNotWaitForSegmentIo) {
    const std::string big(100 * 1024, 'p');
    DurableBuffer buffer {tmp.path(), memoryCapacity, capacityBytes};
    for (std::size_t i = 0; i < memoryCapacity; ++i) {
        buffer.enqueue(makeRecord(big));
    }
    buffer.sync();
    ASSERT_EQ(buffer.stats().diskCount, memoryCapacity);

    std::atomic<bool> done {false};
    std::atomic<int> rounds {0};
    std::thread reader([&] {
        while (!done) {
            // Each round parses the segment and rewrites it without its head.
            const auto batch = buffer.drain(memoryCapacity);
            if (batch.size() > 1 && batch.front().tier == StorageTier::Disk) {
                buffer.acknowledge({batch.front().id});
            }
            ++rounds;
        }
    });
    while (rounds == 0) {
        std::this_thread::yield();
    }

    std::chrono::steady_clock::duration worst {};
    for (int i = 0; i < 20; ++i) {
        const auto start = std::chrono::steady_clock::now();
        buffer.enqueue(makeRecord("small-" + std::to_string(i)));
        worst = std::max(worst, std::chrono::steady_clock::now() - start);
        std::this_thread::sleep_for(std::chrono::milliseconds{2});
    }
    done = true;
    reader.join();
    EXPECT_LT(worst, std::chrono::milliseconds{5});
    EXPECT_GT(buffer.count(), 20U);
}
